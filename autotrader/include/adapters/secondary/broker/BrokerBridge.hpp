#pragma once

#include "ports/output/IBrokerGateway.hpp"
#include "ports/output/IBrokerSession.hpp"
#include "settings/BrokerSettings.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace autotrader::adapters::secondary {

/**
 * @brief Мост к брокеру: однопоточная сессия как потокобезопасный сервис
 *
 * Единственный владелец IBrokerSession. Все вызовы сессии выполняются
 * в одном потоке io_context; вызывающие ждут результат через future
 * с таймаутом. По таймауту вызывающий получает BrokerTimeoutError,
 * а сама операция доводится до конца в потоке моста.
 *
 * Менеджер соединения раз в секунду проверяет сессию и переподключается
 * не чаще, чем раз в reconnect cooldown.
 *
 * Thread-safe: да
 */
class BrokerBridge : public ports::output::IBrokerGateway {
public:
    BrokerBridge(std::shared_ptr<ports::output::IBrokerSession> session,
                 std::shared_ptr<settings::BrokerSettings> settings)
        : session_(std::move(session))
        , settings_(std::move(settings))
        , timer_(io_)
    {
        std::cout << "[BrokerBridge] Created for " << settings_->getHost()
                  << ":" << settings_->getPort() << std::endl;
    }

    ~BrokerBridge() override {
        stop();
    }

    BrokerBridge(const BrokerBridge&) = delete;
    BrokerBridge& operator=(const BrokerBridge&) = delete;

    /**
     * @brief Запустить поток моста и дождаться первой попытки подключения
     *
     * Ждёт не дольше readinessTimeout; возвращается независимо от исхода.
     * После stop() мост можно запустить снова.
     */
    void start(std::chrono::milliseconds readinessTimeout = std::chrono::seconds(5)) {
        if (running_.exchange(true)) {
            return;
        }
        std::cout << "[BrokerBridge] Starting..." << std::endl;

        // Повторный запуск после stop(): поток моста уже завершён
        io_.restart();
        ready_ = false;
        readyPromise_ = std::promise<void>();
        lastAttempt_.reset();

        auto readyFuture = readyPromise_.get_future();
        workGuard_.emplace(boost::asio::make_work_guard(io_));
        ioThread_ = std::thread([this]() {
            io_.run();
        });

        boost::asio::post(io_, [this]() {
            ensureConnected();
            markReady();
            scheduleConnectionCheck();
        });

        if (readyFuture.wait_for(readinessTimeout) != std::future_status::ready) {
            std::cerr << "[BrokerBridge] Not ready after " << readinessTimeout.count()
                      << "ms, continuing" << std::endl;
        }
        std::cout << "[BrokerBridge] Started, state: "
                  << domain::toString(connectionState()) << std::endl;
    }

    /**
     * @brief Отключить сессию в её потоке и остановить мост
     */
    void stop() {
        if (!running_.exchange(false)) {
            return;
        }
        std::cout << "[BrokerBridge] Stopping..." << std::endl;

        boost::asio::post(io_, [this]() {
            timer_.cancel();
            try {
                session_->disconnect();
            } catch (const std::exception& e) {
                std::cerr << "[BrokerBridge] Disconnect error: " << e.what() << std::endl;
            }
            state_ = domain::ConnectionState::Disconnected;
        });
        workGuard_.reset();

        if (ioThread_.joinable()) {
            ioThread_.join();
        }
        std::cout << "[BrokerBridge] Stopped" << std::endl;
    }

    bool isRunning() const {
        return running_.load();
    }

    /**
     * @brief Первая попытка подключения завершилась
     */
    bool isReady() const {
        return ready_.load();
    }

    bool isConnected() const override {
        return state_.load() == domain::ConnectionState::Connected;
    }

    domain::ConnectionState connectionState() const override {
        return state_.load();
    }

    std::string account() const {
        std::lock_guard<std::mutex> lock(accountMutex_);
        return account_;
    }

    uint64_t connectAttempts() const {
        return connectAttempts_.load();
    }

    // ============================================
    // АККАУНТ
    // ============================================

    std::vector<domain::AccountSummaryItem> getAccountSummary(std::chrono::milliseconds timeout) override {
        return call([this]() {
            static const std::set<std::string> kTags = {
                "TotalCashValue", "CashBalance", "NetLiquidation", "GrossPositionValue",
                "AvailableFunds", "UnrealizedPnL", "RealizedPnL"};

            std::vector<domain::AccountSummaryItem> items;
            std::set<std::pair<std::string, std::string>> seen;
            for (const auto& v : session_->accountValues()) {
                if (kTags.count(v.tag) == 0) continue;
                auto value = parseNumber(v.value);
                if (!value) continue;
                if (!seen.insert({v.tag, v.currency}).second) continue;
                items.push_back({v.tag, *value, v.currency});
            }
            return items;
        }, timeout, "getAccountSummary");
    }

    /**
     * @brief Позиции: портфель с ценами, иначе сырые позиции + снимки котировок
     */
    std::vector<domain::Position> getPositions(std::chrono::milliseconds timeout) override {
        return call([this]() {
            std::vector<domain::Position> rows;
            for (const auto& p : session_->portfolio()) {
                if (p.quantity != 0.0) {
                    rows.push_back(p);
                }
            }
            if (!rows.empty()) {
                return rows;
            }

            for (auto p : session_->positions()) {
                if (p.quantity == 0.0) continue;
                std::optional<domain::MarketSnapshot> snap;
                try {
                    snap = session_->snapshot(p.contract);
                } catch (const std::exception& e) {
                    std::cerr << "[BrokerBridge] Snapshot failed for " << p.contract.symbol
                              << ": " << e.what() << std::endl;
                }
                if (snap) {
                    if (auto price = snap->price()) {
                        p.marketPrice = *price;
                        p.marketValue = *price * p.quantity;
                        p.unrealisedPnl = (*price - p.avgCost) * p.quantity;
                    }
                }
                rows.push_back(p);
            }
            return rows;
        }, timeout, "getPositions");
    }

    /**
     * @brief Рабочие ордера: кэш с TTL и один запрос на всех ожидающих
     *
     * Неудачное обновление в кэш не попадает. Обновление, начатое до
     * placeOrder/cancelOrder, кэш тоже не заполняет.
     */
    std::vector<domain::OpenOrder> getOpenOrders(std::chrono::milliseconds timeout) override {
        std::shared_future<std::vector<domain::OpenOrder>> flight;
        {
            std::lock_guard<std::mutex> lock(cacheMutex_);
            if (cachedOrders_ &&
                std::chrono::steady_clock::now() - cachedAt_ < settings_->getOpenOrdersTtl()) {
                return *cachedOrders_;
            }
            if (!inFlight_.valid()) {
                if (!isConnected()) {
                    throw domain::BrokerNotConnectedError();
                }
                auto promise = std::make_shared<std::promise<std::vector<domain::OpenOrder>>>();
                inFlight_ = promise->get_future().share();
                uint64_t generation = cacheGeneration_;
                ++openOrderRefreshes_;
                boost::asio::post(io_, [this, promise, generation]() {
                    refreshOpenOrders(promise, generation);
                });
            }
            flight = inFlight_;
        }

        if (flight.wait_for(timeout) != std::future_status::ready) {
            throw domain::BrokerTimeoutError(
                "getOpenOrders timed out after " + std::to_string(timeout.count()) + "ms");
        }
        return flight.get();
    }

    /**
     * @brief Сколько раз ордера реально запрашивались у сессии
     */
    uint64_t openOrderRefreshes() const {
        return openOrderRefreshes_.load();
    }

    void invalidateOpenOrders() {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        cachedOrders_.reset();
        ++cacheGeneration_;
    }

    // ============================================
    // РЫНОЧНЫЕ ДАННЫЕ
    // ============================================

    std::optional<domain::Contract> qualifyContract(const domain::Contract& contract) override {
        return call([this, contract]() {
            return session_->qualify(contract);
        }, requestTimeout(), "qualifyContract");
    }

    std::vector<domain::Bar> getHistoricalBars(const domain::Contract& contract,
                                               const std::string& duration,
                                               const std::string& barSize,
                                               bool useRth) override {
        return call([this, contract, duration, barSize, useRth]() {
            return session_->historicalBars(contract, duration, barSize, useRth);
        }, std::chrono::duration_cast<std::chrono::milliseconds>(settings_->getHistoricalTimeout()),
           "getHistoricalBars");
    }

    std::optional<domain::MarketSnapshot> getMarketSnapshot(const domain::Contract& contract) override {
        return call([this, contract]() {
            return session_->snapshot(contract);
        }, requestTimeout(), "getMarketSnapshot");
    }

    std::vector<std::string> getHeadlines(const domain::Contract& contract, int limit) override {
        return call([this, contract, limit]() {
            return session_->headlines(contract, limit);
        }, requestTimeout(), "getHeadlines");
    }

    std::vector<domain::Contract> scan(const domain::ScannerQuery& query) override {
        return call([this, query]() {
            return session_->scan(query);
        }, requestTimeout(), "scan");
    }

    double getMinTick(const domain::Contract& contract) override {
        return call([this, contract]() {
            return session_->minTick(contract);
        }, requestTimeout(), "getMinTick");
    }

    // ============================================
    // ОРДЕРА
    // ============================================

    domain::PlacedOrder placeOrder(const domain::OrderRequest& request) override {
        auto placed = call([this, request]() {
            return session_->placeOrder(request);
        }, requestTimeout(), "placeOrder");
        invalidateOpenOrders();
        return placed;
    }

    void cancelOrder(int orderId) override {
        call([this, orderId]() {
            session_->cancelOrder(orderId);
        }, requestTimeout(), "cancelOrder");
        invalidateOpenOrders();
    }

private:
    std::shared_ptr<ports::output::IBrokerSession> session_;
    std::shared_ptr<settings::BrokerSettings> settings_;

    boost::asio::io_context io_;
    boost::asio::steady_timer timer_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> workGuard_;
    std::thread ioThread_;

    std::atomic<bool> running_{false};
    std::atomic<bool> ready_{false};
    std::atomic<domain::ConnectionState> state_{domain::ConnectionState::Disconnected};
    std::atomic<uint64_t> connectAttempts_{0};
    std::promise<void> readyPromise_;

    // Только поток моста
    std::optional<std::chrono::steady_clock::time_point> lastAttempt_;

    mutable std::mutex accountMutex_;
    std::string account_;

    std::mutex cacheMutex_;
    std::optional<std::vector<domain::OpenOrder>> cachedOrders_;
    std::chrono::steady_clock::time_point cachedAt_;
    std::shared_future<std::vector<domain::OpenOrder>> inFlight_;
    uint64_t cacheGeneration_ = 0;
    std::atomic<uint64_t> openOrderRefreshes_{0};

    std::chrono::milliseconds requestTimeout() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(settings_->getRequestTimeout());
    }

    /**
     * @brief Выполнить fn в потоке моста и дождаться результата
     *
     * BrokerError пробрасывается как есть, прочие std::exception
     * оборачиваются в BrokerError с именем операции.
     */
    template <typename F>
    auto call(F fn, std::chrono::milliseconds timeout, const char* name) -> decltype(fn()) {
        using Result = decltype(fn());

        if (!running_.load() || !isConnected()) {
            throw domain::BrokerNotConnectedError();
        }

        auto promise = std::make_shared<std::promise<Result>>();
        auto future = promise->get_future();

        boost::asio::post(io_, [this, promise, fn = std::move(fn), name]() mutable {
            try {
                requireSessionConnected();
                if constexpr (std::is_void_v<Result>) {
                    fn();
                    promise->set_value();
                } else {
                    promise->set_value(fn());
                }
            } catch (const domain::BrokerError& e) {
                std::cerr << "[BrokerBridge] " << name << ": " << e.what() << std::endl;
                promise->set_exception(std::current_exception());
            } catch (const std::exception& e) {
                std::cerr << "[BrokerBridge] " << name << " failed: " << e.what() << std::endl;
                noteConnectionLoss();
                promise->set_exception(std::make_exception_ptr(
                    domain::BrokerError(std::string(name) + " failed: " + e.what())));
            }
        });

        if (future.wait_for(timeout) != std::future_status::ready) {
            throw domain::BrokerTimeoutError(
                std::string(name) + " timed out after " + std::to_string(timeout.count()) + "ms");
        }
        return future.get();
    }

    void refreshOpenOrders(std::shared_ptr<std::promise<std::vector<domain::OpenOrder>>> promise,
                           uint64_t generation) {
        try {
            requireSessionConnected();
            session_->requestAllOpenOrders();
            auto orders = session_->openOrders();
            {
                std::lock_guard<std::mutex> lock(cacheMutex_);
                if (generation == cacheGeneration_) {
                    cachedOrders_ = orders;
                    cachedAt_ = std::chrono::steady_clock::now();
                }
                inFlight_ = {};
            }
            promise->set_value(std::move(orders));
        } catch (const domain::BrokerError& e) {
            std::cerr << "[BrokerBridge] getOpenOrders: " << e.what() << std::endl;
            clearInFlight();
            promise->set_exception(std::current_exception());
        } catch (const std::exception& e) {
            std::cerr << "[BrokerBridge] getOpenOrders failed: " << e.what() << std::endl;
            noteConnectionLoss();
            clearInFlight();
            promise->set_exception(std::make_exception_ptr(
                domain::BrokerError(std::string("getOpenOrders failed: ") + e.what())));
        }
    }

    void clearInFlight() {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        inFlight_ = {};
    }

    void requireSessionConnected() {
        if (!session_->isConnected()) {
            noteConnectionLoss();
            throw domain::BrokerNotConnectedError();
        }
    }

    void noteConnectionLoss() {
        if (!session_->isConnected() &&
            state_.exchange(domain::ConnectionState::Disconnected) == domain::ConnectionState::Connected) {
            std::cerr << "[BrokerBridge] Connection lost" << std::endl;
        }
    }

    void markReady() {
        if (!ready_.exchange(true)) {
            readyPromise_.set_value();
        }
    }

    // ============================================
    // МЕНЕДЖЕР СОЕДИНЕНИЯ (поток моста)
    // ============================================

    void scheduleConnectionCheck() {
        if (!running_.load()) {
            return;
        }
        timer_.expires_after(std::chrono::seconds(1));
        timer_.async_wait([this](const boost::system::error_code& ec) {
            if (ec || !running_.load()) {
                return;
            }
            ensureConnected();
            scheduleConnectionCheck();
        });
    }

    void ensureConnected() {
        if (session_->isConnected()) {
            state_ = domain::ConnectionState::Connected;
            return;
        }
        noteConnectionLoss();
        state_ = domain::ConnectionState::Disconnected;

        auto now = std::chrono::steady_clock::now();
        if (lastAttempt_ && now - *lastAttempt_ < settings_->getReconnectCooldown()) {
            return;
        }
        lastAttempt_ = now;
        ++connectAttempts_;
        state_ = domain::ConnectionState::Connecting;

        try {
            session_->connect(settings_->getHost(), settings_->getPort(),
                              settings_->getClientId(), settings_->getConnectTimeout());
            session_->setMarketDataType(3);

            auto accounts = session_->managedAccounts();
            std::string first = accounts.empty() ? std::string() : accounts.front();
            {
                std::lock_guard<std::mutex> lock(accountMutex_);
                account_ = first;
            }
            state_ = domain::ConnectionState::Connected;
            std::cout << "[BrokerBridge] Connected, account: "
                      << (first.empty() ? "<none>" : first) << std::endl;
        } catch (const std::exception& e) {
            state_ = domain::ConnectionState::Disconnected;
            std::cerr << "[BrokerBridge] Connect failed: " << e.what() << std::endl;
            return;
        }

        std::string acct = account();
        if (!acct.empty()) {
            try {
                session_->subscribeAccountUpdates(acct);
            } catch (const std::exception& e) {
                std::cerr << "[BrokerBridge] WARNING: account updates subscription failed: "
                          << e.what() << std::endl;
            }
        }
    }

    static std::optional<double> parseNumber(const std::string& value) {
        try {
            size_t pos = 0;
            double d = std::stod(value, &pos);
            if (pos != value.size()) {
                return std::nullopt;
            }
            return d;
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }
};

} // namespace autotrader::adapters::secondary
