#pragma once

#include "PaperBrokerSession.hpp"
#include "PriceSimulator.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

namespace autotrader::adapters::secondary {

/**
 * @brief Фоновый поток бумажного рынка
 *
 * Периодически:
 * - вызывает tick() для всех инструментов симулятора
 * - проверяет срабатывание рабочих ордеров сессии (стопы, лимиты, OCA)
 *
 * @example
 * ```cpp
 * auto simulator = std::make_shared<PriceSimulator>();
 * auto session = std::make_shared<PaperBrokerSession>(simulator);
 *
 * PaperMarketTicker ticker(simulator, session);
 * ticker.start(std::chrono::milliseconds(1000));
 * // ...
 * ticker.stop();
 * ```
 *
 * Thread-safe: да
 */
class PaperMarketTicker {
public:
    PaperMarketTicker(std::shared_ptr<PriceSimulator> simulator,
                      std::shared_ptr<PaperBrokerSession> session = nullptr)
        : simulator_(std::move(simulator))
        , session_(std::move(session))
        , running_(false)
        , tickCount_(0)
        , fillCount_(0)
    {}

    ~PaperMarketTicker() {
        stop();
    }

    PaperMarketTicker(const PaperMarketTicker&) = delete;
    PaperMarketTicker& operator=(const PaperMarketTicker&) = delete;

    void start(std::chrono::milliseconds interval = std::chrono::milliseconds{1000}) {
        if (running_.exchange(true)) {
            return;
        }
        tickInterval_ = interval;
        workerThread_ = std::thread([this]() { runLoop(); });
        std::cout << "[PaperMarketTicker] Started, interval " << interval.count() << "ms" << std::endl;
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }
        if (workerThread_.joinable()) {
            workerThread_.join();
        }
        std::cout << "[PaperMarketTicker] Stopped after " << tickCount_.load() << " ticks" << std::endl;
    }

    bool isRunning() const {
        return running_.load();
    }

    uint64_t tickCount() const {
        return tickCount_.load();
    }

    /**
     * @brief Сколько ордеров исполнилось по срабатыванию за всё время
     */
    uint64_t fillCount() const {
        return fillCount_.load();
    }

    /**
     * @brief Один тик вручную (для тестов)
     */
    void manualTick() {
        doTick();
    }

private:
    std::shared_ptr<PriceSimulator> simulator_;
    std::shared_ptr<PaperBrokerSession> session_;

    std::atomic<bool> running_;
    std::thread workerThread_;
    std::atomic<std::chrono::milliseconds> tickInterval_{std::chrono::milliseconds{1000}};
    std::atomic<uint64_t> tickCount_;
    std::atomic<uint64_t> fillCount_;

    void runLoop() {
        while (running_.load()) {
            auto start = std::chrono::steady_clock::now();

            doTick();

            auto elapsed = std::chrono::steady_clock::now() - start;
            auto remaining = tickInterval_.load() -
                std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);

            // Спим короткими шагами, чтобы stop() не ждал целый интервал
            auto deadline = std::chrono::steady_clock::now() + remaining;
            while (running_.load() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
        }
    }

    void doTick() {
        for (const auto& symbol : simulator_->symbols()) {
            simulator_->tick(symbol);
        }
        if (session_) {
            fillCount_ += static_cast<uint64_t>(session_->processOrders());
        }
        ++tickCount_;
    }
};

} // namespace autotrader::adapters::secondary
