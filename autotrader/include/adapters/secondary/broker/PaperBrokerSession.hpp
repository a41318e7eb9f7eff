#pragma once

#include "ports/output/IBrokerSession.hpp"
#include "adapters/secondary/broker/PriceSimulator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace autotrader::adapters::secondary {

/**
 * @brief Бумажная сессия брокера
 *
 * Реализует IBrokerSession поверх PriceSimulator:
 * - MKT исполняется сразу по ask (BUY) / bid (SELL)
 * - дочерние ноги брекета активны, когда родитель исполнен
 * - STP SELL срабатывает при bid <= aux, LMT SELL при bid >= lmt
 *   (для BUY зеркально по ask)
 * - исполнение ноги отменяет остальные ордера её OCA-группы
 * - денежный баланс ведётся по валютам (USD, GBP)
 *
 * Ордера по тикам обрабатывает processOrders() (см. PaperMarketTicker).
 * Сам класс синхронизирован мьютексом, но по контракту IBrokerSession
 * вызывается из одного потока моста.
 */
class PaperBrokerSession : public ports::output::IBrokerSession {
public:
    struct Instrument {
        domain::Contract contract;
        double basePrice = 0.0;
        int64_t avgVolume = 0;
    };

    explicit PaperBrokerSession(std::shared_ptr<PriceSimulator> simulator,
                                std::string account = "DU1000001")
        : simulator_(std::move(simulator))
        , account_(std::move(account))
    {
        cash_["USD"] = 100000.0;
        cash_["GBP"] = 50000.0;
        for (const auto& instrument : defaultUniverse()) {
            addInstrument(instrument);
        }
        std::cout << "[PaperBrokerSession] Created with " << universe_.size()
                  << " instruments, account " << account_ << std::endl;
    }

    void addInstrument(const Instrument& instrument) {
        std::lock_guard<std::mutex> lock(mutex_);
        Instrument copy = instrument;
        copy.contract.conId = nextConId_++;
        universe_[key(copy.contract.symbol, copy.contract.currency)] = copy;
        simulator_->initInstrument(copy.contract.symbol, copy.basePrice, 0.001, 0.002, copy.avgVolume);
    }

    void setCash(const std::string& currency, double amount) {
        std::lock_guard<std::mutex> lock(mutex_);
        cash_[currency] = amount;
    }

    /**
     * @brief Следующие n попыток connect() завершатся ошибкой
     */
    void failNextConnects(int n) {
        std::lock_guard<std::mutex> lock(mutex_);
        failConnects_ = n;
    }

    std::shared_ptr<PriceSimulator> simulator() const { return simulator_; }

    int marketDataType() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return marketDataType_;
    }

    // ============================================
    // СОЕДИНЕНИЕ
    // ============================================

    void connect(const std::string& host, int port, int clientId,
                 std::chrono::seconds /*timeout*/) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failConnects_ > 0) {
            --failConnects_;
            throw std::runtime_error("Connection refused: " + host + ":" + std::to_string(port));
        }
        connected_ = true;
        std::cout << "[PaperBrokerSession] Connected (" << host << ":" << port
                  << ", clientId=" << clientId << ")" << std::endl;
    }

    void disconnect() override {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = false;
        subscribed_ = false;
    }

    bool isConnected() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }

    void setMarketDataType(int type) override {
        std::lock_guard<std::mutex> lock(mutex_);
        marketDataType_ = type;
    }

    std::vector<std::string> managedAccounts() override {
        return {account_};
    }

    void subscribeAccountUpdates(const std::string& account) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (account != account_) {
            throw std::runtime_error("Unknown account: " + account);
        }
        subscribed_ = true;
    }

    // ============================================
    // АККАУНТ
    // ============================================

    std::vector<domain::AccountValue> accountValues() override {
        std::lock_guard<std::mutex> lock(mutex_);
        requireConnected();

        std::vector<domain::AccountValue> out;
        double baseNetLiq = 0.0;
        for (const auto& [currency, cash] : cash_) {
            double gross = 0.0;
            double unrealised = 0.0;
            double realised = 0.0;
            for (const auto& [sym, pos] : positions_) {
                if (pos.contract.currency != currency) continue;
                double price = simulator_->getPrice(pos.contract.symbol);
                gross += std::fabs(pos.quantity * price);
                unrealised += (price - pos.avgCost) * pos.quantity;
                realised += pos.realised;
            }
            double netLiq = cash + positionValue(currency);
            baseNetLiq += netLiq * toBase(currency);

            out.push_back({account_, "TotalCashValue", money(cash), currency});
            out.push_back({account_, "CashBalance", money(cash), currency});
            out.push_back({account_, "AvailableFunds", money(std::max(0.0, cash)), currency});
            out.push_back({account_, "NetLiquidation", money(netLiq), currency});
            out.push_back({account_, "GrossPositionValue", money(gross), currency});
            out.push_back({account_, "UnrealizedPnL", money(unrealised), currency});
            out.push_back({account_, "RealizedPnL", money(realised), currency});
        }
        out.push_back({account_, "NetLiquidation", money(baseNetLiq), "BASE"});
        out.push_back({account_, "AccountType", "INDIVIDUAL", ""});
        return out;
    }

    std::vector<domain::Position> portfolio() override {
        std::lock_guard<std::mutex> lock(mutex_);
        requireConnected();
        if (!subscribed_) {
            return {};
        }

        std::vector<domain::Position> out;
        for (const auto& [sym, pos] : positions_) {
            if (pos.quantity == 0.0) continue;
            double price = simulator_->getPrice(pos.contract.symbol);
            domain::Position p = toPosition(pos);
            p.marketPrice = price;
            p.marketValue = price * pos.quantity;
            p.unrealisedPnl = (price - pos.avgCost) * pos.quantity;
            p.realisedPnl = pos.realised;
            out.push_back(p);
        }
        return out;
    }

    std::vector<domain::Position> positions() override {
        std::lock_guard<std::mutex> lock(mutex_);
        requireConnected();
        std::vector<domain::Position> out;
        for (const auto& [sym, pos] : positions_) {
            if (pos.quantity != 0.0) {
                out.push_back(toPosition(pos));
            }
        }
        return out;
    }

    void requestAllOpenOrders() override {
        std::lock_guard<std::mutex> lock(mutex_);
        requireConnected();
    }

    std::vector<domain::OpenOrder> openOrders() override {
        std::lock_guard<std::mutex> lock(mutex_);
        requireConnected();
        std::vector<domain::OpenOrder> out;
        for (const auto& [id, order] : orders_) {
            out.push_back(order);
        }
        return out;
    }

    // ============================================
    // РЫНОЧНЫЕ ДАННЫЕ
    // ============================================

    std::optional<domain::Contract> qualify(const domain::Contract& contract) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requireConnected();
        auto it = universe_.find(key(contract.symbol, contract.currency));
        if (it == universe_.end()) {
            return std::nullopt;
        }
        return it->second.contract;
    }

    /**
     * @param duration "N D" - N торговых дней
     * @param barSize "N mins" | "N min" | "1 hour"
     */
    std::vector<domain::Bar> historicalBars(const domain::Contract& contract,
                                            const std::string& duration,
                                            const std::string& barSize,
                                            bool useRth) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requireConnected();
        }
        int days = std::max(1, leadingInt(duration, 1));
        int minutes = barMinutes(barSize);
        int sessionMinutes = useRth ? 390 : 960;
        size_t count = static_cast<size_t>(days * std::max(1, sessionMinutes / minutes));
        return simulator_->history(contract.symbol, count, minutes);
    }

    std::optional<domain::MarketSnapshot> snapshot(const domain::Contract& contract) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requireConnected();
        }
        auto quote = simulator_->getQuote(contract.symbol);
        if (!quote) {
            return std::nullopt;
        }
        domain::MarketSnapshot s;
        s.last = quote->last;
        s.close = quote->previousClose;
        s.bid = quote->bid;
        s.ask = quote->ask;
        s.volume = static_cast<double>(quote->volume);
        s.avgVolume = static_cast<double>(quote->avgVolume);
        return s;
    }

    std::vector<std::string> headlines(const domain::Contract& /*contract*/, int /*limit*/) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requireConnected();
        return {};
    }

    /**
     * @brief Сканер: фильтр по рынку, цене и объёму; сортировка по коду скана
     */
    std::vector<domain::Contract> scan(const domain::ScannerQuery& query) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requireConnected();

        std::string currency = query.locationCode.find(".US") != std::string::npos ? "USD" : "GBP";

        struct Row {
            domain::Contract contract;
            PriceSimulator::Quote quote;
        };
        std::vector<Row> rows;
        for (const auto& [k, instrument] : universe_) {
            if (instrument.contract.currency != currency) continue;
            auto quote = simulator_->getQuote(instrument.contract.symbol);
            if (!quote) continue;
            if (query.abovePrice && quote->last < *query.abovePrice) continue;
            if (query.belowPrice && quote->last > *query.belowPrice) continue;
            if (query.aboveVolume && static_cast<double>(quote->avgVolume) < *query.aboveVolume) continue;
            rows.push_back({instrument.contract, *quote});
        }

        if (query.scanCode == "TOP_PERC_GAIN" || query.scanCode == "HIGH_VS_13W_HI") {
            std::sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) {
                return a.quote.changePercent() > b.quote.changePercent();
            });
        } else {
            std::sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) {
                return a.quote.avgVolume > b.quote.avgVolume;
            });
        }

        std::vector<domain::Contract> out;
        for (const auto& row : rows) {
            if (static_cast<int>(out.size()) >= query.numberOfRows) break;
            out.push_back(row.contract);
        }
        return out;
    }

    double minTick(const domain::Contract& /*contract*/) override {
        return 0.01;
    }

    // ============================================
    // ОРДЕРА
    // ============================================

    domain::PlacedOrder placeOrder(const domain::OrderRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requireConnected();

        if (request.quantity <= 0.0) {
            throw std::runtime_error("Order quantity must be positive");
        }

        if (request.orderId != 0) {
            auto it = orders_.find(request.orderId);
            if (it == orders_.end()) {
                throw std::runtime_error("Order not found: " + std::to_string(request.orderId));
            }
            auto& order = it->second;
            order.totalQuantity = request.quantity;
            order.remaining = request.quantity - order.filled;
            order.lmtPrice = request.lmtPrice;
            order.auxPrice = request.auxPrice;
            order.ocaGroup = request.ocaGroup;
            order.ocaType = request.ocaType;
            return {order.orderId, order.status};
        }

        if (!simulator_->hasInstrument(request.contract.symbol)) {
            throw std::runtime_error("No security definition for " + request.contract.symbol);
        }

        domain::OpenOrder order;
        order.orderId = nextOrderId_++;
        order.contract = request.contract;
        order.action = request.action;
        order.orderType = request.orderType;
        order.totalQuantity = request.quantity;
        order.remaining = request.quantity;
        order.lmtPrice = request.lmtPrice;
        order.auxPrice = request.auxPrice;
        order.parentId = request.parentId;
        order.ocaGroup = request.ocaGroup;
        order.ocaType = request.ocaType;
        order.submittedAt = domain::Timestamp::now();

        bool parentPending = order.parentId != 0 && orders_.count(order.parentId) > 0;
        if (parentPending) {
            order.status = "PreSubmitted";
            orders_[order.orderId] = order;
            return {order.orderId, order.status};
        }

        if (order.orderType == domain::OrderType::MKT) {
            auto quote = simulator_->getQuote(order.contract.symbol);
            double price = order.action == domain::OrderAction::BUY ? quote->ask : quote->bid;
            fill(order, price);
            return {order.orderId, "Filled"};
        }

        order.status = "Submitted";
        orders_[order.orderId] = order;
        return {order.orderId, order.status};
    }

    void cancelOrder(int orderId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requireConnected();
        auto it = orders_.find(orderId);
        if (it == orders_.end()) {
            throw std::runtime_error("Order not found: " + std::to_string(orderId));
        }
        orders_.erase(it);
        // Дочерние ноги уходят вместе с родителем
        for (auto child = orders_.begin(); child != orders_.end();) {
            if (child->second.parentId == orderId && child->second.status == "PreSubmitted") {
                child = orders_.erase(child);
            } else {
                ++child;
            }
        }
    }

    /**
     * @brief Проверить срабатывание рабочих ордеров по текущим котировкам
     * @return сколько ордеров исполнено
     */
    int processOrders() {
        std::lock_guard<std::mutex> lock(mutex_);
        int filledCount = 0;

        std::vector<int> ids;
        for (const auto& [id, order] : orders_) {
            ids.push_back(id);
        }

        for (int id : ids) {
            auto it = orders_.find(id);
            if (it == orders_.end() || it->second.status != "Submitted") {
                continue;
            }
            auto quote = simulator_->getQuote(it->second.contract.symbol);
            if (!quote) continue;

            auto fillPrice = triggerPrice(it->second, *quote);
            if (!fillPrice) continue;

            domain::OpenOrder order = it->second;
            orders_.erase(it);
            fill(order, *fillPrice);
            ++filledCount;

            cancelOcaSiblings(order);
            activateChildren(order.orderId);
        }
        return filledCount;
    }

    static std::vector<Instrument> defaultUniverse() {
        auto us = [](const std::string& s, double price, int64_t vol, const std::string& cls = "NMS") {
            domain::Contract c(s, "SMART", "USD");
            c.primaryExchange = "NASDAQ";
            c.tradingClass = cls;
            return Instrument{c, price, vol};
        };
        auto uk = [](const std::string& s, double price, int64_t vol) {
            domain::Contract c(s, "LSE", "GBP");
            c.primaryExchange = "LSE";
            c.tradingClass = s;
            return Instrument{c, price, vol};
        };
        return {
            us("AAPL", 190.0, 55000000), us("MSFT", 410.0, 22000000), us("NVDA", 120.0, 300000000),
            us("AMD", 160.0, 45000000), us("TSLA", 240.0, 95000000), us("PLTR", 24.0, 40000000),
            us("SOFI", 8.5, 35000000), us("F", 12.0, 50000000), us("SPY", 520.0, 70000000, "SPY"),
            us("QQQ", 440.0, 40000000, "QQQ"), us("NIO", 5.2, 45000000), us("RIVN", 14.0, 30000000),
            uk("VOD", 1.35, 60000000), uk("BARC", 2.10, 40000000), uk("LLOY", 1.05, 150000000),
            uk("BP", 4.80, 30000000)};
    }

private:
    struct Holding {
        domain::Contract contract;
        double quantity = 0.0;
        double avgCost = 0.0;
        double realised = 0.0;
    };

    void requireConnected() const {
        if (!connected_) {
            throw std::runtime_error("Not connected");
        }
    }

    static std::string key(const std::string& symbol, const std::string& currency) {
        return symbol + "@" + currency;
    }

    static std::string money(double v) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.2f", v);
        return buf;
    }

    static double toBase(const std::string& currency) {
        return currency == "GBP" ? 1.27 : 1.0;
    }

    double positionValue(const std::string& currency) const {
        double value = 0.0;
        for (const auto& [sym, pos] : positions_) {
            if (pos.contract.currency == currency) {
                value += pos.quantity * simulator_->getPrice(pos.contract.symbol);
            }
        }
        return value;
    }

    domain::Position toPosition(const Holding& h) const {
        domain::Position p;
        p.account = account_;
        p.contract = h.contract;
        p.quantity = h.quantity;
        p.avgCost = h.avgCost;
        return p;
    }

    void fill(domain::OpenOrder& order, double price) {
        const std::string& currency = order.contract.currency;
        double qty = order.totalQuantity;
        double signedQty = order.action == domain::OrderAction::BUY ? qty : -qty;

        auto& h = positions_[key(order.contract.symbol, currency)];
        h.contract = order.contract;

        bool sameDirection = h.quantity == 0.0 || (h.quantity > 0.0) == (signedQty > 0.0);
        if (sameDirection) {
            double total = h.quantity + signedQty;
            h.avgCost = (h.avgCost * std::fabs(h.quantity) + price * qty) / std::fabs(total);
            h.quantity = total;
        } else {
            double closing = std::min(std::fabs(h.quantity), qty);
            double direction = h.quantity > 0.0 ? 1.0 : -1.0;
            h.realised += (price - h.avgCost) * closing * direction;
            h.quantity += signedQty;
            if (std::fabs(h.quantity) < 1e-9) {
                h.quantity = 0.0;
                h.avgCost = 0.0;
            } else if ((h.quantity > 0.0) != (direction > 0.0)) {
                h.avgCost = price;
            }
        }

        cash_[currency] -= signedQty * price;
        order.filled = qty;
        order.remaining = 0.0;
        order.status = "Filled";

        std::cout << "[PaperBrokerSession] Filled #" << order.orderId << " "
                  << domain::toString(order.action) << " " << qty << " "
                  << order.contract.symbol << " @ " << price << std::endl;
    }

    static std::optional<double> triggerPrice(const domain::OpenOrder& order,
                                              const PriceSimulator::Quote& quote) {
        bool sell = order.action == domain::OrderAction::SELL;
        if (order.orderType == domain::OrderType::STP && order.auxPrice) {
            if (sell && quote.bid <= *order.auxPrice) return quote.bid;
            if (!sell && quote.ask >= *order.auxPrice) return quote.ask;
        }
        if (order.orderType == domain::OrderType::LMT && order.lmtPrice) {
            if (sell && quote.bid >= *order.lmtPrice) return quote.bid;
            if (!sell && quote.ask <= *order.lmtPrice) return quote.ask;
        }
        if (order.orderType == domain::OrderType::MKT) {
            return sell ? quote.bid : quote.ask;
        }
        return std::nullopt;
    }

    void cancelOcaSiblings(const domain::OpenOrder& filled) {
        if (filled.ocaGroup.empty()) return;
        for (auto it = orders_.begin(); it != orders_.end();) {
            if (it->second.ocaGroup == filled.ocaGroup) {
                std::cout << "[PaperBrokerSession] OCA cancel #" << it->first
                          << " (" << filled.ocaGroup << ")" << std::endl;
                it = orders_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void activateChildren(int parentId) {
        for (auto& [id, order] : orders_) {
            if (order.parentId == parentId && order.status == "PreSubmitted") {
                order.status = "Submitted";
            }
        }
    }

    static int leadingInt(const std::string& s, int fallback) {
        std::istringstream ss(s);
        int value = 0;
        return (ss >> value) ? value : fallback;
    }

    static int barMinutes(const std::string& barSize) {
        int n = std::max(1, leadingInt(barSize, 5));
        if (barSize.find("hour") != std::string::npos) return n * 60;
        if (barSize.find("day") != std::string::npos) return n * 390;
        return n;
    }

    std::shared_ptr<PriceSimulator> simulator_;
    std::string account_;

    mutable std::mutex mutex_;
    bool connected_ = false;
    bool subscribed_ = false;
    int marketDataType_ = 1;
    int failConnects_ = 0;
    long nextConId_ = 1000;
    int nextOrderId_ = 1;

    std::map<std::string, Instrument> universe_;
    std::map<std::string, double> cash_;
    std::map<std::string, Holding> positions_;
    std::map<int, domain::OpenOrder> orders_;
};

} // namespace autotrader::adapters::secondary
