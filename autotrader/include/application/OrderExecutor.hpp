#pragma once

#include "ports/output/IBrokerGateway.hpp"

#include <cache/ICache.hpp>
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/expiration/GlobalTTL.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace autotrader::application {

/**
 * @brief Исполнение ордеров поверх IBrokerGateway
 *
 * - брекет: MKT BUY + дочерние LMT/STP SELL в группе OCA_{parentId}
 * - upsert стопа/тейк-профита: изменение существующего вместо дубля,
 *   пара связывается в OCA_EXIT_{symbol}, лишние копии отменяются
 * - страховка: отмена SELL без лонга, закрытие шортов
 *
 * Ошибки брокера на основном действии пробрасываются (domain::BrokerError),
 * ошибки отмены лишних ордеров только логируются.
 */
class OrderExecutor {
public:
    /**
     * @brief Итог брекета
     *
     * parentUnknown: ожидание ответа на родителя истекло, ордер мог уйти к брокеру.
     * legErrors: дочерние ноги, которые поставить не удалось (родитель при этом жив).
     */
    struct BracketResult {
        domain::PlacedOrder parent;
        std::optional<int> takeProfitOrderId;
        std::optional<int> stopLossOrderId;
        bool parentUnknown = false;
        std::vector<std::string> legErrors;

        bool complete() const { return !parentUnknown && legErrors.empty(); }
    };

    /**
     * @brief Текущие защитные уровни символа
     */
    struct ProtectiveLevels {
        std::optional<double> stopLoss;
        std::optional<double> takeProfit;
        std::optional<int> stopOrderId;
        std::optional<int> takeProfitOrderId;
    };

    explicit OrderExecutor(std::shared_ptr<ports::output::IBrokerGateway> broker,
                           std::chrono::milliseconds accountTimeout = std::chrono::seconds(10))
        : broker_(std::move(broker))
        , accountTimeout_(accountTimeout)
    {
        auto base = std::make_unique<Cache<std::string, double>>(
            512,
            std::make_unique<LRUPolicy<std::string>>(),
            std::make_unique<GlobalTTL<std::string>>(std::chrono::seconds(3600))
        );
        minTickCache_ = std::make_unique<ThreadSafeCache<std::string, double>>(std::move(base));
    }

    // ============================================
    // ВХОД
    // ============================================

    /**
     * @brief Рыночная покупка с защитными ногами
     *
     * Родитель передаётся сразу, дети привязываются к нему по parentId
     * и активируются брокером только после исполнения родителя.
     *
     * @throws domain::BrokerError если родитель отклонён (к брокеру ничего не ушло)
     * Таймаут родителя и сбои дочерних ног не бросаются: родитель мог быть
     * принят, и вызывающий обязан учесть его в бюджете.
     */
    std::optional<BracketResult> placeBracketBuy(const domain::Contract& contract,
                                                 int quantity,
                                                 std::optional<double> stopLoss,
                                                 std::optional<double> takeProfit) {
        if (quantity <= 0) {
            std::cerr << "[OrderExecutor] Invalid quantity " << quantity
                      << " for " << contract.symbol << std::endl;
            return std::nullopt;
        }

        BracketResult result;
        try {
            result.parent = broker_->placeOrder(
                domain::OrderRequest::market(contract, domain::OrderAction::BUY, quantity));
        } catch (const domain::BrokerTimeoutError& e) {
            std::cerr << "[OrderExecutor] BUY (parent) for " << contract.symbol
                      << " timed out, outcome unknown: " << e.what() << std::endl;
            result.parent.status = "Unknown";
            result.parentUnknown = true;
            return result;
        }
        std::cout << "[OrderExecutor] Placed BUY (parent) for " << quantity << " shares of "
                  << contract.symbol << " (orderId=" << result.parent.orderId << ")" << std::endl;

        if (!stopLoss && !takeProfit) {
            return result;
        }

        const std::string ocaGroup = "OCA_" + std::to_string(result.parent.orderId);

        if (takeProfit) {
            auto tp = domain::OrderRequest::limit(contract, domain::OrderAction::SELL, quantity, *takeProfit);
            tp.parentId = result.parent.orderId;
            tp.ocaGroup = ocaGroup;
            tp.ocaType = 1;
            result.takeProfitOrderId = placeLeg(tp, "take-profit", result);
        }
        if (stopLoss) {
            auto sl = domain::OrderRequest::stop(contract, domain::OrderAction::SELL, quantity, *stopLoss);
            sl.parentId = result.parent.orderId;
            sl.ocaGroup = ocaGroup;
            sl.ocaType = 1;
            result.stopLossOrderId = placeLeg(sl, "stop-loss", result);
        }
        return result;
    }

    // ============================================
    // ЗАЩИТНЫЕ ОРДЕРА
    // ============================================

    /**
     * @brief Создать или изменить SELL STP; цена округляется вниз до тика
     * @return false, если стопа нет и ставить его не на что (нет лонга)
     */
    bool upsertStopLoss(const domain::Contract& contract, double stopPrice,
                        std::optional<int> quantity = std::nullopt) {
        if (contract.symbol.empty()) {
            std::cerr << "[OrderExecutor] Cannot upsert stop-loss: contract has no symbol" << std::endl;
            return false;
        }
        if (auto tick = minTick(contract)) {
            double rounded = roundDownToTick(stopPrice, *tick);
            if (rounded != stopPrice) {
                std::cout << "[OrderExecutor] Rounded stop for " << contract.symbol << " to tick: "
                          << stopPrice << " -> " << rounded << " (minTick=" << *tick << ")" << std::endl;
            }
            stopPrice = rounded;
        }
        return upsertExit(contract, domain::OrderType::STP, stopPrice, quantity);
    }

    /**
     * @brief Создать или изменить SELL LMT; цена округляется вверх до тика
     */
    bool upsertTakeProfit(const domain::Contract& contract, double takeProfitPrice,
                          std::optional<int> quantity = std::nullopt) {
        if (contract.symbol.empty()) {
            std::cerr << "[OrderExecutor] Cannot upsert take-profit: contract has no symbol" << std::endl;
            return false;
        }
        if (auto tick = minTick(contract)) {
            double rounded = roundUpToTick(takeProfitPrice, *tick);
            if (rounded != takeProfitPrice) {
                std::cout << "[OrderExecutor] Rounded take-profit for " << contract.symbol << " to tick: "
                          << takeProfitPrice << " -> " << rounded << " (minTick=" << *tick << ")" << std::endl;
            }
            takeProfitPrice = rounded;
        }
        return upsertExit(contract, domain::OrderType::LMT, takeProfitPrice, quantity);
    }

    ProtectiveLevels protectiveLevels(const std::string& symbol) {
        ProtectiveLevels levels;
        for (const auto& o : openOrdersForSymbol(symbol)) {
            if (o.action != domain::OrderAction::SELL) continue;
            if (o.orderType == domain::OrderType::STP) {
                levels.stopLoss = o.auxPrice;
                levels.stopOrderId = o.orderId;
            } else if (o.orderType == domain::OrderType::LMT) {
                levels.takeProfit = o.lmtPrice;
                levels.takeProfitOrderId = o.orderId;
            }
        }
        return levels;
    }

    // ============================================
    // СТРАХОВКА
    // ============================================

    /**
     * @brief Отменить SELL-ордера по символам без лонга
     * @return сколько отменено
     */
    int cancelOrphanedSellOrders() {
        std::vector<std::string> longSymbols;
        for (const auto& p : broker_->getPositions(accountTimeout_)) {
            if (p.quantity > 0.0) {
                longSymbols.push_back(p.contract.symbol);
            }
        }

        int cancelled = 0;
        for (const auto& o : broker_->getOpenOrders(accountTimeout_)) {
            if (o.action != domain::OrderAction::SELL) continue;
            bool held = std::find(longSymbols.begin(), longSymbols.end(), o.contract.symbol) != longSymbols.end();
            if (held) continue;

            std::cerr << "[OrderExecutor] SAFETY: Cancelling orphaned SELL order " << o.orderId
                      << " for " << o.contract.symbol << " (no long position)" << std::endl;
            if (tryCancel(o.orderId, o.contract.symbol)) {
                ++cancelled;
            }
        }
        return cancelled;
    }

    /**
     * @brief Закрыть все шорты покупкой; шорты в стратегии только-лонг - ошибка
     * @return (символ, количество) для каждой размещённой покупки
     */
    std::vector<std::pair<std::string, int>> closeAllShorts() {
        std::vector<std::pair<std::string, int>> closed;
        for (const auto& p : broker_->getPositions(accountTimeout_)) {
            int qty = static_cast<int>(p.quantity);
            if (qty >= 0) continue;

            const std::string& symbol = p.contract.symbol;
            std::cerr << "[OrderExecutor] SAFETY: Found short position " << symbol
                      << " qty=" << qty << ", closing..." << std::endl;

            domain::Contract contract = p.contract;
            if (contract.exchange.empty()) contract.exchange = "SMART";
            if (contract.currency.empty()) contract.currency = "USD";
            if (auto qualified = broker_->qualifyContract(contract)) {
                contract = *qualified;
            }

            cancelOrdersForSymbol(symbol);
            auto placed = broker_->placeOrder(
                domain::OrderRequest::market(contract, domain::OrderAction::BUY, -qty));
            std::cout << "[OrderExecutor] Placed BUY TO COVER for " << -qty << " shares of "
                      << symbol << " (orderId=" << placed.orderId << ")" << std::endl;
            closed.emplace_back(symbol, -qty);
        }
        return closed;
    }

    // ============================================
    // ВЫХОД И УПРАВЛЕНИЕ ОРДЕРАМИ
    // ============================================

    /**
     * @brief Рыночная продажа; не больше фактического лонга
     */
    std::optional<domain::PlacedOrder> sellPosition(const domain::Contract& contract, int quantity) {
        if (quantity <= 0) {
            std::cerr << "[OrderExecutor] Invalid sell quantity " << quantity
                      << " for " << contract.symbol << std::endl;
            return std::nullopt;
        }

        int actual = positionQuantity(contract.symbol);
        if (actual <= 0) {
            std::cerr << "[OrderExecutor] Cannot sell " << contract.symbol
                      << ": no long position held (qty: " << actual << ")" << std::endl;
            return std::nullopt;
        }

        int safeQty = std::min(quantity, actual);
        if (safeQty < quantity) {
            std::cerr << "[OrderExecutor] Capping sell quantity from " << quantity
                      << " to " << safeQty << " (actual position)" << std::endl;
        }

        cancelOrdersForSymbol(contract.symbol);
        auto placed = broker_->placeOrder(
            domain::OrderRequest::market(contract, domain::OrderAction::SELL, safeQty));
        std::cout << "[OrderExecutor] Placed MARKET SELL for " << safeQty << " shares of "
                  << contract.symbol << std::endl;
        return placed;
    }

    int cancelOrdersForSymbol(const std::string& symbol) {
        int cancelled = 0;
        for (const auto& o : openOrdersForSymbol(symbol)) {
            if (tryCancel(o.orderId, symbol)) {
                ++cancelled;
            }
        }
        return cancelled;
    }

    std::vector<domain::OpenOrder> openOrdersForSymbol(const std::string& symbol) {
        std::vector<domain::OpenOrder> out;
        for (const auto& o : broker_->getOpenOrders(accountTimeout_)) {
            if (o.contract.symbol == symbol) {
                out.push_back(o);
            }
        }
        return out;
    }

    std::vector<domain::OpenOrder> pendingSellOrdersForSymbol(const std::string& symbol) {
        std::vector<domain::OpenOrder> out;
        for (const auto& o : openOrdersForSymbol(symbol)) {
            if (o.action == domain::OrderAction::SELL) {
                out.push_back(o);
            }
        }
        return out;
    }

    int positionQuantity(const std::string& symbol) {
        for (const auto& p : broker_->getPositions(accountTimeout_)) {
            if (p.contract.symbol == symbol) {
                return static_cast<int>(p.quantity);
            }
        }
        return 0;
    }

    /**
     * @return false, если ордера нет среди рабочих
     */
    bool cancelOrder(int orderId) {
        for (const auto& o : broker_->getOpenOrders(accountTimeout_)) {
            if (o.orderId == orderId) {
                broker_->cancelOrder(orderId);
                std::cout << "[OrderExecutor] Cancelled order " << orderId << std::endl;
                return true;
            }
        }
        std::cerr << "[OrderExecutor] Order " << orderId << " not found in open orders" << std::endl;
        return false;
    }

    /**
     * @brief Новая цена: LMT - лимит, STP - стоп; прочие типы не меняются
     */
    bool adjustOrderPrice(int orderId, double newPrice) {
        for (const auto& o : broker_->getOpenOrders(accountTimeout_)) {
            if (o.orderId != orderId) continue;

            auto request = domain::OrderRequest::modify(o);
            std::optional<double> oldPrice;
            if (o.orderType == domain::OrderType::LMT) {
                oldPrice = o.lmtPrice;
                request.lmtPrice = newPrice;
            } else if (o.orderType == domain::OrderType::STP) {
                oldPrice = o.auxPrice;
                request.auxPrice = newPrice;
            } else {
                std::cerr << "[OrderExecutor] Cannot adjust price for order type "
                          << domain::toString(o.orderType) << std::endl;
                return false;
            }
            broker_->placeOrder(request);
            std::cout << "[OrderExecutor] Adjusted order " << orderId << " price: "
                      << (oldPrice ? std::to_string(*oldPrice) : "none") << " -> " << newPrice << std::endl;
            return true;
        }
        std::cerr << "[OrderExecutor] Order " << orderId << " not found in open orders" << std::endl;
        return false;
    }

    // ============================================
    // ТИКИ
    // ============================================

    /**
     * @brief Шаг цены инструмента (кэшируется); nullopt, если брокер не знает
     */
    std::optional<double> minTick(const domain::Contract& contract) {
        const std::string key = contract.conId != 0
            ? std::to_string(contract.conId)
            : contract.symbol + ":" + contract.exchange + ":" + contract.currency;

        if (auto cached = minTickCache_->get(key)) {
            return *cached;
        }
        try {
            double tick = broker_->getMinTick(contract);
            if (tick > 0.0) {
                minTickCache_->put(key, tick);
                return tick;
            }
        } catch (const domain::BrokerError& e) {
            std::cerr << "[OrderExecutor] Min tick lookup failed for " << contract.symbol
                      << ": " << e.what() << std::endl;
        }
        return std::nullopt;
    }

    static double roundDownToTick(double price, double tick) {
        if (tick <= 0.0) return price;
        return normalise(std::floor(price / tick + 1e-9) * tick);
    }

    static double roundUpToTick(double price, double tick) {
        if (tick <= 0.0) return price;
        return normalise(std::ceil(price / tick - 1e-9) * tick);
    }

private:
    std::optional<int> placeLeg(const domain::OrderRequest& request, const std::string& leg,
                                BracketResult& result) {
        const std::string& symbol = request.contract.symbol;
        try {
            int id = broker_->placeOrder(request).orderId;
            const auto price = request.orderType == domain::OrderType::STP ? request.auxPrice : request.lmtPrice;
            std::cout << "[OrderExecutor] Placed " << leg << " at " << price.value_or(0.0)
                      << " for " << symbol << std::endl;
            return id;
        } catch (const domain::BrokerError& e) {
            std::cerr << "[OrderExecutor] Failed to place " << leg << " for " << symbol
                      << " (parent " << request.parentId << "): " << e.what() << std::endl;
            result.legErrors.push_back(leg + ": " + e.what());
            return std::nullopt;
        }
    }

    std::shared_ptr<ports::output::IBrokerGateway> broker_;
    std::chrono::milliseconds accountTimeout_;
    std::unique_ptr<ICache<std::string, double>> minTickCache_;

    static double normalise(double value) {
        return std::round(value * 1e8) / 1e8;
    }

    bool tryCancel(int orderId, const std::string& symbol) {
        try {
            broker_->cancelOrder(orderId);
            std::cout << "[OrderExecutor] Cancelled order " << orderId << " for " << symbol << std::endl;
            return true;
        } catch (const domain::BrokerError& e) {
            std::cerr << "[OrderExecutor] Failed to cancel order " << orderId << " for "
                      << symbol << ": " << e.what() << std::endl;
            return false;
        }
    }

    /**
     * @brief Общий upsert защитной ноги
     *
     * type == STP: своя нога - стоп, парная - LMT; и наоборот.
     */
    bool upsertExit(const domain::Contract& contract, domain::OrderType type, double price,
                    std::optional<int> quantity) {
        const std::string& symbol = contract.symbol;
        const bool isStop = type == domain::OrderType::STP;
        const domain::OrderType pairedType = isStop ? domain::OrderType::LMT : domain::OrderType::STP;
        const char* label = isStop ? "STOP LOSS" : "TAKE PROFIT";

        std::vector<domain::OpenOrder> own;
        std::vector<domain::OpenOrder> paired;
        for (const auto& o : openOrdersForSymbol(symbol)) {
            if (o.action != domain::OrderAction::SELL) continue;
            if (o.orderType == type) own.push_back(o);
            else if (o.orderType == pairedType) paired.push_back(o);
        }

        const std::string ocaGroup = "OCA_EXIT_" + symbol;

        if (!own.empty()) {
            auto request = domain::OrderRequest::modify(own.front());
            std::optional<double> oldPrice = isStop ? own.front().auxPrice : own.front().lmtPrice;
            if (isStop) request.auxPrice = price;
            else request.lmtPrice = price;

            if (!paired.empty()) {
                request.ocaGroup = ocaGroup;
                request.ocaType = 1;
                relinkPaired(paired, ocaGroup, symbol);
            }
            broker_->placeOrder(request);
            std::cout << "[OrderExecutor] Modified " << label << " for " << symbol << ": "
                      << (oldPrice ? std::to_string(*oldPrice) : "none") << " -> " << price << std::endl;

            for (size_t i = 1; i < own.size(); ++i) {
                tryCancel(own[i].orderId, symbol);
            }
            return true;
        }

        int qty = quantity ? *quantity : positionQuantity(symbol);
        if (qty <= 0) {
            std::cerr << "[OrderExecutor] Cannot create " << label << " for " << symbol
                      << ": no long position quantity available" << std::endl;
            return false;
        }

        auto request = isStop
            ? domain::OrderRequest::stop(contract, domain::OrderAction::SELL, qty, price)
            : domain::OrderRequest::limit(contract, domain::OrderAction::SELL, qty, price);
        if (!paired.empty()) {
            request.ocaGroup = ocaGroup;
            request.ocaType = 1;
            relinkPaired(paired, ocaGroup, symbol);
        }
        broker_->placeOrder(request);
        std::cout << "[OrderExecutor] Placed " << label << " for " << symbol << ": "
                  << price << " (qty=" << qty << ")" << std::endl;
        return true;
    }

    /**
     * @brief Перевести первую парную ногу в общую OCA-группу, лишние отменить
     */
    void relinkPaired(const std::vector<domain::OpenOrder>& paired, const std::string& ocaGroup,
                      const std::string& symbol) {
        for (size_t i = 1; i < paired.size(); ++i) {
            tryCancel(paired[i].orderId, symbol);
        }
        if (paired.front().ocaGroup == ocaGroup && paired.front().ocaType == 1) {
            return;
        }
        auto relink = domain::OrderRequest::modify(paired.front());
        relink.ocaGroup = ocaGroup;
        relink.ocaType = 1;
        broker_->placeOrder(relink);
    }
};

} // namespace autotrader::application
