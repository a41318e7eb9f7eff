#pragma once

#include "application/DecisionPayloads.hpp"
#include "application/OrderExecutor.hpp"
#include "application/TechnicalIndicators.hpp"
#include "domain/PositionMetadata.hpp"
#include "domain/ReviewRecords.hpp"
#include "domain/TradeRecord.hpp"
#include "domain/errors/BrokerError.hpp"
#include "ports/input/IPositionReviewService.hpp"
#include "ports/output/IBrokerGateway.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IDecisionService.hpp"
#include "ports/output/IEventLog.hpp"
#include "ports/output/ILiveStatusRepository.hpp"
#include "ports/output/IReviewRepository.hpp"
#include "ports/output/ISocialSentimentSource.hpp"
#include "ports/output/ITradeRepository.hpp"

#include <ThreadSafeMap.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace autotrader::application {

/**
 * @brief Ревью открытых позиций и самостоятельных ордеров
 *
 * Позиция: HOLD / SELL / ADJUST_STOP / ADJUST_TP.
 * Ордер:   KEEP / CANCEL / ADJUST_PRICE (дочерние ноги брекетов не трогаются).
 *
 * Строка ревью пишется до исполнения с executed = false;
 * executed выставляется только после подтверждённого успеха.
 * Сбой сервиса решений не оставляет строки ревью.
 *
 * Метаданные позиций и отметки последнего ревью живут в ThreadSafeMap;
 * повторное ревью символа раньше review_interval_seconds пропускается.
 */
class PositionReviewEngine : public ports::input::IPositionReviewService {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    PositionReviewEngine(std::shared_ptr<ports::output::IBrokerGateway> broker,
                         std::shared_ptr<OrderExecutor> executor,
                         std::shared_ptr<ports::output::IDecisionService> decisions,
                         std::shared_ptr<ports::output::ISocialSentimentSource> social,
                         std::shared_ptr<ports::output::ITradeRepository> trades,
                         std::shared_ptr<ports::output::IReviewRepository> reviews,
                         std::shared_ptr<ports::output::IEventLog> events,
                         std::shared_ptr<ports::output::ILiveStatusRepository> liveStatus,
                         std::shared_ptr<ports::output::IClock> clock,
                         std::chrono::milliseconds accountTimeout = std::chrono::seconds(10))
        : broker_(std::move(broker))
        , executor_(std::move(executor))
        , decisions_(std::move(decisions))
        , social_(std::move(social))
        , trades_(std::move(trades))
        , reviews_(std::move(reviews))
        , events_(std::move(events))
        , liveStatus_(std::move(liveStatus))
        , clock_(std::move(clock))
        , accountTimeout_(accountTimeout)
    {}

    // ============================================
    // ПОЗИЦИИ
    // ============================================

    std::vector<domain::PositionReviewRecord> reviewPositions(
        const domain::TradingConfig& config,
        const std::vector<domain::TopCandidate>& topCandidates,
        const domain::MarketContext& market) override {

        std::vector<domain::PositionReviewRecord> results;
        std::vector<domain::Position> longs;
        for (const auto& p : broker_->getPositions(accountTimeout_)) {
            if (p.quantity > 0.0) {
                longs.push_back(p);
            }
        }
        if (longs.empty()) {
            return results;
        }

        liveStatus_->update("Position Manager", "Reviewing " + std::to_string(longs.size()) + " positions");
        events_->logEvent("INFO", "Reviewing " + std::to_string(longs.size()) + " open positions", "PM", "Start");

        for (const auto& position : longs) {
            try {
                if (auto record = reviewPosition(position, config, topCandidates, market)) {
                    results.push_back(*record);
                }
            } catch (const std::exception& e) {
                std::cerr << "[PositionReviewEngine] Error reviewing position "
                          << position.contract.symbol << ": " << e.what() << std::endl;
                events_->logEvent("ERROR", std::string("Position review failed: ") + e.what(),
                                  position.contract.symbol, "PM");
            }
        }

        liveStatus_->update("Position Manager", "Reviewed " + std::to_string(longs.size()) +
                                                    " positions, " + std::to_string(results.size()) + " actions");
        return results;
    }

    /**
     * @brief Ревью одной позиции
     * @return nullopt, если ревью пропущено (шорт, рано, нет цены, сбой сервиса решений)
     */
    std::optional<domain::PositionReviewRecord> reviewPosition(
        const domain::Position& position,
        const domain::TradingConfig& config,
        const std::vector<domain::TopCandidate>& topCandidates,
        const domain::MarketContext& market) {

        const domain::Contract& contract = position.contract;
        const std::string& symbol = contract.symbol;
        const int quantity = static_cast<int>(position.quantity);
        const double avgCost = position.avgCost;
        const auto& pm = config.positionManagement;

        if (quantity <= 0) {
            return std::nullopt;
        }

        const TimePoint now = clock_->now();
        if (!claimReview(symbol, now, std::chrono::seconds(pm.reviewIntervalSeconds))) {
            return std::nullopt;
        }

        // Цена: из портфеля, иначе прямой котировкой
        std::optional<domain::MarketSnapshot> quote;
        std::optional<double> price;
        double unrealised = 0.0;
        if (position.marketPrice && *position.marketPrice > 0.0) {
            price = position.marketPrice;
            unrealised = position.unrealisedPnl.value_or((*price - avgCost) * quantity);
        } else {
            quote = snapshotOrNull(contract);
            if (quote) price = quote->price();
            if (!price) {
                std::cerr << "[PositionReviewEngine] Cannot get current price for " << symbol << std::endl;
                return std::nullopt;
            }
            unrealised = (*price - avgCost) * quantity;
        }
        const double currentPrice = *price;
        const double pnlPct = avgCost > 0.0 ? (currentPrice - avgCost) / avgCost * 100.0 : 0.0;

        // Время в позиции: метаданные, затем последняя покупка в БД, иначе 30 минут
        std::optional<domain::Timestamp> entry;
        if (auto meta = metadata_.find(symbol)) {
            entry = meta->entryTime;
        } else if (auto buy = lastBuy(symbol)) {
            entry = buy->timestamp;
        }
        const int minutesHeld = entry
            ? static_cast<int>(entry->minutesUntil(domain::Timestamp(now)))
            : 30;

        const domain::Timestamp entryTime = entry ? *entry : domain::Timestamp(now);
        domain::PositionMetadata meta = metadata_.update(
            symbol,
            [&]() {
                domain::PositionMetadata m;
                m.entryTime = entryTime;
                m.entryPrice = avgCost;
                return m;
            },
            [&](domain::PositionMetadata& m) {
                if (!m.peaksInitialised) {
                    m.peakPnlPct = pnlPct;
                    m.peakPrice = currentPrice;
                    m.peaksInitialised = true;
                }
                m.peakPnlPct = std::max(m.peakPnlPct, pnlPct);
                m.peakPrice = std::max(m.peakPrice, currentPrice);
            });

        PositionReviewInput input;
        input.contract = contract;
        input.entryPrice = avgCost;
        input.currentPrice = currentPrice;
        input.quantity = quantity;
        input.unrealisedPnl = unrealised;
        input.pnlPct = pnlPct;
        input.peakPnlPct = meta.peakPnlPct;
        input.drawdownFromPeakPct = TechnicalIndicators::round2(meta.peakPnlPct - pnlPct);
        input.minutesHeld = minutesHeld;
        input.adjustmentCount = meta.adjustmentCount;

        auto levels = executor_->protectiveLevels(symbol);
        input.currentStopLoss = levels.stopLoss;
        input.currentTakeProfit = levels.takeProfit;
        if (levels.stopLoss) {
            input.distanceToStopPct = (currentPrice - *levels.stopLoss) / currentPrice * 100.0;
        }
        if (levels.takeProfit) {
            input.distanceToTpPct = (*levels.takeProfit - currentPrice) / currentPrice * 100.0;
        }

        gatherContext(input, config, quote);

        if (pm.rotationEnabled) {
            for (size_t i = 0; i < topCandidates.size() && i < 5; ++i) {
                input.topCandidates.push_back(topCandidates[i]);
            }
        }

        events_->logEvent("INFO", "AI reviewing position (" + format1(pnlPct) + "%)", symbol, "PM-AI");

        domain::PositionReviewDecision decision;
        try {
            decision = decisions_->reviewPosition(
                DecisionPayloads::positionReview(input, market, config), config.ai);
        } catch (const std::exception& e) {
            std::cerr << "[PositionReviewEngine] AI position review failed for " << symbol
                      << ": " << e.what() << std::endl;
            events_->logEvent("ERROR", std::string("AI review failed: ") + e.what(), symbol, "PM-AI");
            return std::nullopt;
        }

        domain::PositionReviewRecord record;
        record.timestamp = domain::Timestamp(now);
        record.symbol = symbol;
        record.exchange = contract.exchange;
        record.currency = contract.currency;
        record.entryPrice = avgCost;
        record.currentPrice = currentPrice;
        record.quantity = quantity;
        record.unrealisedPnl = unrealised;
        record.pnlPct = pnlPct;
        record.minutesHeld = minutesHeld;
        record.currentStopLoss = levels.stopLoss;
        record.currentTakeProfit = levels.takeProfit;
        record.action = domain::toString(decision.action);
        record.newStopLoss = decision.newStopLoss;
        record.newTakeProfit = decision.newTakeProfit;
        record.confidence = decision.confidence;
        record.urgency = decision.urgency;
        record.rationale = decision.rationale;
        record.keyFactors = decision.keyFactors;
        record.id = reviews_->insertPositionReview(record);

        executePositionDecision(record, decision, contract, quantity, currentPrice, pm.maxAdjustmentsPerPosition);
        return record;
    }

    // ============================================
    // ОРДЕРА
    // ============================================

    std::vector<domain::OrderReviewRecord> reviewOrders(
        const domain::TradingConfig& config,
        double minAgeMinutes,
        const domain::MarketContext& market) override {

        std::vector<domain::OrderReviewRecord> results;
        const TimePoint now = clock_->now();

        std::vector<domain::OpenOrder> toReview;
        for (const auto& order : broker_->getOpenOrders(accountTimeout_)) {
            if (order.parentId != 0) {
                continue;
            }
            double age = order.submittedAt ? order.submittedAt->minutesUntil(domain::Timestamp(now)) : 0.0;
            if (age < minAgeMinutes) {
                continue;
            }
            toReview.push_back(order);
        }
        if (toReview.empty()) {
            return results;
        }

        liveStatus_->update("Order Manager", "Reviewing " + std::to_string(toReview.size()) + " open orders");
        events_->logEvent("INFO", "Reviewing " + std::to_string(toReview.size()) + " open orders", "OM", "Start");

        for (const auto& order : toReview) {
            try {
                if (auto record = reviewOrder(order, config, market, now)) {
                    results.push_back(*record);
                }
            } catch (const std::exception& e) {
                std::cerr << "[PositionReviewEngine] Error reviewing order " << order.orderId
                          << ": " << e.what() << std::endl;
                events_->logEvent("ERROR", std::string("Order review failed: ") + e.what(),
                                  order.contract.symbol, "OM");
            }
        }

        liveStatus_->update("Order Manager", "Reviewed " + std::to_string(toReview.size()) +
                                                 " orders, " + std::to_string(results.size()) + " actions");
        return results;
    }

    std::optional<domain::OrderReviewRecord> reviewOrder(const domain::OpenOrder& order,
                                                         const domain::TradingConfig& config,
                                                         const domain::MarketContext& market,
                                                         TimePoint now) {
        const std::string& symbol = order.contract.symbol;

        auto quote = snapshotOrNull(order.contract);
        std::optional<double> currentPrice = quote ? quote->price() : std::nullopt;
        if (!currentPrice) {
            std::cerr << "[PositionReviewEngine] Cannot get current price for order " << order.orderId
                      << " (" << symbol << "); continuing without market price" << std::endl;
        }

        std::optional<double> orderPrice = order.orderPrice();
        std::optional<double> distance;
        if (orderPrice && currentPrice && *currentPrice > 0.0) {
            distance = (*orderPrice - *currentPrice) / *currentPrice * 100.0;
        }
        std::optional<int> age;
        if (order.submittedAt) {
            age = static_cast<int>(order.submittedAt->minutesUntil(domain::Timestamp(now)));
        }

        events_->logEvent("INFO", "AI reviewing order " + std::to_string(order.orderId) + " (" +
                                      domain::toString(order.action) + " " + domain::toString(order.orderType) + ")",
                          symbol, "OM-AI");

        domain::OrderReviewDecision decision;
        try {
            decision = decisions_->reviewOrder(
                DecisionPayloads::orderReview(order, quote, distance, age, market),
                config.ai);
        } catch (const std::exception& e) {
            std::cerr << "[PositionReviewEngine] AI order review failed for " << symbol << " order "
                      << order.orderId << ": " << e.what() << std::endl;
            events_->logEvent("ERROR", std::string("AI order review failed: ") + e.what(), symbol, "OM-AI");
            return std::nullopt;
        }

        domain::OrderReviewRecord record;
        record.timestamp = domain::Timestamp(now);
        record.orderId = order.orderId;
        record.symbol = symbol;
        record.orderType = domain::toString(order.orderType);
        record.orderAction = domain::toString(order.action);
        record.orderQuantity = static_cast<int>(order.totalQuantity);
        record.orderPrice = orderPrice;
        record.currentPrice = currentPrice;
        if (currentPrice && quote) {
            record.bidPrice = quote->bid;
            record.askPrice = quote->ask;
        }
        record.priceDistancePct = distance;
        record.orderAgeMinutes = age;
        record.action = domain::toString(decision.action);
        record.newPrice = decision.newPrice;
        record.confidence = decision.confidence;
        record.rationale = decision.rationale;
        record.id = reviews_->insertOrderReview(record);

        executeOrderDecision(record, decision, order);
        return record;
    }

    void forgetPosition(const std::string& symbol) override {
        metadata_.erase(symbol);
        lastReview_.erase(symbol);
    }

    // ============================================
    // ЧТЕНИЕ СОСТОЯНИЯ
    // ============================================

    std::optional<domain::PositionMetadata> metadata(const std::string& symbol) const {
        if (auto m = metadata_.find(symbol)) {
            return *m;
        }
        return std::nullopt;
    }

    std::vector<std::string> trackedSymbols() const {
        return metadata_.keys();
    }

private:
    std::shared_ptr<ports::output::IBrokerGateway> broker_;
    std::shared_ptr<OrderExecutor> executor_;
    std::shared_ptr<ports::output::IDecisionService> decisions_;
    std::shared_ptr<ports::output::ISocialSentimentSource> social_;
    std::shared_ptr<ports::output::ITradeRepository> trades_;
    std::shared_ptr<ports::output::IReviewRepository> reviews_;
    std::shared_ptr<ports::output::IEventLog> events_;
    std::shared_ptr<ports::output::ILiveStatusRepository> liveStatus_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::chrono::milliseconds accountTimeout_;

    common::ThreadSafeMap<std::string, domain::PositionMetadata> metadata_;
    common::ThreadSafeMap<std::string, TimePoint> lastReview_;

    /**
     * @brief Атомарно занять символ для ревью, если интервал истёк
     */
    bool claimReview(const std::string& symbol, TimePoint now, std::chrono::seconds interval) {
        bool claimed = false;
        lastReview_.update(
            symbol,
            []() { return TimePoint{}; },
            [&](TimePoint& last) {
                if (last == TimePoint{} || now - last >= interval) {
                    last = now;
                    claimed = true;
                }
            });
        return claimed;
    }

    std::optional<domain::TradeRecord> lastBuy(const std::string& symbol) {
        try {
            return trades_->lastBuy(symbol);
        } catch (const std::exception& e) {
            std::cerr << "[PositionReviewEngine] Last BUY lookup failed for " << symbol
                      << ": " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    std::optional<domain::MarketSnapshot> snapshotOrNull(const domain::Contract& contract) {
        try {
            return broker_->getMarketSnapshot(contract);
        } catch (const domain::BrokerError& e) {
            std::cerr << "[PositionReviewEngine] Quote unavailable for " << contract.symbol
                      << ": " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    /**
     * @brief Сигналы, новости, соцсети, ликвидность (всё best-effort)
     */
    void gatherContext(PositionReviewInput& input, const domain::TradingConfig& config,
                       const std::optional<domain::MarketSnapshot>& knownQuote) {
        const auto& contract = input.contract;
        const std::string& symbol = contract.symbol;

        try {
            auto bars = broker_->getHistoricalBars(contract, config.intraday.duration,
                                                   config.intraday.barSize, config.intraday.useRth);
            if (bars.size() >= 14) {
                input.signals = TechnicalIndicators::signals(bars);
            }
        } catch (const domain::BrokerError& e) {
            std::cerr << "[PositionReviewEngine] Failed to get indicators for " << symbol
                      << ": " << e.what() << std::endl;
        }

        try {
            input.headlines = broker_->getHeadlines(contract, 8);
        } catch (const domain::BrokerError& e) {
            events_->logEvent("WARN", std::string("Headlines unavailable: ") + e.what(), symbol, "PM-News");
        }

        if (config.reddit.enabled && social_) {
            try {
                input.social = social_->latest(symbol);
            } catch (const std::exception& e) {
                events_->logEvent("WARN", std::string("Reddit sentiment unavailable: ") + e.what(),
                                  symbol, "PM-Reddit");
            }
        }

        if (knownQuote) {
            input.liquidity = knownQuote;
        } else {
            try {
                input.liquidity = broker_->getMarketSnapshot(contract);
            } catch (const domain::BrokerError& e) {
                events_->logEvent("WARN", std::string("Liquidity snapshot unavailable: ") + e.what(),
                                  symbol, "PM-Liq");
            }
        }
    }

    void executePositionDecision(domain::PositionReviewRecord& record,
                                 const domain::PositionReviewDecision& decision,
                                 const domain::Contract& contract,
                                 int quantity,
                                 double currentPrice,
                                 int maxAdjustments) {
        const std::string& symbol = record.symbol;
        const std::string conf = format2(decision.confidence);

        switch (decision.action) {
            case domain::PositionAction::HOLD:
                events_->logEvent("INFO", "AI: HOLD (conf " + conf + ") — " + decision.rationale, symbol, "PM-Hold");
                return;

            case domain::PositionAction::SELL: {
                auto pending = executor_->pendingSellOrdersForSymbol(symbol);
                if (!pending.empty()) {
                    events_->logEvent("WARN", "AI: SELL suggested but " + std::to_string(pending.size()) +
                                                  " SELL order(s) already pending", symbol, "PM-Skip");
                    return;
                }
                events_->logEvent("INFO", "AI: SELL (conf " + conf + ") — " + decision.rationale, symbol, "PM-Sell");
                try {
                    auto placed = executor_->sellPosition(contract, quantity);
                    if (!placed) {
                        return;
                    }
                    forgetPosition(symbol);
                    markExecuted(record, "SOLD");

                    domain::TradeRecord trade;
                    trade.timestamp = domain::Timestamp(clock_->now());
                    trade.symbol = symbol;
                    trade.action = "SELL";
                    trade.quantity = quantity;
                    trade.price = currentPrice;
                    trade.sentimentScore = decision.confidence;
                    trade.status = "EXECUTED";
                    trade.rationale = decision.rationale;
                    trades_->insert(trade);

                    events_->logEvent("INFO", "Executed SELL for " + std::to_string(quantity) + " shares",
                                      symbol, "PM-Sell");
                } catch (const std::exception& e) {
                    events_->logEvent("ERROR", std::string("SELL failed: ") + e.what(), symbol, "PM-Sell");
                }
                return;
            }

            case domain::PositionAction::ADJUST_STOP: {
                if (!decision.newStopLoss) {
                    events_->logEvent("WARN", "AI: ADJUST_STOP returned null new_stop_loss", symbol, "PM-Adjust");
                    return;
                }
                double newStop = *decision.newStopLoss;
                if (newStop <= 0.0 || newStop >= currentPrice) {
                    events_->logEvent("WARN", "AI: ADJUST_STOP invalid new_stop_loss=" + format4(newStop) +
                                                  " vs current_price=" + format4(currentPrice), symbol, "PM-Adjust");
                    return;
                }
                if (adjustmentLimitReached(symbol, maxAdjustments, "ADJUST_STOP")) {
                    return;
                }
                events_->logEvent("INFO", "AI: ADJUST_STOP to " + format2(newStop) + " (conf " + conf + ")",
                                  symbol, "PM-Adjust");
                try {
                    if (executor_->upsertStopLoss(contract, newStop, quantity)) {
                        countAdjustment(symbol);
                        markExecuted(record, "STOP -> " + format2(newStop));
                    }
                } catch (const std::exception& e) {
                    events_->logEvent("ERROR", std::string("ADJUST_STOP failed: ") + e.what(), symbol, "PM-Adjust");
                }
                return;
            }

            case domain::PositionAction::ADJUST_TP: {
                if (!decision.newTakeProfit) {
                    events_->logEvent("WARN", "AI: ADJUST_TP returned null new_take_profit", symbol, "PM-Adjust");
                    return;
                }
                double newTp = *decision.newTakeProfit;
                if (newTp <= currentPrice) {
                    events_->logEvent("WARN", "AI: ADJUST_TP invalid new_take_profit=" + format4(newTp) +
                                                  " <= current_price=" + format4(currentPrice), symbol, "PM-Adjust");
                    return;
                }
                if (adjustmentLimitReached(symbol, maxAdjustments, "ADJUST_TP")) {
                    return;
                }
                events_->logEvent("INFO", "AI: ADJUST_TP to " + format2(newTp) + " (conf " + conf + ")",
                                  symbol, "PM-Adjust");
                try {
                    if (executor_->upsertTakeProfit(contract, newTp, quantity)) {
                        countAdjustment(symbol);
                        markExecuted(record, "TP -> " + format2(newTp));
                    }
                } catch (const std::exception& e) {
                    events_->logEvent("ERROR", std::string("ADJUST_TP failed: ") + e.what(), symbol, "PM-Adjust");
                }
                return;
            }
        }
    }

    void executeOrderDecision(domain::OrderReviewRecord& record,
                              const domain::OrderReviewDecision& decision,
                              const domain::OpenOrder& order) {
        const std::string& symbol = record.symbol;
        const std::string id = std::to_string(order.orderId);
        const std::string conf = format2(decision.confidence);

        switch (decision.action) {
            case domain::OrderReviewAction::KEEP:
                events_->logEvent("INFO", "AI: KEEP order " + id + " (conf " + conf + ") — " + decision.rationale,
                                  symbol, "OM-Keep");
                return;

            case domain::OrderReviewAction::CANCEL:
                events_->logEvent("INFO", "AI: CANCEL order " + id + " (conf " + conf + ") — " + decision.rationale,
                                  symbol, "OM-Cancel");
                try {
                    if (executor_->cancelOrder(order.orderId)) {
                        markOrderExecuted(record, "CANCELLED");
                        events_->logEvent("INFO", "Cancelled order " + id, symbol, "OM-Cancel");
                    }
                } catch (const std::exception& e) {
                    events_->logEvent("ERROR", std::string("Cancel order failed: ") + e.what(), symbol, "OM-Cancel");
                }
                return;

            case domain::OrderReviewAction::ADJUST_PRICE: {
                if (!decision.newPrice || *decision.newPrice <= 0.0) {
                    events_->logEvent("WARN", "AI: ADJUST_PRICE invalid new_price=" +
                                                  (decision.newPrice ? format4(*decision.newPrice) : std::string("null")),
                                      symbol, "OM-Adjust");
                    return;
                }
                double newPrice = *decision.newPrice;
                events_->logEvent("INFO", "AI: ADJUST_PRICE order " + id + " to " + format2(newPrice) +
                                              " (conf " + conf + ")", symbol, "OM-Adjust");
                try {
                    if (executor_->adjustOrderPrice(order.orderId, newPrice)) {
                        markOrderExecuted(record, "PRICE -> " + format2(newPrice));
                    }
                } catch (const std::exception& e) {
                    events_->logEvent("ERROR", std::string("Adjust order price failed: ") + e.what(),
                                      symbol, "OM-Adjust");
                }
                return;
            }
        }
    }

    bool adjustmentLimitReached(const std::string& symbol, int maxAdjustments, const std::string& action) {
        auto meta = metadata_.find(symbol);
        int count = meta ? meta->adjustmentCount : 0;
        if (maxAdjustments >= 0 && count >= maxAdjustments) {
            events_->logEvent("WARN", "AI: " + action + " refused (adjustment limit " +
                                          std::to_string(maxAdjustments) + " reached)", symbol, "PM-Adjust");
            return true;
        }
        return false;
    }

    void countAdjustment(const std::string& symbol) {
        metadata_.update(
            symbol,
            [this]() {
                domain::PositionMetadata m;
                m.entryTime = domain::Timestamp(clock_->now());
                return m;
            },
            [](domain::PositionMetadata& m) { ++m.adjustmentCount; });
    }

    void markExecuted(domain::PositionReviewRecord& record, const std::string& result) {
        record.executed = true;
        record.executionResult = result;
        reviews_->markPositionReviewExecuted(record.id, result);
    }

    void markOrderExecuted(domain::OrderReviewRecord& record, const std::string& result) {
        record.executed = true;
        record.executionResult = result;
        reviews_->markOrderReviewExecuted(record.id, result);
    }

    static std::string format1(double v) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1f", v);
        return buf;
    }

    static std::string format2(double v) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.2f", v);
        return buf;
    }

    static std::string format4(double v) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.4f", v);
        return buf;
    }
};

} // namespace autotrader::application
