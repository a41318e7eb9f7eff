#pragma once

#include "Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace autotrader::domain {

/**
 * @brief Результат ревью позиции (таблица position_reviews)
 *
 * executed выставляется только после подтверждённого исполнения.
 */
struct PositionReviewRecord {
    int64_t id = 0;
    Timestamp timestamp;
    std::string symbol;
    std::string exchange;
    std::string currency;
    std::optional<double> entryPrice;
    std::optional<double> currentPrice;
    int quantity = 0;
    std::optional<double> unrealisedPnl;
    std::optional<double> pnlPct;
    std::optional<int> minutesHeld;
    std::optional<double> currentStopLoss;
    std::optional<double> currentTakeProfit;
    std::string action;
    std::optional<double> newStopLoss;
    std::optional<double> newTakeProfit;
    std::optional<double> confidence;
    std::optional<double> urgency;
    std::string rationale;
    std::vector<std::string> keyFactors;
    bool executed = false;
    std::string executionResult;
};

/**
 * @brief Результат ревью рабочего ордера (таблица order_reviews)
 */
struct OrderReviewRecord {
    int64_t id = 0;
    Timestamp timestamp;
    int orderId = 0;
    std::string symbol;
    std::string orderType;
    std::string orderAction;
    int orderQuantity = 0;
    std::optional<double> orderPrice;
    std::optional<double> currentPrice;
    std::optional<double> bidPrice;
    std::optional<double> askPrice;
    std::optional<double> priceDistancePct;
    std::optional<int> orderAgeMinutes;
    std::string action;
    std::optional<double> newPrice;
    std::optional<double> confidence;
    std::string rationale;
    bool executed = false;
    std::string executionResult;
};

} // namespace autotrader::domain
