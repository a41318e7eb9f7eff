#pragma once

#include "Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace autotrader::domain {

/**
 * @brief Строка журнала сделок (таблица trades)
 */
struct TradeRecord {
    int64_t id = 0;
    Timestamp timestamp;
    std::string symbol;
    std::string action;      ///< BUY | SELL
    int quantity = 0;
    double price = 0.0;
    std::optional<double> stopLoss;
    std::optional<double> takeProfit;
    std::optional<double> sentimentScore;
    std::string status;
    std::string rationale;
};

/**
 * @brief Точка кривой капитала (таблица performance)
 */
struct PerformanceRecord {
    Timestamp timestamp;
    double equity = 0.0;
    double unrealisedPnl = 0.0;
    double realisedPnl = 0.0;
};

} // namespace autotrader::domain
