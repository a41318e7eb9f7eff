#pragma once

#include "domain/AccountValue.hpp"
#include "domain/OpenOrder.hpp"
#include "domain/Position.hpp"
#include "domain/TradeRecord.hpp"
#include <vector>

namespace autotrader::ports::output {

/**
 * @brief Снимки аккаунта для дашборда
 *
 * Каждый save* заменяет предыдущий снимок целиком.
 */
class ISnapshotRepository {
public:
    virtual ~ISnapshotRepository() = default;

    virtual void saveAccountSummary(const std::vector<domain::AccountSummaryItem>& items) = 0;
    virtual void savePositions(const std::vector<domain::Position>& positions) = 0;
    virtual void saveOpenOrders(const std::vector<domain::OpenOrder>& orders) = 0;
    virtual void recordPerformance(const domain::PerformanceRecord& record) = 0;
};

} // namespace autotrader::ports::output
