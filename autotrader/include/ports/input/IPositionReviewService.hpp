#pragma once

#include "domain/Candidate.hpp"
#include "domain/MarketContext.hpp"
#include "domain/ReviewRecords.hpp"
#include "domain/TradingConfig.hpp"
#include <string>
#include <vector>

namespace autotrader::ports::input {

/**
 * @brief Ревью открытых позиций и самостоятельных ордеров
 */
class IPositionReviewService {
public:
    virtual ~IPositionReviewService() = default;

    /**
     * @return записи ревью, сохранённые за этот проход
     */
    virtual std::vector<domain::PositionReviewRecord> reviewPositions(
        const domain::TradingConfig& config,
        const std::vector<domain::TopCandidate>& topCandidates,
        const domain::MarketContext& market) = 0;

    virtual std::vector<domain::OrderReviewRecord> reviewOrders(
        const domain::TradingConfig& config,
        double minAgeMinutes,
        const domain::MarketContext& market) = 0;

    /**
     * @brief Забыть позицию (после полного выхода вне движка ревью)
     */
    virtual void forgetPosition(const std::string& symbol) = 0;
};

} // namespace autotrader::ports::input
