#pragma once

#include "domain/ReviewRecords.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace autotrader::ports::output {

class IReviewRepository {
public:
    virtual ~IReviewRepository() = default;

    virtual int64_t insertPositionReview(const domain::PositionReviewRecord& record) = 0;
    virtual void markPositionReviewExecuted(int64_t id, const std::string& result) = 0;

    virtual int64_t insertOrderReview(const domain::OrderReviewRecord& record) = 0;
    virtual void markOrderReviewExecuted(int64_t id, const std::string& result) = 0;

    virtual std::vector<domain::PositionReviewRecord> recentPositionReviews(int limit) = 0;
    virtual std::vector<domain::OrderReviewRecord> recentOrderReviews(int limit) = 0;
};

} // namespace autotrader::ports::output
