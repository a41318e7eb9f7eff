#pragma once

#include "ports/output/IDecisionService.hpp"
#include <gmock/gmock.h>

namespace autotrader::tests {

class MockDecisionService : public ports::output::IDecisionService {
public:
    MOCK_METHOD(domain::ShortlistDecision, shortlist,
                (const nlohmann::json&, const domain::AiSection&), (override));
    MOCK_METHOD(domain::BuySelection, selectBuys,
                (const nlohmann::json&, const std::vector<std::string>&, int, const domain::AiSection&),
                (override));
    MOCK_METHOD(domain::PositionReviewDecision, reviewPosition,
                (const nlohmann::json&, const domain::AiSection&), (override));
    MOCK_METHOD(domain::OrderReviewDecision, reviewOrder,
                (const nlohmann::json&, const domain::AiSection&), (override));
};

} // namespace autotrader::tests
