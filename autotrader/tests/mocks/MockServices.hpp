#pragma once

#include "ports/input/IMonitoringQueryService.hpp"
#include "ports/input/IPositionReviewService.hpp"
#include "ports/input/IRuntimeConfigService.hpp"
#include "ports/input/ITradingLoop.hpp"
#include <gmock/gmock.h>

namespace autotrader::tests {

class MockRuntimeConfigService : public ports::input::IRuntimeConfigService {
public:
    MOCK_METHOD(domain::TradingConfig, effectiveConfig, (), (override));
    MOCK_METHOD(domain::RuntimeConfigDocument, document, (), (override));
    MOCK_METHOD(domain::RuntimeConfigDocument, replace, (const domain::RuntimeConfigDocument&), (override));
};

class MockPositionReviewService : public ports::input::IPositionReviewService {
public:
    MOCK_METHOD(std::vector<domain::PositionReviewRecord>, reviewPositions,
                (const domain::TradingConfig&, const std::vector<domain::TopCandidate>&,
                 const domain::MarketContext&),
                (override));
    MOCK_METHOD(std::vector<domain::OrderReviewRecord>, reviewOrders,
                (const domain::TradingConfig&, double, const domain::MarketContext&), (override));
    MOCK_METHOD(void, forgetPosition, (const std::string&), (override));
};

class MockMonitoringQueryService : public ports::input::IMonitoringQueryService {
public:
    MOCK_METHOD(ports::input::MonitoringStatus, status, (), (override));
    MOCK_METHOD(std::vector<domain::EventRecord>, eventsAfter, (int64_t, int), (override));
};

class MockTradingLoop : public ports::input::ITradingLoop {
public:
    MOCK_METHOD(void, start, (), (override));
    MOCK_METHOD(void, stop, (), (override));
    MOCK_METHOD(bool, isRunning, (), (const, override));
    MOCK_METHOD(std::chrono::seconds, runCycle, (), (override));
};

} // namespace autotrader::tests
