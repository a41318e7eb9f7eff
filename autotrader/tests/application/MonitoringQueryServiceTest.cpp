#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/MonitoringQueryService.hpp"
#include "mocks/FakeBrokerGateway.hpp"
#include "mocks/InMemoryRepositories.hpp"
#include "mocks/MockServices.hpp"

using namespace autotrader;
using namespace autotrader::application;
using namespace autotrader::tests;
using ::testing::NiceMock;
using ::testing::Return;

// ============================================================================
// Test Fixture
// ============================================================================

class MonitoringQueryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        status_ = std::make_shared<InMemoryLiveStatus>();
        events_ = std::make_shared<InMemoryEventLog>();
        broker_ = std::make_shared<FakeBrokerGateway>();
        loop_ = std::make_shared<NiceMock<MockTradingLoop>>();
        service_ = std::make_unique<MonitoringQueryService>(status_, events_, broker_, loop_);

        for (int i = 0; i < 5; ++i) {
            events_->logEvent("INFO", "event " + std::to_string(i + 1), "Cycle", "Start");
        }
    }

    std::shared_ptr<InMemoryLiveStatus> status_;
    std::shared_ptr<InMemoryEventLog> events_;
    std::shared_ptr<FakeBrokerGateway> broker_;
    std::shared_ptr<NiceMock<MockTradingLoop>> loop_;
    std::unique_ptr<MonitoringQueryService> service_;
};

// ============================================================================
// ТЕСТЫ: статус
// ============================================================================

TEST_F(MonitoringQueryServiceTest, StatusCombinesSources) {
    status_->update("AAPL", "Analyzing");
    EXPECT_CALL(*loop_, isRunning()).WillOnce(Return(true));

    auto st = service_->status();

    EXPECT_EQ(st.live.currentSymbol, "AAPL");
    EXPECT_EQ(st.live.currentStep, "Analyzing");
    EXPECT_EQ(st.broker, domain::ConnectionState::Connected);
    EXPECT_TRUE(st.loopRunning);
}

TEST_F(MonitoringQueryServiceTest, StatusWithoutLoop) {
    broker_->setConnected(false);
    MonitoringQueryService service(status_, events_, broker_, nullptr);

    auto st = service.status();

    EXPECT_FALSE(st.loopRunning);
    EXPECT_EQ(st.broker, domain::ConnectionState::Disconnected);
    EXPECT_EQ(st.live.currentSymbol, "Idle");
}

// ============================================================================
// ТЕСТЫ: лента событий
// ============================================================================

TEST_F(MonitoringQueryServiceTest, EventsAfterCursor) {
    auto page = service_->eventsAfter(2, 10);

    ASSERT_EQ(page.size(), 3u);
    EXPECT_EQ(page[0].id, 3);
    EXPECT_EQ(page[2].message, "event 5");
}

TEST_F(MonitoringQueryServiceTest, LimitIsClamped) {
    EXPECT_EQ(service_->eventsAfter(0, 0).size(), 1u);
    EXPECT_EQ(service_->eventsAfter(0, -5).size(), 1u);
    EXPECT_EQ(service_->eventsAfter(0, 100000).size(), 5u);
}

TEST_F(MonitoringQueryServiceTest, NegativeCursorStartsFromBeginning) {
    auto page = service_->eventsAfter(-10, 2);

    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[0].id, 1);
}
