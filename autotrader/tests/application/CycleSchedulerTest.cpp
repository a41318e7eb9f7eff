#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/CycleScheduler.hpp"
#include "mocks/BarFactory.hpp"
#include "mocks/FakeBrokerGateway.hpp"
#include "mocks/InMemoryRepositories.hpp"
#include "mocks/ManualClock.hpp"
#include "mocks/MockDecisionService.hpp"
#include "mocks/MockServices.hpp"

using namespace autotrader;
using namespace autotrader::application;
using namespace autotrader::tests;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using domain::OrderAction;
using domain::OrderType;

// ============================================================================
// Test Fixture
// ============================================================================

class CycleSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        broker_ = std::make_shared<FakeBrokerGateway>();
        decisions_ = std::make_shared<NiceMock<MockDecisionService>>();
        config_ = std::make_shared<NiceMock<MockRuntimeConfigService>>();
        review_ = std::make_shared<NiceMock<MockPositionReviewService>>();
        social_ = std::make_shared<FakeSocialSentimentSource>();
        snapshots_ = std::make_shared<InMemorySnapshotRepository>();
        research_ = std::make_shared<InMemoryResearchRepository>();
        trades_ = std::make_shared<InMemoryTradeRepository>();
        events_ = std::make_shared<InMemoryEventLog>();
        status_ = std::make_shared<InMemoryLiveStatus>();
        clock_ = std::make_shared<ManualClock>(ManualClock::utc(2024, 7, 15, 15, 0));
        pool_ = std::make_shared<common::WorkerPool>(2);

        cfg_.trading.markets = {domain::Market::US};
        cfg_.trading.screener.scanCodes = {"MOST_ACTIVE"};
        cfg_.trading.maxPositions = 5;
        cfg_.trading.maxNewPositionsPerCycle = 2;
        cfg_.intraday.cycleIntervalSeconds = 3600;
        cfg_.intraday.cycleIntervalSecondsClosed = 1800;
        ON_CALL(*config_, effectiveConfig()).WillByDefault(Invoke([this]() { return cfg_; }));

        broker_->setAccountSummary({
            {"NetLiquidation", 100000.0, "BASE"},
            {"TotalCashValue", 10000.0, "USD"}});
        broker_->setScanResults("MOST_ACTIVE", {domain::Contract("AAA", "SMART", "USD"),
                                                domain::Contract("BBB", "SMART", "USD")});
        broker_->setBars("AAA", linearBars(40, 10.0, 0.05, 0.4));
        broker_->setBars("BBB", linearBars(40, 10.0, 0.05, 0.4));

        ON_CALL(*decisions_, shortlist(_, _))
            .WillByDefault(Invoke([](const nlohmann::json& payload, const domain::AiSection&) {
                domain::ShortlistDecision d;
                d.decision = "SHORTLIST";
                d.confidence = 0.8;
                d.score = payload["symbol"] == "BBB" ? 0.9 : 0.6;
                d.sentiment = 0.4;
                d.rationale = "setup " + payload["symbol"].get<std::string>();
                return d;
            }));

        auto executor = std::make_shared<OrderExecutor>(broker_);
        auto& deps = deps_;
        deps.config = config_;
        deps.review = review_;
        deps.broker = broker_;
        deps.executor = executor;
        deps.screener = std::make_shared<MarketScreener>(broker_);
        deps.researcher = std::make_shared<CandidateResearcher>(
            broker_, decisions_, social_, research_, events_, status_, clock_, pool_);
        deps.decisions = decisions_;
        deps.social = social_;
        deps.snapshots = snapshots_;
        deps.research = research_;
        deps.trades = trades_;
        deps.events = events_;
        deps.liveStatus = status_;
        deps.clock = clock_;

        scheduler_ = std::make_unique<CycleScheduler>(deps_, CycleScheduler::Options{});
    }

    void TearDown() override {
        scheduler_->stop();
        pool_->stop();
    }

    // Суммарная стоимость родительских BUY по символам
    double boughtNotional(double price) const {
        double total = 0.0;
        for (const auto& o : broker_->placedOrders()) {
            if (o.action == OrderAction::BUY && o.orderType == OrderType::MKT && o.parentId == 0) {
                total += o.quantity * price;
            }
        }
        return total;
    }

    static domain::BuySelection selecting(std::vector<std::string> symbols) {
        domain::BuySelection s;
        s.selectedSymbols = std::move(symbols);
        s.rationale = "best setups";
        return s;
    }

    std::shared_ptr<FakeBrokerGateway> broker_;
    std::shared_ptr<NiceMock<MockDecisionService>> decisions_;
    std::shared_ptr<NiceMock<MockRuntimeConfigService>> config_;
    std::shared_ptr<NiceMock<MockPositionReviewService>> review_;
    std::shared_ptr<FakeSocialSentimentSource> social_;
    std::shared_ptr<InMemorySnapshotRepository> snapshots_;
    std::shared_ptr<InMemoryResearchRepository> research_;
    std::shared_ptr<InMemoryTradeRepository> trades_;
    std::shared_ptr<InMemoryEventLog> events_;
    std::shared_ptr<InMemoryLiveStatus> status_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<common::WorkerPool> pool_;
    CycleScheduler::Dependencies deps_;
    std::unique_ptr<CycleScheduler> scheduler_;

    domain::TradingConfig cfg_;
};

// ============================================================================
// ТЕСТЫ: полный цикл
// ============================================================================

TEST_F(CycleSchedulerTest, SelectedCandidateGetsBracketOrder) {
    EXPECT_CALL(*decisions_, selectBuys(_, _, 2, _)).WillOnce(Return(selecting({"BBB"})));

    auto next = scheduler_->runCycle();

    EXPECT_EQ(next, std::chrono::seconds(3600));

    auto orders = broker_->placedFor("BBB");
    ASSERT_EQ(orders.size(), 3u);
    EXPECT_EQ(orders[0].orderType, OrderType::MKT);
    EXPECT_EQ(orders[0].action, OrderAction::BUY);
    // ATR 0.4, стоп 2 ATR, бюджет 8000 / 11.95
    EXPECT_DOUBLE_EQ(orders[0].quantity, 669.0);
    EXPECT_NEAR(*orders[1].lmtPrice, 12.75, 1e-9);
    EXPECT_NEAR(*orders[2].auxPrice, 11.15, 1e-9);
    EXPECT_TRUE(broker_->placedFor("AAA").empty());

    auto trades = trades_->all();
    ASSERT_EQ(trades.size(), 1u);
    EXPECT_EQ(trades[0].symbol, "BBB");
    EXPECT_EQ(trades[0].action, "BUY");
    EXPECT_EQ(trades[0].quantity, 669);

    auto bbb = research_->bySymbol("BBB");
    ASSERT_TRUE(bbb.has_value());
    EXPECT_EQ(bbb->decision, domain::ResearchDecision::TRADE);
    EXPECT_EQ(*bbb->rank, 1);

    auto aaa = research_->bySymbol("AAA");
    ASSERT_TRUE(aaa.has_value());
    EXPECT_EQ(aaa->decision, domain::ResearchDecision::SHORTLISTED);
    EXPECT_EQ(aaa->reason, "Shortlisted; not selected this cycle");
    EXPECT_EQ(*aaa->rank, 2);
}

TEST_F(CycleSchedulerTest, TopCandidatesFollowScore) {
    EXPECT_CALL(*decisions_, selectBuys(_, _, _, _)).WillOnce(Return(selecting({})));

    scheduler_->runCycle();

    auto top = scheduler_->topCandidates();
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].symbol, "BBB");
    EXPECT_DOUBLE_EQ(top[0].score, 0.9);
    EXPECT_TRUE(broker_->placedOrders().empty());
    EXPECT_TRUE(events_->contains("Selected 0 trades: None"));
}

TEST_F(CycleSchedulerTest, AccountSnapshotIsPersisted) {
    EXPECT_CALL(*decisions_, selectBuys(_, _, _, _)).WillOnce(Return(selecting({})));

    scheduler_->runCycle();

    ASSERT_EQ(snapshots_->performance.size(), 1u);
    EXPECT_DOUBLE_EQ(snapshots_->performance[0].equity, 100000.0);
    EXPECT_FALSE(snapshots_->summary.empty());
}

// ============================================================================
// ТЕСТЫ: ранние выходы
// ============================================================================

TEST_F(CycleSchedulerTest, InvalidRuntimeConfigPausesTrading) {
    EXPECT_CALL(*config_, effectiveConfig())
        .WillOnce(Throw(domain::RuntimeConfigError("Unsupported override key: trading.leverage")));

    auto next = scheduler_->runCycle();

    // Без прочитанной конфигурации: пауза по умолчанию
    EXPECT_EQ(next, CycleScheduler::Options{}.initialInterval);
    EXPECT_TRUE(broker_->scanQueries().empty());
    EXPECT_TRUE(events_->contains("Runtime config unavailable/invalid: RuntimeConfigError"));
    EXPECT_EQ(status_->get().currentStep, "Runtime config error; trading paused");
}

TEST_F(CycleSchedulerTest, FirstConfigFailureUsesInitialInterval) {
    CycleScheduler::Options options;
    options.initialInterval = std::chrono::seconds(300);
    scheduler_ = std::make_unique<CycleScheduler>(deps_, options);
    EXPECT_CALL(*config_, effectiveConfig())
        .WillOnce(Throw(domain::RuntimeConfigError("connection refused")))
        .WillOnce(Invoke([this]() { return cfg_; }))
        .WillOnce(Throw(domain::RuntimeConfigError("connection refused")));
    EXPECT_CALL(*decisions_, selectBuys(_, _, _, _)).WillRepeatedly(Return(selecting({})));

    EXPECT_EQ(scheduler_->runCycle(), std::chrono::seconds(300));
    EXPECT_EQ(scheduler_->runCycle(), std::chrono::seconds(3600));
    // После успешного цикла пауза берётся из последней прочитанной конфигурации
    EXPECT_EQ(scheduler_->runCycle(), std::chrono::seconds(3600));
}

TEST_F(CycleSchedulerTest, ClosedMarketSkipsScanning) {
    clock_->set(ManualClock::utc(2024, 7, 13, 15, 0));

    auto next = scheduler_->runCycle();

    EXPECT_EQ(next, std::chrono::seconds(1800));
    EXPECT_TRUE(broker_->scanQueries().empty());
    EXPECT_TRUE(events_->contains("next cycle in ~30 min"));
}

TEST_F(CycleSchedulerTest, NoCandidatesEndsCycle) {
    broker_->setScanResults("MOST_ACTIVE", {});
    EXPECT_CALL(*decisions_, shortlist(_, _)).Times(0);

    EXPECT_EQ(scheduler_->runCycle(), std::chrono::seconds(3600));
    EXPECT_TRUE(events_->contains("No candidates available"));
}

TEST_F(CycleSchedulerTest, NoCapacitySkipsSelection) {
    cfg_.trading.maxPositions = 1;
    broker_->addPosition("HELD", 10, 5.0, 5.5);
    EXPECT_CALL(*decisions_, selectBuys(_, _, _, _)).Times(0);

    scheduler_->runCycle();

    EXPECT_TRUE(events_->contains("No capacity for new positions (1/1)."));
    EXPECT_EQ(scheduler_->topCandidates().size(), 2u);
}

TEST_F(CycleSchedulerTest, SelectionFailureLeavesShortlist) {
    EXPECT_CALL(*decisions_, selectBuys(_, _, _, _)).WillOnce(Throw(domain::DecisionError("timeout")));

    EXPECT_EQ(scheduler_->runCycle(), std::chrono::seconds(3600));

    EXPECT_TRUE(broker_->placedOrders().empty());
    EXPECT_EQ(research_->bySymbol("BBB")->decision, domain::ResearchDecision::SHORTLISTED);
    EXPECT_TRUE(events_->contains("Buy selection AI failed: DecisionError: timeout"));
}

TEST_F(CycleSchedulerTest, MissingAtrBlocksOrder) {
    broker_->setBars("BBB", linearBars(20, 10.0, 0.05, 0.4));
    EXPECT_CALL(*decisions_, selectBuys(_, _, _, _)).WillOnce(Return(selecting({"BBB"})));

    scheduler_->runCycle();

    EXPECT_TRUE(broker_->placedFor("BBB").empty());
    EXPECT_EQ(research_->bySymbol("BBB")->reason, "Selected by AI but ATR missing; cannot set stop-loss");
}

// ============================================================================
// ТЕСТЫ: бюджет по валютам
// ============================================================================

TEST_F(CycleSchedulerTest, SelectionNeverExceedsCurrencyBudget) {
    EXPECT_CALL(*decisions_, selectBuys(_, _, 2, _)).WillOnce(Return(selecting({"BBB", "AAA"})));

    scheduler_->runCycle();

    // 10000 * 0.8: BBB забирает 669 * 11.95, на AAA остаётся меньше одной акции
    EXPECT_LE(boughtNotional(11.95), 8000.0);
    EXPECT_EQ(broker_->placedFor("BBB").size(), 3u);
    EXPECT_TRUE(broker_->placedFor("AAA").empty());
    EXPECT_EQ(research_->bySymbol("AAA")->reason,
              "Selected by AI but insufficient USD budget for position sizing");
    EXPECT_EQ(trades_->all().size(), 1u);
}

TEST_F(CycleSchedulerTest, IncompleteBracketStillConsumesBudget) {
    broker_->failChildOrders(true);
    EXPECT_CALL(*decisions_, selectBuys(_, _, 2, _)).WillOnce(Return(selecting({"BBB", "AAA"})));

    scheduler_->runCycle();

    auto bbb = broker_->placedFor("BBB");
    ASSERT_EQ(bbb.size(), 1u);
    EXPECT_EQ(bbb[0].orderType, OrderType::MKT);
    EXPECT_TRUE(broker_->placedFor("AAA").empty());
    EXPECT_LE(boughtNotional(11.95), 8000.0);

    auto trades = trades_->all();
    ASSERT_EQ(trades.size(), 1u);
    EXPECT_EQ(trades[0].symbol, "BBB");
    EXPECT_EQ(trades[0].quantity, 669);

    auto record = research_->bySymbol("BBB");
    EXPECT_EQ(record->decision, domain::ResearchDecision::TRADE);
    EXPECT_NE(record->reason.find("protective order(s) missing"), std::string::npos);
    EXPECT_TRUE(events_->contains("Protective order placement failed"));
    EXPECT_EQ(research_->bySymbol("AAA")->reason,
              "Selected by AI but insufficient USD budget for position sizing");
}

TEST_F(CycleSchedulerTest, UnknownOrderOutcomeReservesBudget) {
    broker_->timeoutParentOrders(true);
    EXPECT_CALL(*decisions_, selectBuys(_, _, 2, _)).WillOnce(Return(selecting({"BBB", "AAA"})));

    scheduler_->runCycle();

    EXPECT_EQ(broker_->placedFor("BBB").size(), 1u);
    EXPECT_TRUE(broker_->placedFor("AAA").empty());

    auto trades = trades_->all();
    ASSERT_EQ(trades.size(), 1u);
    EXPECT_EQ(trades[0].status, "Unknown");
    EXPECT_EQ(research_->bySymbol("BBB")->reason,
              "Order outcome unknown (broker timeout); budget reserved");
}

TEST_F(CycleSchedulerTest, RejectedOrderIsNotCharged) {
    broker_->failPlaceOrder(true);
    EXPECT_CALL(*decisions_, selectBuys(_, _, 2, _)).WillOnce(Return(selecting({"BBB", "AAA"})));

    scheduler_->runCycle();

    EXPECT_TRUE(broker_->placedOrders().empty());
    EXPECT_TRUE(trades_->all().empty());
    EXPECT_EQ(research_->bySymbol("BBB")->decision, domain::ResearchDecision::SHORTLISTED);
    EXPECT_EQ(research_->bySymbol("BBB")->reason, "Selected by AI but order placement failed");
    // Отклонённый BBB бюджет не съел: AAA тоже получил размер и дошёл до брокера
    EXPECT_EQ(research_->bySymbol("AAA")->reason, "Selected by AI but order placement failed");
    EXPECT_TRUE(events_->contains("Order placement failed: order rejected"));
}

TEST_F(CycleSchedulerTest, CurrencyWithoutCashTagGetsNoBuy) {
    // 16:00 по Лондону: LSE открыта, в аккаунте нет TotalCashValue в GBP
    cfg_.trading.markets = {domain::Market::US, domain::Market::UK};
    cfg_.trading.screener.includeSymbols = {"CCC,UK"};
    broker_->setBars("CCC", linearBars(40, 10.0, 0.05, 0.4));
    EXPECT_CALL(*decisions_, selectBuys(_, _, _, _)).WillOnce(Return(selecting({"AAA"})));

    scheduler_->runCycle();

    EXPECT_TRUE(events_->contains("TotalCashValue not available for GBP; budget set to 0."));
    auto ccc = research_->bySymbol("CCC");
    ASSERT_TRUE(ccc.has_value());
    EXPECT_EQ(ccc->decision, domain::ResearchDecision::REJECTED);
    EXPECT_EQ(ccc->reason, "No available cash budget for GBP");
    EXPECT_TRUE(broker_->placedFor("CCC").empty());
    EXPECT_EQ(broker_->placedFor("AAA").size(), 3u);
}

TEST_F(CycleSchedulerTest, MissingNetLiquidationBlocksSizing) {
    broker_->setAccountSummary({{"TotalCashValue", 10000.0, "USD"}});
    EXPECT_CALL(*decisions_, selectBuys(_, _, _, _)).WillOnce(Return(selecting({"BBB"})));

    scheduler_->runCycle();

    EXPECT_TRUE(broker_->placedOrders().empty());
    EXPECT_EQ(research_->bySymbol("BBB")->reason,
              "Selected by AI but net liquidation not available; cannot size position");
}

// ============================================================================
// ТЕСТЫ: страховка и закрытие перед концом сессии
// ============================================================================

TEST_F(CycleSchedulerTest, ShortsAreCoveredAndForgotten) {
    clock_->set(ManualClock::utc(2024, 7, 13, 15, 0));
    broker_->addPosition("SHRT", -25, 8.0, 7.5);
    EXPECT_CALL(*review_, forgetPosition("SHRT")).Times(1);

    scheduler_->runCycle();

    auto orders = broker_->placedFor("SHRT");
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0].action, OrderAction::BUY);
    EXPECT_DOUBLE_EQ(orders[0].quantity, 25.0);
    EXPECT_FALSE(events_->withStep("Shorts").empty());
}

TEST_F(CycleSchedulerTest, LongsAreFlattenedNearClose) {
    // 15:55 по Нью-Йорку
    clock_->set(ManualClock::utc(2024, 7, 15, 19, 55));
    broker_->addPosition("HELD", 40, 5.0, 5.5);
    EXPECT_CALL(*review_, forgetPosition("HELD")).Times(1);
    EXPECT_CALL(*decisions_, selectBuys(_, _, _, _)).WillRepeatedly(Return(selecting({})));

    scheduler_->runCycle();

    auto orders = broker_->placedFor("HELD");
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0].action, OrderAction::SELL);
    EXPECT_DOUBLE_EQ(orders[0].quantity, 40.0);

    auto trades = trades_->all();
    ASSERT_EQ(trades.size(), 1u);
    EXPECT_EQ(trades[0].rationale, "Flatten before close (10m)");
}

TEST_F(CycleSchedulerTest, ReviewsAreThrottled) {
    EXPECT_CALL(*review_, reviewPositions(_, _, _)).Times(1);
    EXPECT_CALL(*decisions_, selectBuys(_, _, _, _)).WillRepeatedly(Return(selecting({})));

    scheduler_->runCycle();
    clock_->advance(std::chrono::seconds(10));
    scheduler_->runCycle();
}

// ============================================================================
// ТЕСТЫ: фон рынка и жизненный цикл
// ============================================================================

TEST_F(CycleSchedulerTest, MarketSentimentFromSpy) {
    domain::MarketSnapshot spy;
    spy.close = 100.0;
    spy.last = 101.0;
    domain::MarketSnapshot qqq;
    qqq.close = 200.0;
    qqq.last = 199.0;

    auto ctx = CycleScheduler::marketContextFrom(spy, qqq);
    EXPECT_DOUBLE_EQ(*ctx.spyChangePct, 1.0);
    EXPECT_DOUBLE_EQ(*ctx.qqqChangePct, -0.5);
    EXPECT_EQ(ctx.sentiment, "bullish");

    spy.last = 99.5;
    EXPECT_EQ(CycleScheduler::marketContextFrom(spy, qqq).sentiment, "bearish");
    EXPECT_EQ(CycleScheduler::marketContextFrom(std::nullopt, std::nullopt).sentiment, "neutral");
}

TEST_F(CycleSchedulerTest, StartAndStop) {
    clock_->set(ManualClock::utc(2024, 7, 13, 15, 0));

    scheduler_->start();
    EXPECT_TRUE(scheduler_->isRunning());
    scheduler_->stop();
    EXPECT_FALSE(scheduler_->isRunning());
}
