#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/CandidateResearcher.hpp"
#include "mocks/BarFactory.hpp"
#include "mocks/FakeBrokerGateway.hpp"
#include "mocks/InMemoryRepositories.hpp"
#include "mocks/ManualClock.hpp"
#include "mocks/MockDecisionService.hpp"

#include <thread>

using namespace autotrader;
using namespace autotrader::application;
using namespace autotrader::tests;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

// ============================================================================
// Test Fixture
// ============================================================================

class CandidateResearcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        broker_ = std::make_shared<FakeBrokerGateway>();
        decisions_ = std::make_shared<NiceMock<MockDecisionService>>();
        social_ = std::make_shared<FakeSocialSentimentSource>();
        research_ = std::make_shared<InMemoryResearchRepository>();
        events_ = std::make_shared<InMemoryEventLog>();
        status_ = std::make_shared<InMemoryLiveStatus>();
        // Понедельник, 11:00 по Нью-Йорку
        clock_ = std::make_shared<ManualClock>(ManualClock::utc(2024, 7, 15, 15, 0));
        pool_ = std::make_shared<common::WorkerPool>(2);

        researcher_ = std::make_unique<CandidateResearcher>(
            broker_, decisions_, social_, research_, events_, status_, clock_, pool_);

        ctx_.budgets.set("USD", 5000.0);
        ctx_.symbolTimeout = std::chrono::seconds(5);
    }

    void TearDown() override {
        pool_->stop();
    }

    domain::Candidate candidate(const std::string& symbol) {
        domain::Candidate c;
        c.contract = domain::Contract(symbol, "SMART", "USD");
        c.source = "Most Active";
        broker_->setBars(symbol, linearBars(40, 10.0, 0.05));
        return c;
    }

    static domain::ShortlistDecision decision(const std::string& verdict, double score = 0.7) {
        domain::ShortlistDecision d;
        d.decision = verdict;
        d.confidence = 0.75;
        d.score = score;
        d.sentiment = 0.3;
        d.rationale = "momentum";
        return d;
    }

    std::shared_ptr<FakeBrokerGateway> broker_;
    std::shared_ptr<NiceMock<MockDecisionService>> decisions_;
    std::shared_ptr<FakeSocialSentimentSource> social_;
    std::shared_ptr<InMemoryResearchRepository> research_;
    std::shared_ptr<InMemoryEventLog> events_;
    std::shared_ptr<InMemoryLiveStatus> status_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<common::WorkerPool> pool_;
    std::unique_ptr<CandidateResearcher> researcher_;
    CandidateResearcher::Context ctx_;
};

// ============================================================================
// ТЕСТЫ: исходы
// ============================================================================

TEST_F(CandidateResearcherTest, ShortlistedCandidateIsEligible) {
    EXPECT_CALL(*decisions_, shortlist(_, _)).WillOnce(Return(decision("SHORTLIST")));

    auto outcomes = researcher_->researchAll({candidate("ABC")}, ctx_);

    ASSERT_EQ(outcomes.size(), 1u);
    ASSERT_TRUE(outcomes[0].eligible.has_value());
    EXPECT_EQ(outcomes[0].record.decision, domain::ResearchDecision::SHORTLISTED);
    EXPECT_NE(outcomes[0].record.reason.find("SHORTLIST (conf 0.75)"), std::string::npos);
    EXPECT_DOUBLE_EQ(*outcomes[0].record.score, 0.7);
    EXPECT_TRUE(outcomes[0].record.price.has_value());
    EXPECT_TRUE(outcomes[0].record.rsi.has_value());

    auto stored = research_->bySymbol("ABC");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(outcomes[0].eligible->researchId, stored->id);
}

TEST_F(CandidateResearcherTest, SkipIsRejected) {
    EXPECT_CALL(*decisions_, shortlist(_, _)).WillOnce(Return(decision("SKIP")));

    auto outcomes = researcher_->researchAll({candidate("ABC")}, ctx_);

    EXPECT_FALSE(outcomes[0].eligible.has_value());
    EXPECT_EQ(outcomes[0].record.decision, domain::ResearchDecision::REJECTED);
    EXPECT_NE(outcomes[0].record.reason.find("SKIP"), std::string::npos);
}

TEST_F(CandidateResearcherTest, UnqualifiedContractIsRejectedWithoutAi) {
    EXPECT_CALL(*decisions_, shortlist(_, _)).Times(0);
    auto c = candidate("BAD");
    broker_->setUnqualifiable("BAD");

    auto outcomes = researcher_->researchAll({c}, ctx_);

    EXPECT_EQ(outcomes[0].record.reason, "Contract could not be qualified");
    EXPECT_EQ(research_->all().size(), 1u);
}

TEST_F(CandidateResearcherTest, NoBarsMeansNoMarketData) {
    EXPECT_CALL(*decisions_, shortlist(_, _)).Times(0);
    auto c = candidate("ABC");
    broker_->setBars("ABC", {});

    auto outcomes = researcher_->researchAll({c}, ctx_);

    EXPECT_EQ(outcomes[0].record.reason, "No market data");
}

TEST_F(CandidateResearcherTest, DecisionErrorIsRecorded) {
    EXPECT_CALL(*decisions_, shortlist(_, _)).WillOnce(Throw(domain::DecisionError("bad json")));

    auto outcomes = researcher_->researchAll({candidate("ABC")}, ctx_);

    EXPECT_EQ(outcomes[0].record.decision, domain::ResearchDecision::REJECTED);
    EXPECT_EQ(outcomes[0].record.reason, "Error during analysis: DecisionError: bad json");
    EXPECT_TRUE(events_->contains("Unexpected error: DecisionError"));
}

TEST_F(CandidateResearcherTest, EveryCandidateGetsOneRow) {
    EXPECT_CALL(*decisions_, shortlist(_, _)).WillRepeatedly(Return(decision("SKIP")));

    auto outcomes = researcher_->researchAll({candidate("A1"), candidate("A2"), candidate("A3")}, ctx_);

    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_EQ(outcomes[0].record.symbol, "A1");
    EXPECT_EQ(outcomes[2].record.symbol, "A3");
    EXPECT_EQ(research_->all().size(), 3u);
    EXPECT_EQ(events_->withStep("Decision").size(), 3u);
}

// ============================================================================
// ТЕСТЫ: жёсткие фильтры
// ============================================================================

TEST_F(CandidateResearcherTest, HeldSymbolIsRejected) {
    EXPECT_CALL(*decisions_, shortlist(_, _)).WillOnce(Return(decision("SHORTLIST")));
    ctx_.openSymbols = {"ABC"};

    auto outcomes = researcher_->researchAll({candidate("ABC")}, ctx_);

    EXPECT_FALSE(outcomes[0].eligible.has_value());
    EXPECT_EQ(outcomes[0].record.reason, "Already holding a position");
}

TEST_F(CandidateResearcherTest, EmptyBudgetIsRejected) {
    EXPECT_CALL(*decisions_, shortlist(_, _)).WillOnce(Return(decision("SHORTLIST")));
    ctx_.budgets.set("USD", 0.0);

    auto outcomes = researcher_->researchAll({candidate("ABC")}, ctx_);

    EXPECT_EQ(outcomes[0].record.reason, "No available cash budget for USD");
}

TEST_F(CandidateResearcherTest, ClosedMarketIsRejected) {
    clock_->set(ManualClock::utc(2024, 7, 13, 15, 0));
    EXPECT_CALL(*decisions_, shortlist(_, _)).WillOnce(Return(decision("SHORTLIST")));

    auto outcomes = researcher_->researchAll({candidate("ABC")}, ctx_);

    EXPECT_EQ(outcomes[0].record.reason.rfind("Market closed: ", 0), 0u);
}

TEST_F(CandidateResearcherTest, NearCloseBlocksNewEntries) {
    // 15:55 по Нью-Йорку, окно 10 минут
    clock_->set(ManualClock::utc(2024, 7, 15, 19, 55));
    EXPECT_CALL(*decisions_, shortlist(_, _)).WillOnce(Return(decision("SHORTLIST")));

    auto outcomes = researcher_->researchAll({candidate("ABC")}, ctx_);

    EXPECT_EQ(outcomes[0].record.reason, "Too close to market close (no new entries)");
}

// ============================================================================
// ТЕСТЫ: лимит времени
// ============================================================================

TEST_F(CandidateResearcherTest, SlowSymbolTimesOut) {
    ctx_.symbolTimeout = std::chrono::milliseconds(100);
    EXPECT_CALL(*decisions_, shortlist(_, _))
        .WillOnce(Invoke([](const nlohmann::json&, const domain::AiSection&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(400));
            return decision("SHORTLIST");
        }));

    auto outcomes = researcher_->researchAll({candidate("SLOW")}, ctx_);

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_FALSE(outcomes[0].eligible.has_value());
    EXPECT_EQ(outcomes[0].record.reason, "Symbol processing timed out: processing exceeded 100ms");
    EXPECT_FALSE(events_->withStep("Timeout").empty());

    pool_->stop();
}
