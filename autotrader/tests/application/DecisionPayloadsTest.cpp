#include <gtest/gtest.h>

#include "application/DecisionPayloads.hpp"

using namespace autotrader;
using namespace autotrader::application;
using json = nlohmann::json;

// ============================================================================
// Test Fixture
// ============================================================================

class DecisionPayloadsTest : public ::testing::Test {
protected:
    void SetUp() override {
        contract_ = domain::Contract("ABC", "SMART", "USD");
        market_.spyChangePct = 0.456;
        market_.sentiment = "bullish";
    }

    domain::Contract contract_;
    domain::MarketContext market_;
    domain::TradingConfig cfg_;
};

// ============================================================================
// ТЕСТЫ: шорт-лист
// ============================================================================

TEST_F(DecisionPayloadsTest, ShortlistPassesMissingValuesAsNull) {
    domain::Signals signals;
    signals.price = 12.346;

    json p = DecisionPayloads::shortlist(contract_, signals, {"Earnings beat"}, std::nullopt,
                                         std::nullopt, market_, cfg_);

    EXPECT_EQ(p["symbol"], "ABC");
    EXPECT_DOUBLE_EQ(p["price"].get<double>(), 12.35);
    EXPECT_TRUE(p["indicators"]["rsi_14"].is_null());
    EXPECT_TRUE(p["bar_momentum"].is_null());
    EXPECT_TRUE(p["reddit"].is_null());
    EXPECT_TRUE(p["fundamentals"].is_object());
    EXPECT_TRUE(p["fundamentals"].empty());
    EXPECT_EQ(p["news_headlines"].size(), 1u);
    EXPECT_DOUBLE_EQ(p["market_context"]["spy_change_pct"].get<double>(), 0.46);
    EXPECT_TRUE(p["market_context"]["qqq_change_pct"].is_null());
    EXPECT_EQ(p["intraday"]["bar_size"], "5 mins");
}

TEST_F(DecisionPayloadsTest, FundamentalsIncludeRelativeVolume) {
    domain::MarketSnapshot snap;
    snap.volume = 3000.0;
    snap.avgVolume = 1000.0;
    snap.bid = 9.9;
    snap.ask = 10.1;

    json p = DecisionPayloads::shortlist(contract_, domain::Signals{}, {}, std::nullopt, snap, market_, cfg_);

    EXPECT_DOUBLE_EQ(p["fundamentals"]["relative_volume"].get<double>(), 3.0);
    EXPECT_DOUBLE_EQ(p["fundamentals"]["spread_pct"].get<double>(), 2.0);
    EXPECT_TRUE(p["fundamentals"]["last"].is_null());
}

TEST_F(DecisionPayloadsTest, SocialWithoutScoreIsNull) {
    domain::SocialSentiment social;
    social.mentions = 12;

    json p = DecisionPayloads::shortlist(contract_, domain::Signals{}, {}, social, std::nullopt, market_, cfg_);
    EXPECT_TRUE(p["reddit"].is_null());

    social.sentiment = 0.4;
    social.confidence = 0.8;
    p = DecisionPayloads::shortlist(contract_, domain::Signals{}, {}, social, std::nullopt, market_, cfg_);
    EXPECT_EQ(p["reddit"]["mentions"], 12);
}

// ============================================================================
// ТЕСТЫ: выбор покупок и ревью
// ============================================================================

TEST_F(DecisionPayloadsTest, SelectionCarriesBudgetsAndRank) {
    domain::EligibleCandidate e;
    e.qualified = contract_;
    e.decision.decision = "SHORTLIST";
    e.decision.score = 0.8;
    e.rank = 1;

    domain::BudgetLedger budgets;
    budgets.set("USD", 1234.567);

    json p = DecisionPayloads::selection({e}, 2, budgets, market_);

    EXPECT_EQ(p["max_new"], 2);
    EXPECT_DOUBLE_EQ(p["budget_remaining"]["USD"].get<double>(), 1234.57);
    ASSERT_EQ(p["candidates"].size(), 1u);
    EXPECT_EQ(p["candidates"][0]["rank"], 1);
    EXPECT_EQ(p["candidates"][0]["ai"]["decision"], "SHORTLIST");
}

TEST_F(DecisionPayloadsTest, PositionReviewWithoutSignals) {
    PositionReviewInput in;
    in.contract = contract_;
    in.entryPrice = 10.0;
    in.currentPrice = 11.0;
    in.quantity = 50;
    in.pnlPct = 10.0;
    in.adjustmentCount = 2;

    json p = DecisionPayloads::positionReview(in, market_, cfg_);

    EXPECT_EQ(p["adjustments_so_far"], 2);
    EXPECT_TRUE(p["indicators"].is_object());
    EXPECT_TRUE(p["bar_momentum"].is_null());
    EXPECT_TRUE(p["fundamentals"].is_null());
    EXPECT_TRUE(p["top_candidates"].is_null());
    EXPECT_TRUE(p["current_stop_loss"].is_null());
}

TEST_F(DecisionPayloadsTest, OrderReviewUsesTriggerPrice) {
    domain::OpenOrder order;
    order.orderId = 42;
    order.contract = contract_;
    order.action = domain::OrderAction::SELL;
    order.orderType = domain::OrderType::STP;
    order.totalQuantity = 10;
    order.auxPrice = 9.5;

    json p = DecisionPayloads::orderReview(order, std::nullopt, std::nullopt, 15, market_);

    EXPECT_EQ(p["order_id"], 42);
    EXPECT_EQ(p["type"], "STP");
    EXPECT_DOUBLE_EQ(p["order_price"].get<double>(), 9.5);
    EXPECT_EQ(p["age_minutes"], 15);
    EXPECT_TRUE(p["current_price"].is_null());
}
