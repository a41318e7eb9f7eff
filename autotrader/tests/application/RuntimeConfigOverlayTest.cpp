#include <gtest/gtest.h>

#include "application/RuntimeConfigOverlay.hpp"

#include <limits>

using namespace autotrader;
using namespace autotrader::application;
using json = nlohmann::json;

// ============================================================================
// Test Fixture
// ============================================================================

class RuntimeConfigOverlayTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_.trading.maxPositions = 5;
        base_.trading.riskPerTrade = 0.01;
        base_.ai.model = "gpt-4o-mini";
    }

    json docWith(json overrides, json strategies, json active = "Default") {
        return json{
            {"schema_version", 1},
            {"overrides", std::move(overrides)},
            {"strategies", std::move(strategies)},
            {"active_strategy", std::move(active)}};
    }

    json defaultStrategy() {
        return json::array({json{{"name", "Default"}, {"overrides", json::object()}}});
    }

    domain::TradingConfig base_;
};

// ============================================================================
// ТЕСТЫ: нормализация
// ============================================================================

TEST_F(RuntimeConfigOverlayTest, NullDocumentBecomesDefault) {
    json doc = RuntimeConfigOverlay::normalise(json());
    EXPECT_EQ(doc, domain::defaultRuntimeConfigDocument());
}

TEST_F(RuntimeConfigOverlayTest, NonObjectIsRejected) {
    EXPECT_THROW(RuntimeConfigOverlay::normalise(json::array()), domain::RuntimeConfigError);
}

TEST_F(RuntimeConfigOverlayTest, MissingSectionsAreFilled) {
    json doc = RuntimeConfigOverlay::normalise(json::object());
    EXPECT_EQ(doc["schema_version"], 1);
    EXPECT_TRUE(doc["overrides"].is_object());
    ASSERT_EQ(doc["strategies"].size(), 1u);
    EXPECT_EQ(doc["active_strategy"], "Default");
}

TEST_F(RuntimeConfigOverlayTest, LegacyPromptKeyIsMigrated) {
    json doc = json{{"overrides", {{"ai", {{"trade_decision_system_prompt", "legacy"},
                                           {"sentiment_threshold", 0.5}}}}}};
    json out = RuntimeConfigOverlay::normalise(doc);

    EXPECT_EQ(out["overrides"]["ai"]["shortlist_system_prompt"], "legacy");
    EXPECT_FALSE(out["overrides"]["ai"].contains("trade_decision_system_prompt"));
    EXPECT_FALSE(out["overrides"]["ai"].contains("sentiment_threshold"));
}

// ============================================================================
// ТЕСТЫ: валидация
// ============================================================================

TEST_F(RuntimeConfigOverlayTest, UnknownKeyIsRejected) {
    json doc = docWith(json{{"trading", {{"leverage", 2}}}}, defaultStrategy());
    try {
        RuntimeConfigOverlay::validate(doc);
        FAIL() << "Expected RuntimeConfigError";
    } catch (const domain::RuntimeConfigError& e) {
        EXPECT_EQ(std::string(e.what()), "Unsupported override key: trading.leverage");
    }
}

TEST_F(RuntimeConfigOverlayTest, OutOfRangeFractionIsRejected) {
    json doc = docWith(json{{"trading", {{"risk_per_trade", 1.5}}}}, defaultStrategy());
    EXPECT_THROW(RuntimeConfigOverlay::validate(doc), domain::RuntimeConfigError);
}

TEST_F(RuntimeConfigOverlayTest, WrongSchemaVersionIsRejected) {
    json doc = domain::defaultRuntimeConfigDocument();
    doc["schema_version"] = 2;
    EXPECT_THROW(RuntimeConfigOverlay::validate(doc), domain::RuntimeConfigError);
}

TEST_F(RuntimeConfigOverlayTest, DuplicateStrategyNamesAreRejected) {
    json strategies = json::array({json{{"name", "A"}}, json{{"name", " A "}}});
    EXPECT_THROW(RuntimeConfigOverlay::validate(docWith(json::object(), strategies, "A")),
                 domain::RuntimeConfigError);
}

TEST_F(RuntimeConfigOverlayTest, UnknownActiveStrategyIsRejected) {
    EXPECT_THROW(RuntimeConfigOverlay::validate(docWith(json::object(), defaultStrategy(), "Aggressive")),
                 domain::RuntimeConfigError);
}

TEST_F(RuntimeConfigOverlayTest, NullActiveStrategyIsAllowed) {
    EXPECT_NO_THROW(RuntimeConfigOverlay::validate(docWith(json::object(), defaultStrategy(), json())));
}

TEST_F(RuntimeConfigOverlayTest, UnsupportedMarketIsRejected) {
    json doc = docWith(json{{"trading", {{"markets", {"US", "JP"}}}}}, defaultStrategy());
    EXPECT_THROW(RuntimeConfigOverlay::validate(doc), domain::RuntimeConfigError);
}

TEST_F(RuntimeConfigOverlayTest, NegativeReserveIsRejected) {
    json doc = docWith(json{{"trading", {{"min_cash_reserve_by_currency", {{"USD", -1}}}}}}, defaultStrategy());
    EXPECT_THROW(RuntimeConfigOverlay::validate(doc), domain::RuntimeConfigError);
}

TEST_F(RuntimeConfigOverlayTest, IntegerBeyondIntRangeIsRejected) {
    json doc = docWith(json{{"trading", {{"max_positions", 4294967296LL}}},
                            {"intraday", {{"cycle_interval_seconds", 4294967297LL}}}},
                       defaultStrategy());

    EXPECT_THROW(RuntimeConfigOverlay::validate(doc), domain::RuntimeConfigError);
    EXPECT_THROW(RuntimeConfigOverlay::apply(base_, doc), domain::RuntimeConfigError);
    EXPECT_EQ(base_.trading.maxPositions, 5);
}

TEST_F(RuntimeConfigOverlayTest, IntegerAtIntMaxIsAccepted) {
    json doc = docWith(json{{"intraday", {{"cycle_interval_seconds", std::numeric_limits<int>::max()}}}},
                       defaultStrategy());

    auto cfg = RuntimeConfigOverlay::apply(base_, doc);
    EXPECT_EQ(cfg.intraday.cycleIntervalSeconds, std::numeric_limits<int>::max());
}

TEST_F(RuntimeConfigOverlayTest, HugeUnsignedIntegerIsRejected) {
    json doc = docWith(json{{"trading", {{"max_new_positions_per_cycle", 18446744073709551615ULL}}}},
                       defaultStrategy());
    EXPECT_THROW(RuntimeConfigOverlay::validate(doc), domain::RuntimeConfigError);
}

// ============================================================================
// ТЕСТЫ: применение
// ============================================================================

TEST_F(RuntimeConfigOverlayTest, StrategyOverridesWinOverGlobal) {
    json strategies = json::array({
        json{{"name", "Default"}, {"overrides", json::object()}},
        json{{"name", "Aggressive"}, {"overrides", {{"trading", {{"max_positions", 8}}}}}}});
    json doc = docWith(json{{"trading", {{"max_positions", 3}, {"risk_per_trade", 0.02}}}},
                       strategies, "Aggressive");

    auto cfg = RuntimeConfigOverlay::apply(base_, doc);

    EXPECT_EQ(cfg.trading.maxPositions, 8);
    EXPECT_DOUBLE_EQ(cfg.trading.riskPerTrade, 0.02);
    EXPECT_EQ(cfg.ai.model, "gpt-4o-mini");
}

TEST_F(RuntimeConfigOverlayTest, InactiveStrategyIsIgnored) {
    json strategies = json::array({
        json{{"name", "Default"}, {"overrides", json::object()}},
        json{{"name", "Aggressive"}, {"overrides", {{"trading", {{"max_positions", 8}}}}}}});

    auto cfg = RuntimeConfigOverlay::apply(base_, docWith(json::object(), strategies, "Default"));
    EXPECT_EQ(cfg.trading.maxPositions, 5);
}

TEST_F(RuntimeConfigOverlayTest, ReserveMapIsOneLeaf) {
    json doc = docWith(json{{"trading", {{"min_cash_reserve_by_currency", {{"USD", 250}, {"GBP", 100}}}}}},
                       defaultStrategy());
    auto cfg = RuntimeConfigOverlay::apply(base_, doc);

    ASSERT_EQ(cfg.trading.minCashReserveByCurrency.size(), 2u);
    EXPECT_DOUBLE_EQ(cfg.trading.minCashReserveByCurrency.at("USD"), 250.0);
}

TEST_F(RuntimeConfigOverlayTest, MarketsAreUpperCasedAndDeduplicated) {
    json doc = docWith(json{{"trading", {{"markets", {"us", "UK", "US"}}}}}, defaultStrategy());
    auto cfg = RuntimeConfigOverlay::apply(base_, doc);

    ASSERT_EQ(cfg.trading.markets.size(), 2u);
    EXPECT_EQ(cfg.trading.markets[0], domain::Market::US);
    EXPECT_EQ(cfg.trading.markets[1], domain::Market::UK);
}

TEST_F(RuntimeConfigOverlayTest, InvalidDocumentAppliesNothing) {
    json doc = docWith(json{{"trading", {{"max_positions", 9}, {"bogus", 1}}}}, defaultStrategy());
    EXPECT_THROW(RuntimeConfigOverlay::apply(base_, doc), domain::RuntimeConfigError);
    EXPECT_EQ(base_.trading.maxPositions, 5);
}

TEST_F(RuntimeConfigOverlayTest, FlattenProducesDottedPaths) {
    auto flat = RuntimeConfigOverlay::flatten(json{{"intraday", {{"enabled", false}}}, {"ai", {{"model", "x"}}}});
    ASSERT_EQ(flat.size(), 2u);
    EXPECT_EQ(flat[0].first, "ai.model");
    EXPECT_EQ(flat[1].first, "intraday.enabled");
    EXPECT_TRUE(RuntimeConfigOverlay::isAllowedKey("intraday.flatten_minutes_before_close"));
    EXPECT_FALSE(RuntimeConfigOverlay::isAllowedKey("intraday.bar_size"));
}
