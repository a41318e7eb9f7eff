#include <gtest/gtest.h>
#include "adapters/secondary/broker/PriceSimulator.hpp"

using namespace autotrader::adapters::secondary;

class PriceSimulatorTest : public ::testing::Test {
protected:
    // Фиксированный seed для детерминированных тестов
    PriceSimulator simulator{42};
};

// ================================================================
// INITIALIZATION
// ================================================================

TEST_F(PriceSimulatorTest, InitInstrument_Basic) {
    simulator.initInstrument("AAPL", 190.0, 0.001, 0.002);

    EXPECT_TRUE(simulator.hasInstrument("AAPL"));
    EXPECT_DOUBLE_EQ(simulator.getPrice("AAPL"), 190.0);
    EXPECT_EQ(simulator.size(), 1u);
}

TEST_F(PriceSimulatorTest, UnknownInstrument) {
    EXPECT_FALSE(simulator.hasInstrument("UNKNOWN"));
    EXPECT_FALSE(simulator.getQuote("UNKNOWN").has_value());
    EXPECT_DOUBLE_EQ(simulator.tick("UNKNOWN"), 0.0);
    EXPECT_FALSE(simulator.setPrice("UNKNOWN", 1.0));
    EXPECT_TRUE(simulator.history("UNKNOWN", 10, 5).empty());
}

// ================================================================
// QUOTES
// ================================================================

TEST_F(PriceSimulatorTest, GetQuote_BidAskSpread) {
    simulator.initInstrument("AAPL", 200.0, 0.01, 0.002);  // 1% спред

    auto quote = simulator.getQuote("AAPL");
    ASSERT_TRUE(quote.has_value());

    EXPECT_NEAR(quote->bid, 199.0, 1e-9);
    EXPECT_NEAR(quote->ask, 201.0, 1e-9);
    EXPECT_DOUBLE_EQ(quote->last, 200.0);
    EXPECT_DOUBLE_EQ(quote->mid(), 200.0);
}

TEST_F(PriceSimulatorTest, ChangePercentAgainstSessionOpen) {
    simulator.initInstrument("AAPL", 200.0);
    simulator.setPrice("AAPL", 210.0);

    EXPECT_NEAR(simulator.getQuote("AAPL")->changePercent(), 5.0, 1e-9);

    simulator.rollSession();
    EXPECT_NEAR(simulator.getQuote("AAPL")->changePercent(), 0.0, 1e-9);
    EXPECT_EQ(simulator.getQuote("AAPL")->volume, 0);
}

// ================================================================
// PRICE MOVES
// ================================================================

TEST_F(PriceSimulatorTest, TickStaysPositive) {
    simulator.initInstrument("PENNY", 0.02, 0.001, 0.5);

    for (int i = 0; i < 200; ++i) {
        EXPECT_GE(simulator.tick("PENNY"), 0.01);
    }
}

TEST_F(PriceSimulatorTest, TickAccumulatesVolume) {
    simulator.initInstrument("AAPL", 190.0, 0.001, 0.002, 1000000);

    simulator.tick("AAPL");
    simulator.tick("AAPL");

    EXPECT_EQ(simulator.getQuote("AAPL")->volume, 2000);
}

TEST_F(PriceSimulatorTest, MovePricePercent) {
    simulator.initInstrument("AAPL", 100.0);

    EXPECT_NEAR(simulator.movePricePercent("AAPL", -5.0), 95.0, 1e-9);
    EXPECT_NEAR(simulator.getPrice("AAPL"), 95.0, 1e-9);
}

TEST_F(PriceSimulatorTest, SymbolsAreSorted) {
    simulator.initInstrument("MSFT", 400.0);
    simulator.initInstrument("AAPL", 190.0);

    auto symbols = simulator.symbols();
    ASSERT_EQ(symbols.size(), 2u);
    EXPECT_EQ(symbols[0], "AAPL");
    EXPECT_EQ(symbols[1], "MSFT");
}

// ================================================================
// HISTORY
// ================================================================

TEST_F(PriceSimulatorTest, HistoryEndsAtCurrentPrice) {
    simulator.initInstrument("AAPL", 190.0);

    auto bars = simulator.history("AAPL", 50, 5);

    ASSERT_EQ(bars.size(), 50u);
    EXPECT_DOUBLE_EQ(bars.back().close, 190.0);
    for (const auto& bar : bars) {
        EXPECT_GE(bar.high, std::max(bar.open, bar.close));
        EXPECT_LE(bar.low, std::min(bar.open, bar.close));
        EXPECT_GT(bar.low, 0.0);
        EXPECT_EQ(bar.time.size(), 19u);
    }
}

TEST_F(PriceSimulatorTest, HistoryTimesAreOrdered) {
    simulator.initInstrument("AAPL", 190.0);

    auto bars = simulator.history("AAPL", 3, 60);

    ASSERT_EQ(bars.size(), 3u);
    EXPECT_LT(bars[0].time, bars[1].time);
    EXPECT_LT(bars[1].time, bars[2].time);
}
