#include <gtest/gtest.h>

#include "application/RiskAllocator.hpp"

#include <limits>

using namespace autotrader;
using namespace autotrader::application;

// ============================================================================
// Test Fixture
// ============================================================================

class RiskAllocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg_.cashBudgetTag = "TotalCashValue";
        cfg_.maxCashUtilisation = 0.8;
        cfg_.minCashReserveByCurrency["USD"] = 500.0;
    }

    domain::AccountSummaryItem item(const std::string& tag, double value, const std::string& currency) {
        domain::AccountSummaryItem i;
        i.tag = tag;
        i.value = value;
        i.currency = currency;
        return i;
    }

    domain::TradingSection cfg_;
};

// ============================================================================
// ТЕСТЫ: бюджет
// ============================================================================

TEST_F(RiskAllocatorTest, BudgetIsUtilisationShareWhenReserveIsSmall) {
    std::vector<domain::AccountSummaryItem> summary = {item("TotalCashValue", 10000.0, "USD")};
    auto r = RiskAllocator::budgetFor(summary, cfg_, "USD");
    EXPECT_DOUBLE_EQ(r.budget, 8000.0);
}

TEST_F(RiskAllocatorTest, ReserveCapsBudget) {
    std::vector<domain::AccountSummaryItem> summary = {item("TotalCashValue", 1000.0, "USD")};
    auto r = RiskAllocator::budgetFor(summary, cfg_, "USD");
    EXPECT_DOUBLE_EQ(r.budget, 500.0);
}

TEST_F(RiskAllocatorTest, BudgetNeverNegative) {
    std::vector<domain::AccountSummaryItem> summary = {item("TotalCashValue", 200.0, "USD")};
    auto r = RiskAllocator::budgetFor(summary, cfg_, "USD");
    EXPECT_DOUBLE_EQ(r.budget, 0.0);
}

TEST_F(RiskAllocatorTest, MissingTagGivesZeroBudgetWithMessage) {
    std::vector<domain::AccountSummaryItem> summary = {item("TotalCashValue", 1000.0, "USD")};
    auto r = RiskAllocator::budgetFor(summary, cfg_, "GBP");
    EXPECT_DOUBLE_EQ(r.budget, 0.0);
    EXPECT_FALSE(r.available.has_value());
    EXPECT_EQ(r.message, "TotalCashValue not available for GBP; budget set to 0.");
}

TEST_F(RiskAllocatorTest, AllocateReportsEveryCurrency) {
    std::vector<domain::AccountSummaryItem> summary = {item("TotalCashValue", 10000.0, "USD")};
    std::vector<std::string> infos;
    std::vector<std::string> errors;

    auto ledger = RiskAllocator::allocate(
        summary, cfg_, {"GBP", "USD"},
        [&](const std::string&, const std::string& msg) { infos.push_back(msg); },
        [&](const std::string&, const std::string& msg) { errors.push_back(msg); });

    EXPECT_DOUBLE_EQ(ledger.remaining("USD"), 8000.0);
    EXPECT_TRUE(ledger.has("GBP"));
    EXPECT_DOUBLE_EQ(ledger.remaining("GBP"), 0.0);
    ASSERT_EQ(infos.size(), 1u);
    EXPECT_EQ(infos[0], "Budget for USD: 8000.00 (available 10000.00)");
    ASSERT_EQ(errors.size(), 1u);
}

TEST_F(RiskAllocatorTest, NetLiquidationPrefersBase) {
    std::vector<domain::AccountSummaryItem> summary = {
        item("NetLiquidation", 900.0, "USD"),
        item("NetLiquidation", 1000.0, "BASE")};
    EXPECT_DOUBLE_EQ(*RiskAllocator::netLiquidation(summary), 1000.0);

    summary.pop_back();
    EXPECT_DOUBLE_EQ(*RiskAllocator::netLiquidation(summary), 900.0);
    EXPECT_FALSE(RiskAllocator::netLiquidation({}).has_value());
}

// ============================================================================
// ТЕСТЫ: уровни и размер
// ============================================================================

TEST_F(RiskAllocatorTest, StopAndTakeProfitFromAtr) {
    auto stop = RiskAllocator::stopLoss(100.0, 2.0, 1.5);
    ASSERT_TRUE(stop.has_value());
    EXPECT_DOUBLE_EQ(*stop, 97.0);
    EXPECT_DOUBLE_EQ(RiskAllocator::takeProfit(100.0, *stop, 2.0), 106.0);
}

TEST_F(RiskAllocatorTest, NoStopWithoutAtr) {
    EXPECT_FALSE(RiskAllocator::stopLoss(100.0, std::nullopt, 1.5).has_value());
}

TEST_F(RiskAllocatorTest, PositionSizeByRisk) {
    // 100000 * 0.01 / 3 = 333.33
    EXPECT_EQ(RiskAllocator::positionSize(100000.0, 0.01, 100.0, 97.0), 333);
    EXPECT_EQ(RiskAllocator::positionSize(100000.0, 0.01, 100.0, 100.0), 0);
}

TEST_F(RiskAllocatorTest, SizeCappedByRemainingBudget) {
    EXPECT_EQ(RiskAllocator::sizeWithinBudget(100000.0, 0.01, 100.0, 97.0, 5000.0), 50);
    EXPECT_EQ(RiskAllocator::sizeWithinBudget(100000.0, 0.01, 100.0, 97.0, 50.0), 0);
    EXPECT_EQ(RiskAllocator::sizeWithinBudget(100000.0, 0.01, 0.0, 97.0, 5000.0), 0);
}

TEST_F(RiskAllocatorTest, HugeSizeIsClampedToIntRange) {
    constexpr int kMax = std::numeric_limits<int>::max();
    // риск на акцию 1e-6: 1e12 * 0.01 / 1e-6 далеко за пределами int
    EXPECT_EQ(RiskAllocator::positionSize(1e12, 0.01, 10.0, 10.0 - 1e-6), kMax);
    EXPECT_EQ(RiskAllocator::sizeWithinBudget(1e12, 0.01, 0.001, 0.001 - 1e-9, 1e15), kMax);
    EXPECT_EQ(RiskAllocator::sizeWithinBudget(1e12, 0.01, 10.0, 10.0 - 1e-6, 1000.0), 100);
}

TEST_F(RiskAllocatorTest, CapacityIsBoundedByBothLimits) {
    EXPECT_EQ(RiskAllocator::capacity(5, 2, 2), 2);
    EXPECT_EQ(RiskAllocator::capacity(5, 4, 2), 1);
    EXPECT_EQ(RiskAllocator::capacity(5, 7, 2), 0);
}
