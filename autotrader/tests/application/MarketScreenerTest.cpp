#include <gtest/gtest.h>

#include "application/MarketScreener.hpp"
#include "mocks/FakeBrokerGateway.hpp"

using namespace autotrader;
using namespace autotrader::application;
using autotrader::tests::FakeBrokerGateway;

// ============================================================================
// Test Fixture
// ============================================================================

class MarketScreenerTest : public ::testing::Test {
protected:
    void SetUp() override {
        broker_ = std::make_shared<FakeBrokerGateway>();
        screener_ = std::make_unique<MarketScreener>(broker_);

        cfg_.markets = {domain::Market::US};
        cfg_.screener.scanCodes = {"MOST_ACTIVE", "TOP_PERC_GAIN"};
        cfg_.screener.maxCandidates = 250;
    }

    static domain::Contract row(const std::string& symbol, const std::string& tradingClass = "NMS") {
        domain::Contract c(symbol, "SMART", "USD");
        c.tradingClass = tradingClass;
        return c;
    }

    static std::vector<std::string> symbols(const std::vector<domain::Candidate>& list) {
        std::vector<std::string> out;
        for (const auto& c : list) out.push_back(c.contract.symbol);
        return out;
    }

    std::shared_ptr<FakeBrokerGateway> broker_;
    std::unique_ptr<MarketScreener> screener_;
    domain::TradingSection cfg_;
};

// ============================================================================
// ТЕСТЫ: сканеры
// ============================================================================

TEST_F(MarketScreenerTest, MergesScansWithoutDuplicates) {
    broker_->setScanResults("MOST_ACTIVE", {row("AAA"), row("BBB")});
    broker_->setScanResults("TOP_PERC_GAIN", {row("BBB"), row("CCC")});

    auto result = screener_->candidates(cfg_);

    EXPECT_EQ(symbols(result), (std::vector<std::string>{"AAA", "BBB", "CCC"}));
    EXPECT_EQ(result[0].source, "Most Active");
    EXPECT_EQ(result[2].source, "Top Gainers");
}

TEST_F(MarketScreenerTest, ScanQueryCarriesPriceAndVolumeFilters) {
    cfg_.minSharePrice = 2.0;
    cfg_.maxSharePrice = 40.0;
    cfg_.minAvgVolume = 100000;
    cfg_.screener.scanCodes = {"HOT_BY_VOLUME"};

    screener_->candidates(cfg_);

    ASSERT_EQ(broker_->scanQueries().size(), 1u);
    const auto& q = broker_->scanQueries()[0];
    EXPECT_EQ(q.scanCode, "HOT_BY_VOLUME");
    EXPECT_EQ(q.locationCode, "STK.US.MAJOR");
    EXPECT_DOUBLE_EQ(*q.abovePrice, 2.0);
    EXPECT_DOUBLE_EQ(*q.belowPrice, 40.0);
    EXPECT_DOUBLE_EQ(*q.aboveVolume, 100000.0);
}

TEST_F(MarketScreenerTest, MicrocapsAreExcludedInUs) {
    broker_->setScanResults("MOST_ACTIVE", {row("TINY", "SCM"), row("BIG")});

    EXPECT_EQ(symbols(screener_->candidates(cfg_)), (std::vector<std::string>{"BIG"}));

    cfg_.excludeMicrocap = false;
    EXPECT_EQ(symbols(screener_->candidates(cfg_)), (std::vector<std::string>{"TINY", "BIG"}));
}

TEST_F(MarketScreenerTest, ExcludedSymbolsAreDropped) {
    cfg_.screener.excludeSymbols = {"bbb", "AAA,US"};
    broker_->setScanResults("MOST_ACTIVE", {row("AAA"), row("BBB"), row("CCC")});

    EXPECT_EQ(symbols(screener_->candidates(cfg_)), (std::vector<std::string>{"CCC"}));
}

TEST_F(MarketScreenerTest, TruncatesToMaxCandidates) {
    cfg_.screener.maxCandidates = 2;
    broker_->setScanResults("MOST_ACTIVE", {row("A1"), row("A2"), row("A3")});

    EXPECT_EQ(screener_->candidates(cfg_).size(), 2u);
}

TEST_F(MarketScreenerTest, NoMarketsMeansNoScan) {
    cfg_.markets.clear();
    EXPECT_TRUE(screener_->candidates(cfg_).empty());
    EXPECT_TRUE(broker_->scanQueries().empty());
}

TEST_F(MarketScreenerTest, UkScanUsesLseLocation) {
    cfg_.markets = {domain::Market::UK};
    cfg_.screener.scanCodes = {"MOST_ACTIVE"};
    broker_->setScanResults("MOST_ACTIVE", {row("VOD")});

    auto result = screener_->candidates(cfg_);

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(broker_->scanQueries()[0].locationCode, "STK.LSE");
    EXPECT_EQ(result[0].contract.exchange, "LSE");
    EXPECT_EQ(result[0].contract.currency, "GBP");
}

// ============================================================================
// ТЕСТЫ: ручные символы и соцсети
// ============================================================================

TEST_F(MarketScreenerTest, ManualSymbolsComeFirst) {
    cfg_.screener.includeSymbols = {" xyz ", "AAA"};
    broker_->setScanResults("MOST_ACTIVE", {row("AAA"), row("BBB")});

    auto result = screener_->candidates(cfg_);

    EXPECT_EQ(symbols(result), (std::vector<std::string>{"XYZ", "AAA", "BBB"}));
    EXPECT_EQ(result[0].source, "Manual");
    EXPECT_EQ(result[1].source, "Manual");
}

TEST_F(MarketScreenerTest, ManualSymbolForDisabledMarketIsIgnored) {
    cfg_.screener.includeSymbols = {"VOD,UK", "AAPL,US"};

    EXPECT_EQ(symbols(screener_->candidates(cfg_)), (std::vector<std::string>{"AAPL"}));
}

TEST_F(MarketScreenerTest, SocialSymbolsArePrepended) {
    std::vector<domain::Candidate> base(2);
    base[0].contract = domain::Contract("AAA", "SMART", "USD");
    base[1].contract = domain::Contract("GME", "SMART", "USD");

    auto merged = MarketScreener::mergeSocial({"gme", "AMC", "GME"}, base);

    EXPECT_EQ(symbols(merged), (std::vector<std::string>{"GME", "AMC", "AAA"}));
    EXPECT_EQ(merged[0].source, "reddit");
}

TEST_F(MarketScreenerTest, LabelsForKnownCodes) {
    EXPECT_EQ(MarketScreener::label("HIGH_VS_13W_HI"), "Near 13-Week High");
    EXPECT_EQ(MarketScreener::label("CUSTOM"), "CUSTOM");
}
