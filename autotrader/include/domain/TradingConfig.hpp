#pragma once

#include "enums/Market.hpp"
#include <map>
#include <string>
#include <vector>

namespace autotrader::domain {

/**
 * @brief Параметры скринера (trading.screener.*)
 */
struct ScreenerConfig {
    int maxCandidates = 250;
    std::vector<std::string> scanCodes = {
        "MOST_ACTIVE", "TOP_PERC_GAIN", "HOT_BY_VOLUME", "HIGH_VS_13W_HI"};
    bool includeRedditSymbols = false;
    std::vector<std::string> includeSymbols;
    std::vector<std::string> excludeSymbols;
};

/**
 * @brief Риск, бюджет и фильтры (trading.*)
 */
struct TradingSection {
    double maxCashUtilisation = 0.8;
    double riskPerTrade = 0.01;
    int maxPositions = 5;
    int maxNewPositionsPerCycle = 2;
    std::string cashBudgetTag = "TotalCashValue";
    std::vector<Market> markets = {Market::US};
    std::map<std::string, double> minCashReserveByCurrency;
    double maxSharePrice = 50.0;
    double minSharePrice = 1.0;
    int minAvgVolume = 500000;
    bool excludeMicrocap = true;
    double volatilityThreshold = 0.0;
    double stopAtrMultiplier = 2.0;
    double takeProfitR = 1.0;
    ScreenerConfig screener;
};

/**
 * @brief Сервис решений (ai.*)
 *
 * Пустой system prompt означает встроенный промпт по умолчанию.
 */
struct AiSection {
    std::string model = "gpt-4o-mini";
    std::string shortlistSystemPrompt;
    std::string buySelectionSystemPrompt;
    std::string positionReviewSystemPrompt;
    std::string orderReviewSystemPrompt;
};

/**
 * @brief Темп цикла и внутридневной режим (intraday.*)
 */
struct IntradaySection {
    bool enabled = true;
    int cycleIntervalSeconds = 3600;
    int cycleIntervalSecondsClosed = 1800;
    int flattenMinutesBeforeClose = 10;
    std::string barSize = "5 mins";
    std::string duration = "2 D";
    bool useRth = true;
    int symbolTimeoutSeconds = 45;
};

/**
 * @brief Ревью позиций (position_management.*)
 */
struct PositionManagementSection {
    int reviewIntervalSeconds = 60;
    int maxAdjustmentsPerPosition = 5;
    bool rotationEnabled = true;
};

struct RedditSection {
    bool enabled = false;
};

/**
 * @brief Эффективная конфигурация одного цикла
 *
 * Строится заново каждый цикл: база из config.json + оверлей из БД.
 */
struct TradingConfig {
    TradingSection trading;
    AiSection ai;
    IntradaySection intraday;
    PositionManagementSection positionManagement;
    RedditSection reddit;
};

} // namespace autotrader::domain
