#pragma once

#include <optional>
#include <string>

namespace autotrader::domain {

/**
 * @brief Общий фон рынка по SPY и QQQ
 */
struct MarketContext {
    std::optional<double> spyChangePct;
    std::optional<double> qqqChangePct;
    std::string sentiment = "unknown";   ///< bullish | bearish | neutral | unknown
};

/**
 * @brief Последняя оценка обсуждений символа в соцсетях
 */
struct SocialSentiment {
    std::string symbol;
    int mentions = 0;
    std::optional<double> sentiment;
    std::optional<double> confidence;
    std::string rationale;
    long long sourceFetchUtc = 0;
};

} // namespace autotrader::domain
