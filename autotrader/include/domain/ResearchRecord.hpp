#pragma once

#include "Timestamp.hpp"
#include "enums/ResearchDecision.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace autotrader::domain {

/**
 * @brief Строка research_log: ровно одна на кандидата за цикл
 */
struct ResearchRecord {
    int64_t id = 0;
    Timestamp timestamp;
    std::string symbol;
    std::string exchange;
    std::string currency;
    std::optional<double> price;
    std::optional<double> rsi;
    std::optional<double> volatilityRatio;
    std::optional<double> sentimentScore;
    std::string aiReasoning;
    std::optional<double> score;
    std::optional<int> rank;
    std::optional<int> redditMentions;
    std::optional<double> redditSentiment;
    std::optional<double> redditConfidence;
    ResearchDecision decision = ResearchDecision::REJECTED;
    std::string reason = "Uninitialised";
};

} // namespace autotrader::domain
