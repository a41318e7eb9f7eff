#pragma once

#include <string>

namespace autotrader::domain {

/**
 * @brief Итог обработки кандидата за цикл (колонка research_log.decision)
 */
enum class ResearchDecision {
    REJECTED,
    SHORTLISTED,
    TRADE
};

inline std::string toString(ResearchDecision decision) {
    switch (decision) {
        case ResearchDecision::REJECTED: return "REJECTED";
        case ResearchDecision::SHORTLISTED: return "SHORTLISTED";
        case ResearchDecision::TRADE: return "TRADE";
        default: return "UNKNOWN";
    }
}

inline ResearchDecision parseResearchDecision(const std::string& str) {
    if (str == "SHORTLISTED") return ResearchDecision::SHORTLISTED;
    if (str == "TRADE") return ResearchDecision::TRADE;
    return ResearchDecision::REJECTED;
}

} // namespace autotrader::domain
