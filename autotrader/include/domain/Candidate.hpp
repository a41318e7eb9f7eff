#pragma once

#include "Contract.hpp"
#include "Decisions.hpp"
#include "Signals.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace autotrader::domain {

/**
 * @brief Кандидат из скринера (живёт один цикл)
 */
struct Candidate {
    Contract contract;
    std::string source;     ///< scan code, "manual" или "reddit"
    std::optional<double> lastPrice;
};

/**
 * @brief Кандидат, попавший в шорт-лист и прошедший жёсткие фильтры
 *
 * rank выставляется после сортировки по score.
 */
struct EligibleCandidate {
    Candidate candidate;
    Contract qualified;
    Signals signals;
    ShortlistDecision decision;
    std::optional<int> rank;
    int64_t researchId = 0;

    const std::string& symbol() const { return qualified.symbol; }
    const std::string& currency() const { return qualified.currency; }
};

/**
 * @brief Кандидат для сравнения при ревью позиций (ротация)
 */
struct TopCandidate {
    std::string symbol;
    double score = 0.0;
    std::string rationale;
};

} // namespace autotrader::domain
