#pragma once

#include "enums/OrderReviewAction.hpp"
#include "enums/PositionAction.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace autotrader::domain {

// ============================================
// ТИПИЗИРОВАННЫЕ ОТВЕТЫ СЕРВИСА РЕШЕНИЙ
// ============================================

/**
 * @brief Этап 1: попадает ли символ в шорт-лист
 */
struct ShortlistDecision {
    std::string decision;   ///< SHORTLIST | SKIP
    double confidence = 0.0;
    double score = 0.0;
    double sentiment = 0.0;
    std::string rationale;
    std::vector<std::string> keyFactors;
    std::vector<std::string> keyRisks;

    bool isShortlisted() const { return decision == "SHORTLIST"; }
};

/**
 * @brief Этап 2: упорядоченный выбор покупок из шорт-листа
 */
struct BuySelection {
    std::vector<std::string> selectedSymbols;
    std::string rationale;
};

struct PositionReviewDecision {
    PositionAction action = PositionAction::HOLD;
    std::optional<double> newStopLoss;
    std::optional<double> newTakeProfit;
    double confidence = 0.0;
    double urgency = 0.5;
    std::string rationale;
    std::vector<std::string> keyFactors;
};

struct OrderReviewDecision {
    OrderReviewAction action = OrderReviewAction::KEEP;
    std::optional<double> newPrice;
    double confidence = 0.5;
    std::string rationale;
};

using DecisionPayload = std::variant<
    ShortlistDecision,
    BuySelection,
    PositionReviewDecision,
    OrderReviewDecision>;

} // namespace autotrader::domain
