#pragma once

#include <optional>
#include <string>

namespace autotrader::domain {

enum class PositionAction {
    HOLD,
    SELL,
    ADJUST_STOP,
    ADJUST_TP
};

inline std::string toString(PositionAction action) {
    switch (action) {
        case PositionAction::HOLD: return "HOLD";
        case PositionAction::SELL: return "SELL";
        case PositionAction::ADJUST_STOP: return "ADJUST_STOP";
        case PositionAction::ADJUST_TP: return "ADJUST_TP";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Строгий разбор: неизвестное значение -> nullopt
 */
inline std::optional<PositionAction> parsePositionAction(const std::string& str) {
    if (str == "HOLD") return PositionAction::HOLD;
    if (str == "SELL") return PositionAction::SELL;
    if (str == "ADJUST_STOP") return PositionAction::ADJUST_STOP;
    if (str == "ADJUST_TP") return PositionAction::ADJUST_TP;
    return std::nullopt;
}

} // namespace autotrader::domain
