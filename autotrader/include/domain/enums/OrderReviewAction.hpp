#pragma once

#include <optional>
#include <string>

namespace autotrader::domain {

enum class OrderReviewAction {
    KEEP,
    CANCEL,
    ADJUST_PRICE
};

inline std::string toString(OrderReviewAction action) {
    switch (action) {
        case OrderReviewAction::KEEP: return "KEEP";
        case OrderReviewAction::CANCEL: return "CANCEL";
        case OrderReviewAction::ADJUST_PRICE: return "ADJUST_PRICE";
        default: return "UNKNOWN";
    }
}

inline std::optional<OrderReviewAction> parseOrderReviewAction(const std::string& str) {
    if (str == "KEEP") return OrderReviewAction::KEEP;
    if (str == "CANCEL") return OrderReviewAction::CANCEL;
    if (str == "ADJUST_PRICE") return OrderReviewAction::ADJUST_PRICE;
    return std::nullopt;
}

} // namespace autotrader::domain
