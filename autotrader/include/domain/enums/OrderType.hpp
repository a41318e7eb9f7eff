#pragma once

#include <string>

namespace autotrader::domain {

/**
 * @brief Тип ордера брокера
 *
 * MKT - рыночный, LMT - лимитный (take-profit), STP - стоп (stop-loss)
 */
enum class OrderType {
    MKT,
    LMT,
    STP
};

inline std::string toString(OrderType type) {
    switch (type) {
        case OrderType::MKT: return "MKT";
        case OrderType::LMT: return "LMT";
        case OrderType::STP: return "STP";
        default: return "UNKNOWN";
    }
}

inline OrderType parseOrderType(const std::string& str) {
    if (str == "LMT") return OrderType::LMT;
    if (str == "STP") return OrderType::STP;
    return OrderType::MKT;
}

} // namespace autotrader::domain
