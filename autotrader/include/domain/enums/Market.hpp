#pragma once

#include <optional>
#include <string>

namespace autotrader::domain {

/**
 * @brief Поддерживаемые рынки
 *
 * US: SMART/USD, сессия 09:30-16:00 America/New_York
 * UK: LSE/GBP,   сессия 08:00-16:30 Europe/London
 */
enum class Market {
    US,
    UK
};

inline std::string toString(Market market) {
    switch (market) {
        case Market::US: return "US";
        case Market::UK: return "UK";
        default: return "UNKNOWN";
    }
}

inline std::optional<Market> parseMarket(const std::string& str) {
    if (str == "US") return Market::US;
    if (str == "UK") return Market::UK;
    return std::nullopt;
}

inline std::string exchangeFor(Market market) {
    return market == Market::UK ? "LSE" : "SMART";
}

inline std::string currencyFor(Market market) {
    return market == Market::UK ? "GBP" : "USD";
}

inline Market marketForCurrency(const std::string& currency) {
    return currency == "GBP" ? Market::UK : Market::US;
}

} // namespace autotrader::domain
