#pragma once

#include "Contract.hpp"
#include <optional>
#include <string>

namespace autotrader::domain {

/**
 * @brief Позиция по инструменту
 *
 * quantity > 0 - лонг; отрицательное значение недопустимо и
 * закрывается страховочной логикой цикла.
 */
struct Position {
    std::string account;
    Contract contract;
    double quantity = 0.0;
    double avgCost = 0.0;
    std::optional<double> marketPrice;
    std::optional<double> marketValue;
    std::optional<double> unrealisedPnl;
    std::optional<double> realisedPnl;
};

} // namespace autotrader::domain
