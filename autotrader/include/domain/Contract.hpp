#pragma once

#include <string>

namespace autotrader::domain {

/**
 * @brief Акция на бирже
 *
 * conId заполняется после qualify(); tradingClass нужен скринеру
 * (SCM - микрокапы в США).
 */
struct Contract {
    std::string symbol;
    std::string exchange = "SMART";
    std::string currency = "USD";
    std::string primaryExchange;
    std::string tradingClass;
    long conId = 0;

    Contract() = default;

    Contract(std::string sym, std::string exch, std::string cur)
        : symbol(std::move(sym))
        , exchange(std::move(exch))
        , currency(std::move(cur))
    {}
};

} // namespace autotrader::domain
