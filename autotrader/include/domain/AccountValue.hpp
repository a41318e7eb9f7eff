#pragma once

#include <string>

namespace autotrader::domain {

/**
 * @brief Значение аккаунта в сыром виде, как его отдаёт сессия
 *
 * value строковое: брокер может вернуть нечисловое значение.
 */
struct AccountValue {
    std::string account;
    std::string tag;
    std::string value;
    std::string currency;
};

/**
 * @brief Числовой элемент сводки аккаунта (после фильтрации мостом)
 */
struct AccountSummaryItem {
    std::string tag;
    double value = 0.0;
    std::string currency;
};

} // namespace autotrader::domain
