#pragma once

#include <string>

namespace autotrader::domain {

/**
 * @brief OHLCV свеча
 */
struct Bar {
    std::string time;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

} // namespace autotrader::domain
