#pragma once

#include <optional>
#include <string>

namespace autotrader::domain {

/**
 * @brief Параметры рыночного сканера брокера
 *
 * locationCode: "STK.US.MAJOR" или "STK.LSE"
 */
struct ScannerQuery {
    std::string scanCode;
    std::string instrument = "STK";
    std::string locationCode = "STK.US.MAJOR";
    std::optional<double> abovePrice;
    std::optional<double> belowPrice;
    std::optional<double> aboveVolume;
    int numberOfRows = 50;
};

} // namespace autotrader::domain
