#pragma once

#include "Timestamp.hpp"

namespace autotrader::domain {

/**
 * @brief Метаданные позиции, которые ведёт движок ревью
 *
 * peakPnlPct и peakPrice только растут; запись удаляется при полном выходе.
 */
struct PositionMetadata {
    Timestamp entryTime;
    double entryPrice = 0.0;
    double peakPnlPct = 0.0;
    double peakPrice = 0.0;
    int adjustmentCount = 0;
    bool peaksInitialised = false;
};

} // namespace autotrader::domain
