#pragma once

#include "Timestamp.hpp"
#include <cstdint>
#include <string>

namespace autotrader::domain {

/**
 * @brief Событие для ленты дашборда (таблица event_stream)
 *
 * id монотонно растёт и служит курсором для опроса.
 */
struct EventRecord {
    int64_t id = 0;
    Timestamp timestamp;
    std::string level;   ///< INFO | WARN | ERROR
    std::string symbol;
    std::string step;
    std::string message;
};

/**
 * @brief Текущий шаг цикла (singleton-строка live_status)
 */
struct LiveStatus {
    std::string currentSymbol = "Idle";
    std::string currentStep = "Waiting for cycle";
    Timestamp lastUpdate;
};

} // namespace autotrader::domain
