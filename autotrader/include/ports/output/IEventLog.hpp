#pragma once

#include "domain/EventRecord.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace autotrader::ports::output {

/**
 * @brief Лента событий для дашборда и журнал логов
 */
class IEventLog {
public:
    virtual ~IEventLog() = default;

    virtual void logEvent(const std::string& level,
                          const std::string& message,
                          const std::string& symbol = "",
                          const std::string& step = "") = 0;

    /**
     * @brief Строка в таблицу logs (без привязки к символу)
     */
    virtual void logMessage(const std::string& level, const std::string& message) = 0;

    /**
     * @brief События с id > afterId по возрастанию id
     */
    virtual std::vector<domain::EventRecord> eventsAfter(int64_t afterId, int limit) = 0;
};

} // namespace autotrader::ports::output
