#pragma once

#include <chrono>

namespace autotrader::ports::output {

/**
 * @brief Источник времени (в тестах подменяется ручными часами)
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
};

} // namespace autotrader::ports::output
