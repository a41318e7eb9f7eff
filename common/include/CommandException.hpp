#pragma once

#include <stdexcept>
#include <string>

namespace autotrader::common {

/**
 * @brief Команду нельзя принять или выполнить (пул остановлен и т.п.)
 */
class CommandException : public std::runtime_error {
public:
    explicit CommandException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace autotrader::common
