#pragma once

#include <stdexcept>
#include <string>

namespace autotrader::domain {

/**
 * @brief Анализ символа не уложился в лимит времени
 */
class SymbolTimeoutError : public std::runtime_error {
public:
    explicit SymbolTimeoutError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace autotrader::domain
