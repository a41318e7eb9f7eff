#pragma once

#include <stdexcept>
#include <string>

namespace autotrader::domain {

/**
 * @brief Документ runtime-конфигурации недоступен или невалиден
 */
class RuntimeConfigError : public std::runtime_error {
public:
    explicit RuntimeConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace autotrader::domain
