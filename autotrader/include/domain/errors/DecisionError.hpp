#pragma once

#include <stdexcept>
#include <string>

namespace autotrader::domain {

/**
 * @brief Ответ сервиса решений не прошёл валидацию или не получен
 */
class DecisionError : public std::runtime_error {
public:
    explicit DecisionError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace autotrader::domain
