#pragma once

#include <stdexcept>
#include <string>

namespace autotrader::domain {

/**
 * @brief Любой сбой операции через мост брокера
 */
class BrokerError : public std::runtime_error {
public:
    explicit BrokerError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Вызов при отсутствии соединения (fail fast, без ожидания)
 */
class BrokerNotConnectedError : public BrokerError {
public:
    explicit BrokerNotConnectedError(const std::string& message = "Broker not connected")
        : BrokerError(message) {}
};

/**
 * @brief Истёк таймаут ожидания вызывающего
 *
 * Сама операция в потоке моста не отменяется.
 */
class BrokerTimeoutError : public BrokerError {
public:
    explicit BrokerTimeoutError(const std::string& message)
        : BrokerError(message) {}
};

} // namespace autotrader::domain
