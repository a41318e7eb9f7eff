#pragma once

#include "BrokerError.hpp"
#include "DecisionError.hpp"
#include "RuntimeConfigError.hpp"
#include "SymbolTimeoutError.hpp"

#include <exception>
#include <stdexcept>
#include <string>

namespace autotrader::domain {

/**
 * @brief Читаемое имя типа исключения для сообщений в ленте событий
 */
inline std::string errorTypeName(const std::exception& e) {
    if (dynamic_cast<const BrokerNotConnectedError*>(&e)) return "BrokerNotConnectedError";
    if (dynamic_cast<const BrokerTimeoutError*>(&e)) return "BrokerTimeoutError";
    if (dynamic_cast<const BrokerError*>(&e)) return "BrokerError";
    if (dynamic_cast<const DecisionError*>(&e)) return "DecisionError";
    if (dynamic_cast<const RuntimeConfigError*>(&e)) return "RuntimeConfigError";
    if (dynamic_cast<const SymbolTimeoutError*>(&e)) return "SymbolTimeoutError";
    if (dynamic_cast<const std::invalid_argument*>(&e)) return "InvalidArgument";
    if (dynamic_cast<const std::out_of_range*>(&e)) return "OutOfRange";
    if (dynamic_cast<const std::runtime_error*>(&e)) return "RuntimeError";
    return "Exception";
}

} // namespace autotrader::domain
