#pragma once

#include <string>

namespace autotrader::domain {

/**
 * @brief Состояние сессии брокера
 *
 * Меняется только в потоке моста; остальные видят копию через atomic.
 */
enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected
};

inline std::string toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "DISCONNECTED";
        case ConnectionState::Connecting: return "CONNECTING";
        case ConnectionState::Connected: return "CONNECTED";
        default: return "UNKNOWN";
    }
}

} // namespace autotrader::domain
