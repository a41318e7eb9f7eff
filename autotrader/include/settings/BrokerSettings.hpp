#pragma once

#include <chrono>
#include <cstdlib>
#include <string>

namespace autotrader::settings {

/**
 * @brief Настройки моста к брокеру
 *
 * Читает из ENV:
 * - AUTOTRADER_BROKER_HOST (default: 127.0.0.1)
 * - AUTOTRADER_BROKER_PORT (default: 7497)
 * - AUTOTRADER_BROKER_CLIENT_ID (default: 10)
 * - AUTOTRADER_BROKER_CONNECT_TIMEOUT_SECONDS (default: 10)
 * - AUTOTRADER_BROKER_RECONNECT_COOLDOWN_SECONDS (default: 10)
 * - AUTOTRADER_BROKER_REQUEST_TIMEOUT_SECONDS (default: 8)
 * - AUTOTRADER_BROKER_HISTORICAL_TIMEOUT_SECONDS (default: 30)
 * - AUTOTRADER_BROKER_OPEN_ORDERS_TTL_MS (default: 2000)
 * - AUTOTRADER_PAPER_SEED (default: 0 - случайный)
 */
class BrokerSettings {
public:
    BrokerSettings() {
        if (const char* val = std::getenv("AUTOTRADER_BROKER_HOST")) {
            host_ = val;
        }
        if (const char* val = std::getenv("AUTOTRADER_BROKER_PORT")) {
            port_ = std::stoi(val);
        }
        if (const char* val = std::getenv("AUTOTRADER_BROKER_CLIENT_ID")) {
            clientId_ = std::stoi(val);
        }
        if (const char* val = std::getenv("AUTOTRADER_BROKER_CONNECT_TIMEOUT_SECONDS")) {
            connectTimeout_ = std::chrono::seconds(std::stoi(val));
        }
        if (const char* val = std::getenv("AUTOTRADER_BROKER_RECONNECT_COOLDOWN_SECONDS")) {
            reconnectCooldown_ = std::chrono::seconds(std::stoi(val));
        }
        if (const char* val = std::getenv("AUTOTRADER_BROKER_REQUEST_TIMEOUT_SECONDS")) {
            requestTimeout_ = std::chrono::seconds(std::stoi(val));
        }
        if (const char* val = std::getenv("AUTOTRADER_BROKER_HISTORICAL_TIMEOUT_SECONDS")) {
            historicalTimeout_ = std::chrono::seconds(std::stoi(val));
        }
        if (const char* val = std::getenv("AUTOTRADER_BROKER_OPEN_ORDERS_TTL_MS")) {
            openOrdersTtl_ = std::chrono::milliseconds(std::stoi(val));
        }
        if (const char* val = std::getenv("AUTOTRADER_PAPER_SEED")) {
            paperSeed_ = static_cast<unsigned>(std::stoul(val));
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    int getClientId() const { return clientId_; }
    std::chrono::seconds getConnectTimeout() const { return connectTimeout_; }
    std::chrono::seconds getReconnectCooldown() const { return reconnectCooldown_; }
    std::chrono::seconds getRequestTimeout() const { return requestTimeout_; }
    std::chrono::seconds getHistoricalTimeout() const { return historicalTimeout_; }
    std::chrono::milliseconds getOpenOrdersTtl() const { return openOrdersTtl_; }
    unsigned getPaperSeed() const { return paperSeed_; }

    // Для тестов
    void setReconnectCooldown(std::chrono::seconds value) { reconnectCooldown_ = value; }
    void setRequestTimeout(std::chrono::seconds value) { requestTimeout_ = value; }
    void setOpenOrdersTtl(std::chrono::milliseconds value) { openOrdersTtl_ = value; }

private:
    std::string host_ = "127.0.0.1";
    int port_ = 7497;
    int clientId_ = 10;
    std::chrono::seconds connectTimeout_{10};
    std::chrono::seconds reconnectCooldown_{10};
    std::chrono::seconds requestTimeout_{8};
    std::chrono::seconds historicalTimeout_{30};
    std::chrono::milliseconds openOrdersTtl_{2000};
    unsigned paperSeed_ = 0;
};

} // namespace autotrader::settings
