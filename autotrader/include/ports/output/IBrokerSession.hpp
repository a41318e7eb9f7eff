#pragma once

#include "domain/AccountValue.hpp"
#include "domain/Bar.hpp"
#include "domain/Contract.hpp"
#include "domain/MarketSnapshot.hpp"
#include "domain/OpenOrder.hpp"
#include "domain/OrderRequest.hpp"
#include "domain/Position.hpp"
#include "domain/ScannerQuery.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace autotrader::ports::output {

/**
 * @brief Синхронная сессия брокера (уровень протокола)
 *
 * НЕ потокобезопасна: все вызовы должны идти из одного потока.
 * Этот поток принадлежит BrokerBridge; остальной код работает
 * только через IBrokerGateway.
 *
 * Ошибки протокола сообщаются исключениями std::exception.
 */
class IBrokerSession {
public:
    virtual ~IBrokerSession() = default;

    // ============================================
    // СОЕДИНЕНИЕ
    // ============================================

    virtual void connect(const std::string& host, int port, int clientId,
                         std::chrono::seconds timeout) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    /**
     * @brief 1 - live, 3 - delayed
     */
    virtual void setMarketDataType(int type) = 0;
    virtual std::vector<std::string> managedAccounts() = 0;
    virtual void subscribeAccountUpdates(const std::string& account) = 0;

    // ============================================
    // АККАУНТ
    // ============================================

    virtual std::vector<domain::AccountValue> accountValues() = 0;

    /**
     * @brief Портфель с ценами и P&L (может быть пустым до первой подписки)
     */
    virtual std::vector<domain::Position> portfolio() = 0;

    /**
     * @brief Сырые позиции: только количество и средняя цена
     */
    virtual std::vector<domain::Position> positions() = 0;

    virtual void requestAllOpenOrders() = 0;
    virtual std::vector<domain::OpenOrder> openOrders() = 0;

    // ============================================
    // РЫНОЧНЫЕ ДАННЫЕ
    // ============================================

    virtual std::optional<domain::Contract> qualify(const domain::Contract& contract) = 0;
    virtual std::vector<domain::Bar> historicalBars(const domain::Contract& contract,
                                                    const std::string& duration,
                                                    const std::string& barSize,
                                                    bool useRth) = 0;
    virtual std::optional<domain::MarketSnapshot> snapshot(const domain::Contract& contract) = 0;
    virtual std::vector<std::string> headlines(const domain::Contract& contract, int limit) = 0;
    virtual std::vector<domain::Contract> scan(const domain::ScannerQuery& query) = 0;
    virtual double minTick(const domain::Contract& contract) = 0;

    // ============================================
    // ОРДЕРА
    // ============================================

    /**
     * @brief Разместить (orderId == 0) или изменить ордер
     */
    virtual domain::PlacedOrder placeOrder(const domain::OrderRequest& request) = 0;
    virtual void cancelOrder(int orderId) = 0;
};

} // namespace autotrader::ports::output
