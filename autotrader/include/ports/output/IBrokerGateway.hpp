#pragma once

#include "domain/AccountValue.hpp"
#include "domain/Bar.hpp"
#include "domain/Contract.hpp"
#include "domain/MarketSnapshot.hpp"
#include "domain/OpenOrder.hpp"
#include "domain/OrderRequest.hpp"
#include "domain/Position.hpp"
#include "domain/ScannerQuery.hpp"
#include "domain/enums/ConnectionState.hpp"
#include "domain/errors/BrokerError.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace autotrader::ports::output {

/**
 * @brief Потокобезопасный доступ к брокеру с таймаутами
 *
 * Любой метод может бросить:
 * - domain::BrokerNotConnectedError - нет соединения (сразу, без ожидания)
 * - domain::BrokerTimeoutError - вызывающий не дождался результата
 * - domain::BrokerError - сбой самой операции
 */
class IBrokerGateway {
public:
    virtual ~IBrokerGateway() = default;

    virtual bool isConnected() const = 0;
    virtual domain::ConnectionState connectionState() const = 0;

    // ============================================
    // АККАУНТ (таймаут задаёт вызывающий)
    // ============================================

    virtual std::vector<domain::AccountSummaryItem> getAccountSummary(std::chrono::milliseconds timeout) = 0;
    virtual std::vector<domain::Position> getPositions(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Рабочие ордера (кэш с TTL, один запрос на всех ожидающих)
     */
    virtual std::vector<domain::OpenOrder> getOpenOrders(std::chrono::milliseconds timeout) = 0;

    // ============================================
    // РЫНОЧНЫЕ ДАННЫЕ
    // ============================================

    virtual std::optional<domain::Contract> qualifyContract(const domain::Contract& contract) = 0;
    virtual std::vector<domain::Bar> getHistoricalBars(const domain::Contract& contract,
                                                       const std::string& duration,
                                                       const std::string& barSize,
                                                       bool useRth) = 0;
    virtual std::optional<domain::MarketSnapshot> getMarketSnapshot(const domain::Contract& contract) = 0;
    virtual std::vector<std::string> getHeadlines(const domain::Contract& contract, int limit) = 0;
    virtual std::vector<domain::Contract> scan(const domain::ScannerQuery& query) = 0;
    virtual double getMinTick(const domain::Contract& contract) = 0;

    // ============================================
    // ОРДЕРА
    // ============================================

    virtual domain::PlacedOrder placeOrder(const domain::OrderRequest& request) = 0;
    virtual void cancelOrder(int orderId) = 0;
};

} // namespace autotrader::ports::output
