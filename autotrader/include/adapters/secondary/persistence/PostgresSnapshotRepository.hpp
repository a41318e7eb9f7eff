#pragma once

#include "PostgresRow.hpp"
#include "ports/output/ISnapshotRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace autotrader::adapters::secondary {

/**
 * @brief Снимки аккаунта, позиций и ордеров для дашборда
 *
 * Снимок заменяется целиком в одной транзакции (DELETE + INSERT),
 * performance копит историю.
 */
class PostgresSnapshotRepository : public ports::output::ISnapshotRepository {
public:
    explicit PostgresSnapshotRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresSnapshotRepository] Initialized" << std::endl;
    }

    void saveAccountSummary(const std::vector<domain::AccountSummaryItem>& items) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec("DELETE FROM account_summary");
            for (const auto& item : items) {
                txn.exec_params(
                    "INSERT INTO account_summary (tag, value, currency) VALUES ($1, $2, $3)",
                    item.tag,
                    item.value,
                    pg::nullIfEmpty(item.currency)
                );
            }

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSnapshotRepository] saveAccountSummary error: "
                      << e.what() << std::endl;
            throw;
        }
    }

    void savePositions(const std::vector<domain::Position>& positions) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec("DELETE FROM positions_snapshot");
            for (const auto& p : positions) {
                txn.exec_params(
                    "INSERT INTO positions_snapshot "
                    "(account, symbol, exchange, currency, position, avg_cost, "
                    " market_price, market_value, unrealised_pnl, realised_pnl) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10)",
                    pg::nullIfEmpty(p.account),
                    p.contract.symbol,
                    pg::nullIfEmpty(p.contract.exchange),
                    pg::nullIfEmpty(p.contract.currency),
                    p.quantity,
                    p.avgCost,
                    p.marketPrice,
                    p.marketValue,
                    p.unrealisedPnl,
                    p.realisedPnl
                );
            }

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSnapshotRepository] savePositions error: "
                      << e.what() << std::endl;
            throw;
        }
    }

    void saveOpenOrders(const std::vector<domain::OpenOrder>& orders) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec("DELETE FROM open_orders_snapshot");
            for (const auto& o : orders) {
                txn.exec_params(
                    "INSERT INTO open_orders_snapshot "
                    "(order_id, symbol, exchange, currency, action, order_type, "
                    " total_qty, filled, remaining, status, lmt_price, aux_price) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12)",
                    static_cast<int64_t>(o.orderId),
                    o.contract.symbol,
                    pg::nullIfEmpty(o.contract.exchange),
                    pg::nullIfEmpty(o.contract.currency),
                    domain::toString(o.action),
                    domain::toString(o.orderType),
                    o.totalQuantity,
                    o.filled,
                    o.remaining,
                    pg::nullIfEmpty(o.status),
                    o.lmtPrice,
                    o.auxPrice
                );
            }

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSnapshotRepository] saveOpenOrders error: "
                      << e.what() << std::endl;
            throw;
        }
    }

    void recordPerformance(const domain::PerformanceRecord& record) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "INSERT INTO performance (equity, unrealized_pnl, realized_pnl) "
                "VALUES ($1, $2, $3)",
                record.equity,
                record.unrealisedPnl,
                record.realisedPnl
            );

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSnapshotRepository] recordPerformance error: "
                      << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace autotrader::adapters::secondary
