#pragma once

#include "PostgresRow.hpp"
#include "ports/output/ITradeRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace autotrader::adapters::secondary {

class PostgresTradeRepository : public ports::output::ITradeRepository {
public:
    explicit PostgresTradeRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresTradeRepository] Initialized" << std::endl;
    }

    int64_t insert(const domain::TradeRecord& trade) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "INSERT INTO trades "
                "(symbol, action, quantity, price, stop_loss, take_profit, "
                " sentiment_score, status, rationale) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9) RETURNING id",
                trade.symbol,
                trade.action,
                trade.quantity,
                trade.price,
                trade.stopLoss,
                trade.takeProfit,
                trade.sentimentScore,
                trade.status,
                pg::nullIfEmpty(trade.rationale)
            );

            txn.commit();
            std::cout << "[PostgresTradeRepository] Saved " << trade.action << " "
                      << trade.symbol << " x" << trade.quantity << std::endl;
            return result.empty() ? 0 : result[0][0].as<int64_t>();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTradeRepository] insert error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::TradeRecord> lastBuy(const std::string& symbol) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, timestamp, symbol, action, quantity, price, stop_loss, "
                "       take_profit, sentiment_score, status, rationale "
                "FROM trades WHERE symbol = $1 AND action = 'BUY' "
                "ORDER BY timestamp DESC, id DESC LIMIT 1",
                symbol
            );

            txn.commit();

            if (!result.empty()) {
                return rowToTrade(result[0]);
            }
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTradeRepository] lastBuy error: " << e.what() << std::endl;
        }

        return std::nullopt;
    }

    std::vector<domain::TradeRecord> recent(int limit) override {
        std::vector<domain::TradeRecord> trades;

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, timestamp, symbol, action, quantity, price, stop_loss, "
                "       take_profit, sentiment_score, status, rationale "
                "FROM trades ORDER BY timestamp DESC, id DESC LIMIT $1",
                limit
            );

            for (const auto& row : result) {
                trades.push_back(rowToTrade(row));
            }

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTradeRepository] recent error: " << e.what() << std::endl;
        }

        return trades;
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    domain::TradeRecord rowToTrade(const pqxx::row& row) const {
        domain::TradeRecord trade;
        trade.id = row["id"].as<int64_t>();
        trade.timestamp = pg::timestamp(row["timestamp"]);
        trade.symbol = pg::text(row["symbol"]);
        trade.action = pg::text(row["action"]);
        trade.quantity = pg::optionalInt(row["quantity"]).value_or(0);
        trade.price = pg::optionalDouble(row["price"]).value_or(0.0);
        trade.stopLoss = pg::optionalDouble(row["stop_loss"]);
        trade.takeProfit = pg::optionalDouble(row["take_profit"]);
        trade.sentimentScore = pg::optionalDouble(row["sentiment_score"]);
        trade.status = pg::text(row["status"]);
        trade.rationale = pg::text(row["rationale"]);
        return trade;
    }
};

} // namespace autotrader::adapters::secondary
