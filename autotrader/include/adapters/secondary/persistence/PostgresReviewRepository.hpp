#pragma once

#include "PostgresRow.hpp"
#include "ports/output/IReviewRepository.hpp"
#include "settings/DbSettings.hpp"
#include <nlohmann/json.hpp>
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace autotrader::adapters::secondary {

/**
 * @brief position_reviews и order_reviews
 *
 * key_factors хранится JSON-массивом строк в TEXT-колонке.
 * executed = 1 и execution_result пишутся только после подтверждённого
 * исполнения действия.
 */
class PostgresReviewRepository : public ports::output::IReviewRepository {
public:
    explicit PostgresReviewRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresReviewRepository] Initialized" << std::endl;
    }

    int64_t insertPositionReview(const domain::PositionReviewRecord& r) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            std::optional<std::string> keyFactors;
            if (!r.keyFactors.empty()) {
                keyFactors = nlohmann::json(r.keyFactors).dump();
            }

            auto result = txn.exec_params(
                "INSERT INTO position_reviews "
                "(symbol, exchange, currency, entry_price, current_price, quantity, "
                " unrealised_pnl, pnl_pct, minutes_held, current_stop_loss, current_take_profit, "
                " action, new_stop_loss, new_take_profit, confidence, urgency, rationale, "
                " key_factors, executed) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, "
                "        $16, $17, $18, 0) "
                "RETURNING id",
                r.symbol,
                pg::nullIfEmpty(r.exchange),
                pg::nullIfEmpty(r.currency),
                r.entryPrice,
                r.currentPrice,
                r.quantity,
                r.unrealisedPnl,
                r.pnlPct,
                r.minutesHeld,
                r.currentStopLoss,
                r.currentTakeProfit,
                r.action,
                r.newStopLoss,
                r.newTakeProfit,
                r.confidence,
                r.urgency,
                pg::nullIfEmpty(r.rationale),
                keyFactors
            );

            txn.commit();
            return result.empty() ? 0 : result[0][0].as<int64_t>();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresReviewRepository] insertPositionReview error: "
                      << e.what() << std::endl;
            throw;
        }
    }

    void markPositionReviewExecuted(int64_t id, const std::string& result) override {
        markExecuted("position_reviews", id, result);
    }

    int64_t insertOrderReview(const domain::OrderReviewRecord& r) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "INSERT INTO order_reviews "
                "(order_id, symbol, order_type, order_action, order_quantity, order_price, "
                " current_price, bid_price, ask_price, price_distance_pct, order_age_minutes, "
                " action, new_price, confidence, rationale, executed) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, 0) "
                "RETURNING id",
                static_cast<int64_t>(r.orderId),
                r.symbol,
                r.orderType,
                r.orderAction,
                r.orderQuantity,
                r.orderPrice,
                r.currentPrice,
                r.bidPrice,
                r.askPrice,
                r.priceDistancePct,
                r.orderAgeMinutes,
                r.action,
                r.newPrice,
                r.confidence,
                pg::nullIfEmpty(r.rationale)
            );

            txn.commit();
            return result.empty() ? 0 : result[0][0].as<int64_t>();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresReviewRepository] insertOrderReview error: "
                      << e.what() << std::endl;
            throw;
        }
    }

    void markOrderReviewExecuted(int64_t id, const std::string& result) override {
        markExecuted("order_reviews", id, result);
    }

    std::vector<domain::PositionReviewRecord> recentPositionReviews(int limit) override {
        std::vector<domain::PositionReviewRecord> reviews;

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT * FROM position_reviews ORDER BY timestamp DESC, id DESC LIMIT $1",
                limit
            );

            for (const auto& row : result) {
                domain::PositionReviewRecord r;
                r.id = row["id"].as<int64_t>();
                r.timestamp = pg::timestamp(row["timestamp"]);
                r.symbol = pg::text(row["symbol"]);
                r.exchange = pg::text(row["exchange"]);
                r.currency = pg::text(row["currency"]);
                r.entryPrice = pg::optionalDouble(row["entry_price"]);
                r.currentPrice = pg::optionalDouble(row["current_price"]);
                r.quantity = pg::optionalInt(row["quantity"]).value_or(0);
                r.unrealisedPnl = pg::optionalDouble(row["unrealised_pnl"]);
                r.pnlPct = pg::optionalDouble(row["pnl_pct"]);
                r.minutesHeld = pg::optionalInt(row["minutes_held"]);
                r.currentStopLoss = pg::optionalDouble(row["current_stop_loss"]);
                r.currentTakeProfit = pg::optionalDouble(row["current_take_profit"]);
                r.action = pg::text(row["action"]);
                r.newStopLoss = pg::optionalDouble(row["new_stop_loss"]);
                r.newTakeProfit = pg::optionalDouble(row["new_take_profit"]);
                r.confidence = pg::optionalDouble(row["confidence"]);
                r.urgency = pg::optionalDouble(row["urgency"]);
                r.rationale = pg::text(row["rationale"]);
                r.keyFactors = parseKeyFactors(pg::text(row["key_factors"]));
                r.executed = pg::optionalInt(row["executed"]).value_or(0) != 0;
                r.executionResult = pg::text(row["execution_result"]);
                reviews.push_back(std::move(r));
            }

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresReviewRepository] recentPositionReviews error: "
                      << e.what() << std::endl;
        }

        return reviews;
    }

    std::vector<domain::OrderReviewRecord> recentOrderReviews(int limit) override {
        std::vector<domain::OrderReviewRecord> reviews;

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT * FROM order_reviews ORDER BY timestamp DESC, id DESC LIMIT $1",
                limit
            );

            for (const auto& row : result) {
                domain::OrderReviewRecord r;
                r.id = row["id"].as<int64_t>();
                r.timestamp = pg::timestamp(row["timestamp"]);
                r.orderId = row["order_id"].is_null() ? 0 : static_cast<int>(row["order_id"].as<int64_t>());
                r.symbol = pg::text(row["symbol"]);
                r.orderType = pg::text(row["order_type"]);
                r.orderAction = pg::text(row["order_action"]);
                r.orderQuantity = pg::optionalInt(row["order_quantity"]).value_or(0);
                r.orderPrice = pg::optionalDouble(row["order_price"]);
                r.currentPrice = pg::optionalDouble(row["current_price"]);
                r.bidPrice = pg::optionalDouble(row["bid_price"]);
                r.askPrice = pg::optionalDouble(row["ask_price"]);
                r.priceDistancePct = pg::optionalDouble(row["price_distance_pct"]);
                r.orderAgeMinutes = pg::optionalInt(row["order_age_minutes"]);
                r.action = pg::text(row["action"]);
                r.newPrice = pg::optionalDouble(row["new_price"]);
                r.confidence = pg::optionalDouble(row["confidence"]);
                r.rationale = pg::text(row["rationale"]);
                r.executed = pg::optionalInt(row["executed"]).value_or(0) != 0;
                r.executionResult = pg::text(row["execution_result"]);
                reviews.push_back(std::move(r));
            }

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresReviewRepository] recentOrderReviews error: "
                      << e.what() << std::endl;
        }

        return reviews;
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void markExecuted(const std::string& table, int64_t id, const std::string& result) {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "UPDATE " + table + " SET executed = 1, execution_result = $1 WHERE id = $2",
                result,
                id
            );

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresReviewRepository] markExecuted(" << table << ") error: "
                      << e.what() << std::endl;
            throw;
        }
    }

    static std::vector<std::string> parseKeyFactors(const std::string& raw) {
        if (raw.empty()) return {};
        auto parsed = nlohmann::json::parse(raw, nullptr, false);
        if (!parsed.is_array()) return {};
        std::vector<std::string> factors;
        for (const auto& item : parsed) {
            if (item.is_string()) factors.push_back(item.get<std::string>());
        }
        return factors;
    }
};

} // namespace autotrader::adapters::secondary
