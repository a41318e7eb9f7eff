#pragma once

#include "domain/RuntimeConfigDocument.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace autotrader::adapters::secondary {

/**
 * @brief Создание таблиц и singleton-строк при старте
 *
 * Идемпотентно: CREATE TABLE IF NOT EXISTS и ON CONFLICT DO NOTHING.
 * Ошибка пробрасывается: без схемы цикл работать не может.
 */
class PostgresSchema {
public:
    explicit PostgresSchema(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
    }

    void initialize() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS logs (
                    id BIGSERIAL PRIMARY KEY,
                    timestamp TIMESTAMP DEFAULT (NOW() AT TIME ZONE 'utc'),
                    level TEXT,
                    message TEXT
                );

                CREATE TABLE IF NOT EXISTS event_stream (
                    id BIGSERIAL PRIMARY KEY,
                    timestamp TIMESTAMP DEFAULT (NOW() AT TIME ZONE 'utc'),
                    level TEXT,
                    symbol TEXT,
                    step TEXT,
                    message TEXT
                );

                CREATE TABLE IF NOT EXISTS trades (
                    id BIGSERIAL PRIMARY KEY,
                    timestamp TIMESTAMP DEFAULT (NOW() AT TIME ZONE 'utc'),
                    symbol TEXT,
                    action TEXT,
                    quantity INTEGER,
                    price DOUBLE PRECISION,
                    stop_loss DOUBLE PRECISION,
                    take_profit DOUBLE PRECISION,
                    sentiment_score DOUBLE PRECISION,
                    status TEXT,
                    rationale TEXT
                );

                CREATE INDEX IF NOT EXISTS idx_trades_symbol_action
                ON trades(symbol, action);

                CREATE TABLE IF NOT EXISTS performance (
                    id BIGSERIAL PRIMARY KEY,
                    timestamp TIMESTAMP DEFAULT (NOW() AT TIME ZONE 'utc'),
                    equity DOUBLE PRECISION,
                    unrealized_pnl DOUBLE PRECISION,
                    realized_pnl DOUBLE PRECISION
                );

                CREATE TABLE IF NOT EXISTS research_log (
                    id BIGSERIAL PRIMARY KEY,
                    timestamp TIMESTAMP DEFAULT (NOW() AT TIME ZONE 'utc'),
                    symbol TEXT,
                    exchange TEXT,
                    currency TEXT,
                    price DOUBLE PRECISION,
                    rsi DOUBLE PRECISION,
                    volatility_ratio DOUBLE PRECISION,
                    sentiment_score DOUBLE PRECISION,
                    ai_reasoning TEXT,
                    score DOUBLE PRECISION,
                    rank INTEGER,
                    reddit_mentions INTEGER,
                    reddit_sentiment DOUBLE PRECISION,
                    reddit_confidence DOUBLE PRECISION,
                    decision TEXT,
                    reason TEXT
                );

                CREATE TABLE IF NOT EXISTS live_status (
                    id INTEGER PRIMARY KEY,
                    current_symbol TEXT,
                    current_step TEXT,
                    last_update TIMESTAMP DEFAULT (NOW() AT TIME ZONE 'utc')
                );

                CREATE TABLE IF NOT EXISTS account_summary (
                    id BIGSERIAL PRIMARY KEY,
                    timestamp TIMESTAMP DEFAULT (NOW() AT TIME ZONE 'utc'),
                    tag TEXT,
                    value DOUBLE PRECISION,
                    currency TEXT
                );

                CREATE TABLE IF NOT EXISTS positions_snapshot (
                    id BIGSERIAL PRIMARY KEY,
                    timestamp TIMESTAMP DEFAULT (NOW() AT TIME ZONE 'utc'),
                    account TEXT,
                    symbol TEXT,
                    exchange TEXT,
                    currency TEXT,
                    position DOUBLE PRECISION,
                    avg_cost DOUBLE PRECISION,
                    market_price DOUBLE PRECISION,
                    market_value DOUBLE PRECISION,
                    unrealised_pnl DOUBLE PRECISION,
                    realised_pnl DOUBLE PRECISION
                );

                CREATE TABLE IF NOT EXISTS open_orders_snapshot (
                    id BIGSERIAL PRIMARY KEY,
                    timestamp TIMESTAMP DEFAULT (NOW() AT TIME ZONE 'utc'),
                    order_id BIGINT,
                    symbol TEXT,
                    exchange TEXT,
                    currency TEXT,
                    action TEXT,
                    order_type TEXT,
                    total_qty DOUBLE PRECISION,
                    filled DOUBLE PRECISION,
                    remaining DOUBLE PRECISION,
                    status TEXT,
                    lmt_price DOUBLE PRECISION,
                    aux_price DOUBLE PRECISION
                );

                CREATE TABLE IF NOT EXISTS reddit_sentiment (
                    id BIGSERIAL PRIMARY KEY,
                    timestamp TIMESTAMP DEFAULT (NOW() AT TIME ZONE 'utc'),
                    symbol TEXT,
                    mentions INTEGER,
                    sentiment DOUBLE PRECISION,
                    confidence DOUBLE PRECISION,
                    rationale TEXT,
                    source_fetch_utc BIGINT
                );

                CREATE TABLE IF NOT EXISTS runtime_config (
                    id INTEGER PRIMARY KEY,
                    updated_at TIMESTAMP DEFAULT (NOW() AT TIME ZONE 'utc'),
                    config_json TEXT NOT NULL
                );

                CREATE TABLE IF NOT EXISTS position_reviews (
                    id BIGSERIAL PRIMARY KEY,
                    timestamp TIMESTAMP DEFAULT (NOW() AT TIME ZONE 'utc'),
                    symbol TEXT NOT NULL,
                    exchange TEXT,
                    currency TEXT,
                    entry_price DOUBLE PRECISION,
                    current_price DOUBLE PRECISION,
                    quantity INTEGER,
                    unrealised_pnl DOUBLE PRECISION,
                    pnl_pct DOUBLE PRECISION,
                    minutes_held INTEGER,
                    current_stop_loss DOUBLE PRECISION,
                    current_take_profit DOUBLE PRECISION,
                    action TEXT NOT NULL,
                    new_stop_loss DOUBLE PRECISION,
                    new_take_profit DOUBLE PRECISION,
                    confidence DOUBLE PRECISION,
                    urgency DOUBLE PRECISION,
                    rationale TEXT,
                    key_factors TEXT,
                    executed INTEGER DEFAULT 0,
                    execution_result TEXT
                );

                CREATE TABLE IF NOT EXISTS order_reviews (
                    id BIGSERIAL PRIMARY KEY,
                    timestamp TIMESTAMP DEFAULT (NOW() AT TIME ZONE 'utc'),
                    order_id BIGINT,
                    symbol TEXT NOT NULL,
                    order_type TEXT,
                    order_action TEXT,
                    order_quantity INTEGER,
                    order_price DOUBLE PRECISION,
                    current_price DOUBLE PRECISION,
                    bid_price DOUBLE PRECISION,
                    ask_price DOUBLE PRECISION,
                    price_distance_pct DOUBLE PRECISION,
                    order_age_minutes INTEGER,
                    action TEXT NOT NULL,
                    new_price DOUBLE PRECISION,
                    confidence DOUBLE PRECISION,
                    rationale TEXT,
                    executed INTEGER DEFAULT 0,
                    execution_result TEXT
                );
            )");

            txn.exec_params(
                "INSERT INTO runtime_config (id, config_json) VALUES (1, $1) "
                "ON CONFLICT (id) DO NOTHING",
                domain::defaultRuntimeConfigDocument().dump()
            );

            txn.exec(
                "INSERT INTO live_status (id, current_symbol, current_step) "
                "VALUES (1, 'Idle', 'Waiting for cycle') "
                "ON CONFLICT (id) DO NOTHING"
            );

            txn.commit();
            std::cout << "[PostgresSchema] Schema initialized" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSchema] initialize error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace autotrader::adapters::secondary
