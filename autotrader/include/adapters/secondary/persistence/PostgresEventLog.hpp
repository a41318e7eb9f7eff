#pragma once

#include "PostgresRow.hpp"
#include "ports/output/IEventLog.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace autotrader::adapters::secondary {

/**
 * @brief Лента событий (event_stream) и журнал (logs) в PostgreSQL
 *
 * Запись события дублируется в stdout/stderr с тегом шага, чтобы
 * лог контейнера совпадал с дашбордом. Ошибка записи в БД не
 * пробрасывается: лента вызывается и из обработчиков ошибок цикла.
 */
class PostgresEventLog : public ports::output::IEventLog {
public:
    explicit PostgresEventLog(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresEventLog] Initialized" << std::endl;
    }

    void logEvent(const std::string& level,
                  const std::string& message,
                  const std::string& symbol,
                  const std::string& step) override {
        auto& out = (level == "INFO") ? std::cout : std::cerr;
        out << "[" << (step.empty() ? "Event" : step) << "] "
            << (symbol.empty() ? "" : symbol + ": ") << message << std::endl;

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "INSERT INTO event_stream (level, symbol, step, message) "
                "VALUES ($1, $2, $3, $4)",
                level,
                pg::nullIfEmpty(symbol),
                pg::nullIfEmpty(step),
                message
            );

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresEventLog] logEvent error: " << e.what() << std::endl;
        }
    }

    void logMessage(const std::string& level, const std::string& message) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "INSERT INTO logs (level, message) VALUES ($1, $2)",
                level,
                message
            );

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresEventLog] logMessage error: " << e.what() << std::endl;
        }
    }

    std::vector<domain::EventRecord> eventsAfter(int64_t afterId, int limit) override {
        std::vector<domain::EventRecord> events;

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, timestamp, level, symbol, step, message "
                "FROM event_stream WHERE id > $1 "
                "ORDER BY id ASC LIMIT $2",
                afterId,
                limit
            );

            for (const auto& row : result) {
                domain::EventRecord event;
                event.id = row["id"].as<int64_t>();
                event.timestamp = pg::timestamp(row["timestamp"]);
                event.level = pg::text(row["level"]);
                event.symbol = pg::text(row["symbol"]);
                event.step = pg::text(row["step"]);
                event.message = pg::text(row["message"]);
                events.push_back(std::move(event));
            }

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresEventLog] eventsAfter error: " << e.what() << std::endl;
        }

        return events;
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace autotrader::adapters::secondary
