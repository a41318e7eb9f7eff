#pragma once

#include "PostgresRow.hpp"
#include "ports/output/ISocialSentimentSource.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>

namespace autotrader::adapters::secondary {

/**
 * @brief Оценки обсуждений из reddit_sentiment (таблицу наполняет внешний сборщик)
 */
class PostgresSocialSentimentSource : public ports::output::ISocialSentimentSource {
public:
    explicit PostgresSocialSentimentSource(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresSocialSentimentSource] Initialized" << std::endl;
    }

    std::optional<domain::SocialSentiment> latest(const std::string& symbol) override {
        std::string upper = symbol;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT symbol, mentions, sentiment, confidence, rationale, source_fetch_utc "
                "FROM reddit_sentiment WHERE symbol = $1 "
                "ORDER BY timestamp DESC, id DESC LIMIT 1",
                upper
            );

            txn.commit();

            if (!result.empty()) {
                const auto& row = result[0];
                domain::SocialSentiment s;
                s.symbol = pg::text(row["symbol"]);
                s.mentions = pg::optionalInt(row["mentions"]).value_or(0);
                s.sentiment = pg::optionalDouble(row["sentiment"]);
                s.confidence = pg::optionalDouble(row["confidence"]);
                s.rationale = pg::text(row["rationale"]);
                s.sourceFetchUtc = row["source_fetch_utc"].is_null()
                    ? 0 : row["source_fetch_utc"].as<long long>();
                return s;
            }
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSocialSentimentSource] latest error: " << e.what() << std::endl;
        }

        return std::nullopt;
    }

    std::vector<std::string> topSymbols(int limit) override {
        std::vector<std::string> symbols;

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            // Последняя запись по каждому символу, самые обсуждаемые первыми
            auto result = txn.exec_params(
                "SELECT rs.symbol "
                "FROM reddit_sentiment rs "
                "INNER JOIN ("
                "    SELECT symbol, MAX(timestamp) AS max_ts "
                "    FROM reddit_sentiment GROUP BY symbol"
                ") latest ON rs.symbol = latest.symbol AND rs.timestamp = latest.max_ts "
                "ORDER BY rs.mentions DESC NULLS LAST, rs.symbol ASC "
                "LIMIT $1",
                limit
            );

            for (const auto& row : result) {
                auto symbol = pg::text(row["symbol"]);
                if (!symbol.empty()) symbols.push_back(symbol);
            }

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSocialSentimentSource] topSymbols error: " << e.what() << std::endl;
        }

        return symbols;
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace autotrader::adapters::secondary
