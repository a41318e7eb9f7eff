#pragma once

#include "PostgresRow.hpp"
#include "ports/output/IResearchRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace autotrader::adapters::secondary {

/**
 * @brief research_log: строка создаётся на входе в исследование и
 *        дополняется итогом (decision/reason) и рангом по ходу цикла
 */
class PostgresResearchRepository : public ports::output::IResearchRepository {
public:
    explicit PostgresResearchRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresResearchRepository] Initialized" << std::endl;
    }

    int64_t insert(const domain::ResearchRecord& record) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "INSERT INTO research_log "
                "(symbol, exchange, currency, price, rsi, volatility_ratio, sentiment_score, "
                " ai_reasoning, score, rank, reddit_mentions, reddit_sentiment, "
                " reddit_confidence, decision, reason) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15) "
                "RETURNING id",
                record.symbol,
                pg::nullIfEmpty(record.exchange),
                pg::nullIfEmpty(record.currency),
                record.price,
                record.rsi,
                record.volatilityRatio,
                record.sentimentScore,
                pg::nullIfEmpty(record.aiReasoning),
                record.score,
                record.rank,
                record.redditMentions,
                record.redditSentiment,
                record.redditConfidence,
                domain::toString(record.decision),
                record.reason
            );

            txn.commit();
            return result.empty() ? 0 : result[0][0].as<int64_t>();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresResearchRepository] insert error: " << e.what() << std::endl;
            throw;
        }
    }

    void updateOutcome(int64_t id, domain::ResearchDecision decision,
                       const std::string& reason) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "UPDATE research_log SET decision = $1, reason = $2 WHERE id = $3",
                domain::toString(decision),
                reason,
                id
            );

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresResearchRepository] updateOutcome error: " << e.what() << std::endl;
            throw;
        }
    }

    void updateRank(int64_t id, int rank) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params("UPDATE research_log SET rank = $1 WHERE id = $2", rank, id);

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresResearchRepository] updateRank error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::ResearchRecord> recent(int limit) override {
        std::vector<domain::ResearchRecord> records;

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, timestamp, symbol, exchange, currency, price, rsi, "
                "       volatility_ratio, sentiment_score, ai_reasoning, score, rank, "
                "       reddit_mentions, reddit_sentiment, reddit_confidence, decision, reason "
                "FROM research_log ORDER BY timestamp DESC, id DESC LIMIT $1",
                limit
            );

            for (const auto& row : result) {
                domain::ResearchRecord r;
                r.id = row["id"].as<int64_t>();
                r.timestamp = pg::timestamp(row["timestamp"]);
                r.symbol = pg::text(row["symbol"]);
                r.exchange = pg::text(row["exchange"]);
                r.currency = pg::text(row["currency"]);
                r.price = pg::optionalDouble(row["price"]);
                r.rsi = pg::optionalDouble(row["rsi"]);
                r.volatilityRatio = pg::optionalDouble(row["volatility_ratio"]);
                r.sentimentScore = pg::optionalDouble(row["sentiment_score"]);
                r.aiReasoning = pg::text(row["ai_reasoning"]);
                r.score = pg::optionalDouble(row["score"]);
                r.rank = pg::optionalInt(row["rank"]);
                r.redditMentions = pg::optionalInt(row["reddit_mentions"]);
                r.redditSentiment = pg::optionalDouble(row["reddit_sentiment"]);
                r.redditConfidence = pg::optionalDouble(row["reddit_confidence"]);
                r.decision = domain::parseResearchDecision(pg::text(row["decision"]));
                r.reason = pg::text(row["reason"]);
                records.push_back(std::move(r));
            }

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresResearchRepository] recent error: " << e.what() << std::endl;
        }

        return records;
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace autotrader::adapters::secondary
