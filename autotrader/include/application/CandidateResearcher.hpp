#pragma once

#include "application/DecisionPayloads.hpp"
#include "application/MarketHours.hpp"
#include "application/TechnicalIndicators.hpp"
#include "domain/BudgetLedger.hpp"
#include "domain/Candidate.hpp"
#include "domain/MarketContext.hpp"
#include "domain/ResearchRecord.hpp"
#include "domain/TradingConfig.hpp"
#include "domain/errors/ErrorType.hpp"
#include "ports/output/IBrokerGateway.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IDecisionService.hpp"
#include "ports/output/IEventLog.hpp"
#include "ports/output/ILiveStatusRepository.hpp"
#include "ports/output/IResearchRepository.hpp"
#include "ports/output/ISocialSentimentSource.hpp"

#include <WorkerPool.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace autotrader::application {

/**
 * @brief Исследование кандидатов цикла
 *
 * Каждый символ анализируется задачей в WorkerPool с жёстким лимитом
 * времени. По истечении лимита ожидание прекращается (задача
 * дорабатывает в фоне, результат отбрасывается), кандидат отклоняется.
 *
 * На каждого кандидата пишется ровно одна строка research_log.
 */
class CandidateResearcher {
public:
    /**
     * @brief Неизменяемый снимок состояния цикла для задач анализа
     */
    struct Context {
        domain::TradingConfig config;
        domain::MarketContext market;
        std::set<std::string> openSymbols;
        domain::BudgetLedger budgets;
        std::chrono::milliseconds symbolTimeout{std::chrono::seconds(45)};
    };

    struct Outcome {
        domain::ResearchRecord record;
        std::optional<domain::EligibleCandidate> eligible;
    };

    CandidateResearcher(std::shared_ptr<ports::output::IBrokerGateway> broker,
                        std::shared_ptr<ports::output::IDecisionService> decisions,
                        std::shared_ptr<ports::output::ISocialSentimentSource> social,
                        std::shared_ptr<ports::output::IResearchRepository> research,
                        std::shared_ptr<ports::output::IEventLog> events,
                        std::shared_ptr<ports::output::ILiveStatusRepository> liveStatus,
                        std::shared_ptr<ports::output::IClock> clock,
                        std::shared_ptr<common::WorkerPool> pool)
        : broker_(std::move(broker))
        , decisions_(std::move(decisions))
        , social_(std::move(social))
        , research_(std::move(research))
        , events_(std::move(events))
        , liveStatus_(std::move(liveStatus))
        , clock_(std::move(clock))
        , pool_(std::move(pool))
    {}

    /**
     * @brief Проанализировать всех кандидатов и записать research_log
     * @return исходы в порядке кандидатов; eligible заполнен у прошедших фильтры
     */
    std::vector<Outcome> researchAll(const std::vector<domain::Candidate>& candidates,
                                     const Context& ctx) {
        auto shared = std::make_shared<const Context>(ctx);
        const int total = static_cast<int>(candidates.size());

        std::vector<Pending> pending;
        pending.reserve(candidates.size());
        for (int i = 0; i < total; ++i) {
            Pending p;
            p.candidate = candidates[static_cast<size_t>(i)];
            p.started = std::make_shared<std::atomic<bool>>(false);
            p.startedAt = std::make_shared<std::atomic<int64_t>>(0);
            p.submittedAt = std::chrono::steady_clock::now();
            auto started = p.started;
            auto startedAt = p.startedAt;
            auto candidate = p.candidate;
            int idx = i + 1;
            p.future = pool_->submit([this, shared, candidate, idx, total, started, startedAt]() {
                startedAt->store(steadyNowMs());
                started->store(true);
                return researchOne(candidate, *shared, idx, total);
            });
            pending.push_back(std::move(p));
        }

        const size_t threads = std::max<size_t>(1, pool_->threadCount());
        const auto queueLimit = ctx.symbolTimeout *
            static_cast<int>((candidates.size() + threads - 1) / threads + 1);

        std::vector<Outcome> outcomes;
        outcomes.reserve(pending.size());
        for (auto& p : pending) {
            Outcome outcome = await(p, ctx.symbolTimeout, queueLimit);
            persist(outcome);
            outcomes.push_back(std::move(outcome));
        }
        return outcomes;
    }

    /**
     * @brief Анализ одного символа без лимита времени (выполняется в пуле)
     */
    Outcome researchOne(const domain::Candidate& candidate, const Context& ctx, int idx, int total) {
        const auto& cfg = ctx.config;
        const std::string& symbol = candidate.contract.symbol;
        const std::string progress = " (" + std::to_string(idx) + "/" + std::to_string(total) + ")";

        Outcome out;
        out.record = baseRecord(candidate);

        try {
            liveStatus_->update(symbol, "Fetching market data" + progress);
            events_->logEvent("INFO", "Fetching market data", symbol, "Market Data");

            auto qualified = broker_->qualifyContract(candidate.contract);
            if (!qualified) {
                out.record.reason = "Contract could not be qualified";
                return out;
            }
            out.record.exchange = qualified->exchange;
            out.record.currency = qualified->currency;

            std::vector<domain::Bar> bars = cfg.intraday.enabled
                ? broker_->getHistoricalBars(*qualified, cfg.intraday.duration, cfg.intraday.barSize,
                                             cfg.intraday.useRth)
                : broker_->getHistoricalBars(*qualified, "1 M", "1 day", true);
            if (bars.empty()) {
                out.record.reason = "No market data";
                return out;
            }

            liveStatus_->update(symbol, "Calculating technical indicators" + progress);
            events_->logEvent("INFO", "Calculating technical indicators", symbol, "Indicators");
            domain::Signals signals = TechnicalIndicators::signals(bars);
            out.record.price = signals.price;
            out.record.rsi = signals.indicators.rsi;
            out.record.volatilityRatio = signals.indicators.volatilityRatio;

            std::optional<domain::SocialSentiment> social;
            if (cfg.reddit.enabled && social_) {
                social = social_->latest(symbol);
                if (social) {
                    out.record.redditMentions = social->mentions;
                    out.record.redditSentiment = social->sentiment;
                    out.record.redditConfidence = social->confidence;
                }
            }

            std::optional<domain::MarketSnapshot> snapshot;
            try {
                snapshot = broker_->getMarketSnapshot(*qualified);
            } catch (const domain::BrokerError& e) {
                std::cerr << "[CandidateResearcher] Snapshot unavailable for " << symbol
                          << ": " << e.what() << std::endl;
            }

            liveStatus_->update(symbol, "Fetching news" + progress);
            events_->logEvent("INFO", "Fetching news", symbol, "News");
            std::vector<std::string> headlines;
            try {
                headlines = broker_->getHeadlines(*qualified, 10);
            } catch (const domain::BrokerError& e) {
                events_->logEvent("WARN", std::string("Headlines unavailable: ") + e.what(), symbol, "News");
            }

            std::vector<std::string> sources;
            if (!headlines.empty()) sources.push_back("News");
            if (social && social->sentiment && social->confidence) sources.push_back("Reddit");
            if (snapshot && snapshot->volume) sources.push_back("Fundamentals");
            sources.push_back("Technicals");
            const std::string aiLabel = "AI (" + join(sources, "+") + ")";

            liveStatus_->update(symbol, "AI shortlist (" + cfg.ai.model + ")" + progress);
            events_->logEvent("INFO", "AI shortlist using: " + join(sources, ", "), symbol, "AI");

            auto payload = DecisionPayloads::shortlist(*qualified, signals, headlines, social,
                                                       snapshot, ctx.market, cfg);
            auto decision = decisions_->shortlist(payload, cfg.ai);

            out.record.sentimentScore = decision.sentiment;
            out.record.score = decision.score;
            out.record.aiReasoning = toJson(decision).dump(2);

            const std::string verdict = aiLabel + ": " + (decision.isShortlisted() ? "SHORTLIST" : "SKIP") +
                " (conf " + format2(decision.confidence) + ") — " + decision.rationale;
            if (!decision.isShortlisted()) {
                out.record.decision = domain::ResearchDecision::REJECTED;
                out.record.reason = verdict;
                return out;
            }

            out.record.decision = domain::ResearchDecision::SHORTLISTED;
            out.record.reason = verdict;

            if (auto rejection = gate(*qualified, ctx, verdict)) {
                out.record.decision = domain::ResearchDecision::REJECTED;
                out.record.reason = *rejection;
                return out;
            }

            domain::EligibleCandidate eligible;
            eligible.candidate = candidate;
            eligible.qualified = *qualified;
            eligible.signals = signals;
            eligible.decision = decision;
            out.eligible = eligible;
        } catch (const domain::BrokerTimeoutError& e) {
            out.record.decision = domain::ResearchDecision::REJECTED;
            out.record.reason = std::string("Error during analysis: BrokerTimeoutError: ") + e.what();
            events_->logEvent("WARN", std::string("Timeout: ") + e.what(), symbol, "Timeout");
        } catch (const std::exception& e) {
            out.record.decision = domain::ResearchDecision::REJECTED;
            out.record.reason = "Error during analysis: " + domain::errorTypeName(e) + ": " + e.what();
            events_->logEvent("ERROR", "Unexpected error: " + domain::errorTypeName(e) + ": " + e.what(),
                              symbol, "Error");
        }
        return out;
    }

    /**
     * @brief Жёсткие фильтры шорт-листа; nullopt - кандидат проходит
     */
    std::optional<std::string> gate(const domain::Contract& contract, const Context& ctx,
                                    const std::string& verdict) const {
        auto market = MarketHours::marketOf(contract.exchange, contract.currency);
        auto now = clock_->now();
        if (!MarketHours::isOpen(market, now)) {
            return "Market closed: " + verdict;
        }
        if (ctx.config.intraday.enabled &&
            MarketHours::isNearClose(market, now, ctx.config.intraday.flattenMinutesBeforeClose)) {
            return std::string("Too close to market close (no new entries)");
        }
        if (ctx.openSymbols.count(contract.symbol) > 0) {
            return std::string("Already holding a position");
        }
        if (ctx.budgets.remaining(contract.currency) <= 0.0) {
            return "No available cash budget for " + contract.currency;
        }
        return std::nullopt;
    }

private:
    struct Pending {
        domain::Candidate candidate;
        std::future<Outcome> future;
        std::shared_ptr<std::atomic<bool>> started;
        std::shared_ptr<std::atomic<int64_t>> startedAt;
        std::chrono::steady_clock::time_point submittedAt;
    };

    std::shared_ptr<ports::output::IBrokerGateway> broker_;
    std::shared_ptr<ports::output::IDecisionService> decisions_;
    std::shared_ptr<ports::output::ISocialSentimentSource> social_;
    std::shared_ptr<ports::output::IResearchRepository> research_;
    std::shared_ptr<ports::output::IEventLog> events_;
    std::shared_ptr<ports::output::ILiveStatusRepository> liveStatus_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<common::WorkerPool> pool_;

    static int64_t steadyNowMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
    }

    /**
     * @brief Ждать результат: лимит считается от старта задачи,
     *        а для не стартовавшей - от постановки в очередь с запасом на очередь
     */
    Outcome await(Pending& p, std::chrono::milliseconds timeout, std::chrono::milliseconds queueLimit) {
        const auto slice = std::chrono::milliseconds(50);
        while (true) {
            if (p.future.wait_for(slice) == std::future_status::ready) {
                try {
                    return p.future.get();
                } catch (const std::exception& e) {
                    Outcome failed;
                    failed.record = baseRecord(p.candidate);
                    failed.record.reason = "Error during analysis: " + domain::errorTypeName(e) + ": " + e.what();
                    return failed;
                }
            }

            bool expired = false;
            if (p.started->load()) {
                auto elapsed = std::chrono::milliseconds(steadyNowMs() - p.startedAt->load());
                expired = elapsed >= timeout;
            } else {
                expired = std::chrono::steady_clock::now() - p.submittedAt >= queueLimit;
            }
            if (expired) {
                return timedOut(p.candidate, timeout);
            }
        }
    }

    Outcome timedOut(const domain::Candidate& candidate, std::chrono::milliseconds timeout) {
        const std::string limit = limitLabel(timeout);
        domain::SymbolTimeoutError error("processing exceeded " + limit);

        Outcome out;
        out.record = baseRecord(candidate);
        out.record.reason = std::string("Symbol processing timed out: ") + error.what();
        events_->logEvent("WARN", "Symbol timed out after " + limit, candidate.contract.symbol, "Timeout");
        std::cerr << "[CandidateResearcher] " << candidate.contract.symbol << " timed out after "
                  << limit << std::endl;
        return out;
    }

    void persist(Outcome& outcome) {
        auto& record = outcome.record;
        record.timestamp = domain::Timestamp(clock_->now());
        try {
            record.id = research_->insert(record);
        } catch (const std::exception& e) {
            std::cerr << "[CandidateResearcher] Failed to write research row for " << record.symbol
                      << ": " << e.what() << std::endl;
        }
        if (outcome.eligible) {
            outcome.eligible->researchId = record.id;
        }

        const std::string line = "Decision: " + domain::toString(record.decision) + " (" + record.reason + ")";
        events_->logEvent("INFO", line, record.symbol, "Decision");
        events_->logMessage("INFO", record.symbol + " decision: " + domain::toString(record.decision) +
                                        " (" + record.reason + ")");
    }

    static domain::ResearchRecord baseRecord(const domain::Candidate& candidate) {
        domain::ResearchRecord record;
        record.symbol = candidate.contract.symbol;
        record.exchange = candidate.contract.exchange;
        record.currency = candidate.contract.currency;
        record.price = candidate.lastPrice;
        return record;
    }

    static nlohmann::json toJson(const domain::ShortlistDecision& d) {
        return nlohmann::json{
            {"decision", d.decision},
            {"confidence", d.confidence},
            {"score", d.score},
            {"sentiment", d.sentiment},
            {"rationale", d.rationale},
            {"key_factors", d.keyFactors},
            {"key_risks", d.keyRisks}};
    }

    static std::string limitLabel(std::chrono::milliseconds timeout) {
        if (timeout.count() % 1000 == 0) {
            return std::to_string(timeout.count() / 1000) + "s";
        }
        return std::to_string(timeout.count()) + "ms";
    }

    static std::string format2(double v) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.2f", v);
        return buf;
    }

    static std::string join(const std::vector<std::string>& parts, const std::string& sep) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) out += sep;
            out += parts[i];
        }
        return out;
    }
};

} // namespace autotrader::application
