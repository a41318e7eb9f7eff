#pragma once

#include "application/CandidateResearcher.hpp"
#include "application/MarketScreener.hpp"
#include "application/OrderExecutor.hpp"
#include "domain/AccountValue.hpp"
#include "domain/Candidate.hpp"
#include "domain/MarketContext.hpp"
#include "domain/Position.hpp"
#include "domain/TradingConfig.hpp"
#include "domain/enums/ResearchDecision.hpp"
#include "ports/input/IPositionReviewService.hpp"
#include "ports/input/IRuntimeConfigService.hpp"
#include "ports/input/ITradingLoop.hpp"
#include "ports/output/IBrokerGateway.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IDecisionService.hpp"
#include "ports/output/IEventLog.hpp"
#include "ports/output/ILiveStatusRepository.hpp"
#include "ports/output/IResearchRepository.hpp"
#include "ports/output/ISnapshotRepository.hpp"
#include "ports/output/ISocialSentimentSource.hpp"
#include "ports/output/ITradeRepository.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace autotrader::application {

/**
 * @brief Основной цикл: конфиг -> страховка -> ревью -> скринер ->
 *        исследование -> выбор -> покупки -> пауза
 *
 * Один управляющий поток. Итерация заканчивается паузой до следующего
 * цикла; stop() прерывает паузу. Исключение, вылетевшее из итерации,
 * логируется, цикл продолжается.
 */
class CycleScheduler : public ports::input::ITradingLoop {
public:
    /**
     * @brief Зависимости цикла
     *
     * social может быть nullptr (источник соцсетей не подключён).
     */
    struct Dependencies {
        std::shared_ptr<ports::input::IRuntimeConfigService> config;
        std::shared_ptr<ports::input::IPositionReviewService> review;
        std::shared_ptr<ports::output::IBrokerGateway> broker;
        std::shared_ptr<OrderExecutor> executor;
        std::shared_ptr<MarketScreener> screener;
        std::shared_ptr<CandidateResearcher> researcher;
        std::shared_ptr<ports::output::IDecisionService> decisions;
        std::shared_ptr<ports::output::ISocialSentimentSource> social;
        std::shared_ptr<ports::output::ISnapshotRepository> snapshots;
        std::shared_ptr<ports::output::IResearchRepository> research;
        std::shared_ptr<ports::output::ITradeRepository> trades;
        std::shared_ptr<ports::output::IEventLog> events;
        std::shared_ptr<ports::output::ILiveStatusRepository> liveStatus;
        std::shared_ptr<ports::output::IClock> clock;
    };

    struct Options {
        double orderReviewMinAgeMinutes = 0.0;
        size_t topCandidates = 10;
        std::chrono::milliseconds accountTimeout{std::chrono::seconds(10)};
        /// Пауза, пока ни один цикл не прочитал конфигурацию (базовый cycle_interval_seconds)
        std::chrono::seconds initialInterval{3600};
    };

    CycleScheduler(Dependencies deps, Options options);
    ~CycleScheduler() override;

    CycleScheduler(const CycleScheduler&) = delete;
    CycleScheduler& operator=(const CycleScheduler&) = delete;

    void start() override;
    void stop() override;
    bool isRunning() const override;
    std::chrono::seconds runCycle() override;

    /**
     * @brief Лучшие кандидаты последнего цикла (для ротации при ревью)
     */
    std::vector<domain::TopCandidate> topCandidates() const;
    std::optional<domain::MarketContext> lastMarketContext() const;

    static domain::MarketContext marketContextFrom(const std::optional<domain::MarketSnapshot>& spy,
                                                   const std::optional<domain::MarketSnapshot>& qqq);

private:
    Dependencies deps_;
    Options options_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    mutable std::mutex mutex_;
    std::condition_variable wakeup_;

    // Состояние между циклами (только управляющий поток пишет)
    std::vector<domain::TopCandidate> topCandidates_;
    std::optional<domain::MarketContext> lastMarket_;
    std::optional<std::chrono::system_clock::time_point> lastReview_;
    std::chrono::seconds lastInterval_{3600};

    void loop();
    void sleepFor(std::chrono::seconds duration);

    void safetyNet();
    void flattenBeforeClose(const domain::TradingConfig& cfg);
    void runReviews(const domain::TradingConfig& cfg);
    std::vector<domain::Candidate> universe(const domain::TradingConfig& cfg);
    std::vector<domain::AccountSummaryItem> snapshotAccount();
    domain::MarketContext fetchMarketContext();

    struct Ranked {
        domain::EligibleCandidate eligible;
        std::string reason;
    };

    void placeSelected(std::vector<Ranked>& ranked,
                       const std::vector<std::string>& desired,
                       const domain::TradingConfig& cfg,
                       int maxNew,
                       domain::BudgetLedger& budgets,
                       std::optional<double> equity);

    void updateOutcome(const Ranked& r, domain::ResearchDecision decision, const std::string& reason);

    std::chrono::seconds pace(std::chrono::system_clock::time_point started,
                              const domain::TradingConfig& cfg);

    void setTopCandidates(const std::vector<Ranked>& ranked);
};

} // namespace autotrader::application
