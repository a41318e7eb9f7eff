#include "application/CycleScheduler.hpp"

#include "application/DecisionPayloads.hpp"
#include "application/MarketHours.hpp"
#include "application/RiskAllocator.hpp"
#include "application/TechnicalIndicators.hpp"
#include "domain/TradeRecord.hpp"
#include "domain/errors/ErrorType.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>

namespace autotrader::application {

namespace {

std::string format1(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", v);
    return buf;
}

std::string truncate(const std::string& s, size_t n) {
    return s.size() > n ? s.substr(0, n) : s;
}

std::string percentOrNa(const std::optional<double>& v) {
    if (!v) return "N/A";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", *v);
    return buf;
}

std::optional<double> changePct(const std::optional<domain::MarketSnapshot>& snap) {
    if (!snap || !snap->close || *snap->close <= 0.0) {
        return std::nullopt;
    }
    auto last = snap->price();
    if (!last || *last <= 0.0) {
        return std::nullopt;
    }
    return TechnicalIndicators::round2((*last - *snap->close) / *snap->close * 100.0);
}

const std::vector<std::string> kSummaryTags = {
    "NetLiquidation", "TotalCashValue", "AvailableFunds", "GrossPositionValue", "CashBalance"};

} // namespace

// ============================================================================
// Жизненный цикл
// ============================================================================

CycleScheduler::CycleScheduler(Dependencies deps, Options options)
    : deps_(std::move(deps))
    , options_(options)
    , lastInterval_(options.initialInterval)
{
}

CycleScheduler::~CycleScheduler()
{
    stop();
}

void CycleScheduler::start()
{
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    std::cout << "[CycleScheduler] Starting trading loop" << std::endl;
    worker_ = std::thread([this]() { loop(); });
}

void CycleScheduler::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    wakeup_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
        std::cout << "[CycleScheduler] Trading loop stopped" << std::endl;
    }
}

bool CycleScheduler::isRunning() const
{
    return running_.load();
}

void CycleScheduler::loop()
{
    while (running_) {
        std::chrono::seconds next = lastInterval_;
        try {
            next = runCycle();
        } catch (const std::exception& e) {
            std::cerr << "[CycleScheduler] Cycle failed: " << domain::errorTypeName(e) << ": "
                      << e.what() << std::endl;
            try {
                deps_.events->logEvent("ERROR", "Cycle failed: " + domain::errorTypeName(e) + ": " +
                                                    truncate(e.what(), 200), "Cycle", "Error");
            } catch (const std::exception& logError) {
                std::cerr << "[CycleScheduler] Failed to log cycle error: " << logError.what() << std::endl;
            }
        }
        sleepFor(next);
    }
}

void CycleScheduler::sleepFor(std::chrono::seconds duration)
{
    if (duration.count() <= 0) {
        return;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    wakeup_.wait_for(lock, duration, [this]() { return !running_.load(); });
}

std::vector<domain::TopCandidate> CycleScheduler::topCandidates() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return topCandidates_;
}

std::optional<domain::MarketContext> CycleScheduler::lastMarketContext() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return lastMarket_;
}

// ============================================================================
// Итерация
// ============================================================================

std::chrono::seconds CycleScheduler::runCycle()
{
    const auto cycleStart = deps_.clock->now();

    // 1. Эффективная конфигурация; без неё цикл не торгует
    domain::TradingConfig cfg;
    try {
        cfg = deps_.config->effectiveConfig();
    } catch (const std::exception& e) {
        std::string msg = "Runtime config unavailable/invalid: " + domain::errorTypeName(e) + ": " +
                          truncate(e.what(), 200);
        std::cerr << "[CycleScheduler] " << msg << std::endl;
        deps_.events->logEvent("ERROR", msg, "Config", "Runtime");
        deps_.liveStatus->update("Config", "Runtime config error; trading paused");
        return lastInterval_;
    }
    lastInterval_ = std::chrono::seconds(std::max(0, cfg.intraday.cycleIntervalSeconds));
    const auto interval = lastInterval_;

    // 2. Страховка: только лонг
    safetyNet();

    std::cout << "[CycleScheduler] Starting analysis cycle..." << std::endl;
    deps_.events->logMessage("INFO", "Starting analysis cycle");
    deps_.events->logEvent("INFO", "Starting analysis cycle", "Cycle", "Start");
    deps_.liveStatus->update("Screener", "Starting market scan");

    // 3. Закрытие перед концом сессии
    if (cfg.intraday.enabled) {
        flattenBeforeClose(cfg);
    }

    // 4. Ревью позиций и ордеров
    runReviews(cfg);

    // 5. Все рынки закрыты
    if (!MarketHours::anyOpen(cfg.trading.markets, deps_.clock->now())) {
        int closedSeconds = std::max(0, cfg.intraday.cycleIntervalSecondsClosed);
        int mins = std::max(1, closedSeconds / 60);
        std::string msg = "Market closed — next cycle in ~" + std::to_string(mins) + " min";
        std::cout << "[CycleScheduler] " << msg << std::endl;
        deps_.events->logEvent("INFO", msg, "Cycle", "MarketClosed");
        deps_.liveStatus->update("Idle", msg);
        return std::chrono::seconds(closedSeconds);
    }

    // 6. Вселенная кандидатов
    std::vector<domain::Candidate> candidates;
    try {
        candidates = universe(cfg);
    } catch (const std::exception& e) {
        std::cerr << "[CycleScheduler] Screener failed: " << e.what() << std::endl;
        deps_.events->logEvent("ERROR", std::string("Screener failed: ") + e.what(), "Screener", "Scan");
        deps_.liveStatus->update("Screener", "Screener error; waiting for next cycle");
        return interval;
    }
    if (candidates.empty()) {
        const std::string msg = "No candidates available; waiting for next cycle.";
        std::cerr << "[CycleScheduler] " << msg << std::endl;
        deps_.events->logEvent("ERROR", msg, "Screener", "Scan");
        deps_.liveStatus->update("Screener", msg);
        return interval;
    }

    // 7. Снимок аккаунта и фон рынка
    auto summary = snapshotAccount();
    auto market = fetchMarketContext();

    // 8. Позиции и свободные слоты
    std::vector<domain::Position> positions;
    try {
        positions = deps_.broker->getPositions(options_.accountTimeout);
    } catch (const std::exception& e) {
        std::string msg = std::string("Failed to retrieve open positions: ") + e.what();
        std::cerr << "[CycleScheduler] " << msg << std::endl;
        deps_.events->logMessage("ERROR", msg);
        deps_.events->logEvent("ERROR", msg, "IBKR", "Positions");
        deps_.liveStatus->update("IBKR", "Failed to retrieve open positions; waiting for next cycle");
        return interval;
    }

    std::set<std::string> openSymbols;
    for (const auto& p : positions) {
        if (p.quantity != 0.0) {
            openSymbols.insert(p.contract.symbol);
        }
    }
    const int openCount = static_cast<int>(openSymbols.size());

    try {
        deps_.snapshots->savePositions(positions);
        deps_.snapshots->saveOpenOrders(deps_.broker->getOpenOrders(options_.accountTimeout));
    } catch (const std::exception& e) {
        std::cerr << "[CycleScheduler] Portfolio snapshot failed: " << e.what() << std::endl;
    }

    const int maxNew = RiskAllocator::capacity(cfg.trading.maxPositions, openCount,
                                               cfg.trading.maxNewPositionsPerCycle);

    // 9. Бюджеты по валютам кандидатов
    std::set<std::string> currencies;
    for (const auto& c : candidates) {
        if (!c.contract.currency.empty()) {
            currencies.insert(c.contract.currency);
        }
    }
    auto budgets = RiskAllocator::allocate(
        summary, cfg.trading, currencies,
        [this](const std::string&, const std::string& msg) {
            deps_.events->logEvent("INFO", msg, "Risk", "Cash");
        },
        [this](const std::string&, const std::string& msg) {
            deps_.events->logEvent("ERROR", msg, "Risk", "Cash");
        });
    const auto equity = RiskAllocator::netLiquidation(summary);

    // 10. Исследование кандидатов в пуле
    CandidateResearcher::Context ctx;
    ctx.config = cfg;
    ctx.market = market;
    ctx.openSymbols = openSymbols;
    ctx.budgets = budgets;
    ctx.symbolTimeout = std::chrono::seconds(std::max(1, cfg.intraday.symbolTimeoutSeconds));
    auto outcomes = deps_.researcher->researchAll(candidates, ctx);

    std::vector<Ranked> ranked;
    for (auto& outcome : outcomes) {
        if (outcome.eligible) {
            ranked.push_back(Ranked{*outcome.eligible, outcome.record.reason});
        }
    }

    if (!ranked.empty()) {
        // 11. Ранжирование по score
        deps_.liveStatus->update("Selector", "Comparing " + std::to_string(ranked.size()) +
                                                 " shortlisted candidates");
        deps_.events->logEvent("INFO", "Comparing " + std::to_string(ranked.size()) +
                                           " shortlisted candidates", "Selector", "Rank");

        std::stable_sort(ranked.begin(), ranked.end(), [](const Ranked& a, const Ranked& b) {
            return a.eligible.decision.score > b.eligible.decision.score;
        });
        for (size_t i = 0; i < ranked.size(); ++i) {
            auto& e = ranked[i].eligible;
            e.rank = static_cast<int>(i) + 1;
            try {
                deps_.research->updateRank(e.researchId, *e.rank);
            } catch (const std::exception& ex) {
                std::cerr << "[CycleScheduler] Failed to persist rank for " << e.symbol()
                          << ": " << ex.what() << std::endl;
            }
        }

        if (maxNew <= 0) {
            // 12. Нет слотов: выбор не вызывается
            std::string msg = "No capacity for new positions (" + std::to_string(openCount) + "/" +
                              std::to_string(cfg.trading.maxPositions) + ").";
            std::cout << "[CycleScheduler] " << msg << std::endl;
            deps_.events->logMessage("INFO", msg);
            deps_.events->logEvent("INFO", msg, "Risk", "Limits");
        } else {
            // 12. Выбор покупок одним вызовом
            std::vector<domain::EligibleCandidate> eligible;
            std::vector<std::string> symbols;
            for (const auto& r : ranked) {
                eligible.push_back(r.eligible);
                symbols.push_back(r.eligible.symbol());
            }

            domain::BuySelection selection;
            try {
                auto payload = DecisionPayloads::selection(eligible, maxNew, budgets, market);
                selection = deps_.decisions->selectBuys(payload, symbols, maxNew, cfg.ai);
            } catch (const std::exception& e) {
                std::string msg = "Buy selection AI failed: " + domain::errorTypeName(e) + ": " +
                                  truncate(e.what(), 200);
                std::cerr << "[CycleScheduler] " << msg << std::endl;
                deps_.events->logEvent("ERROR", msg, "Selector", "AI");
                deps_.liveStatus->update("Selector", "AI selection error; waiting for next cycle");
                return interval;
            }
            if (!selection.rationale.empty()) {
                deps_.events->logEvent("INFO", "Buy selection: " + selection.rationale, "Selector", "AI");
            }

            // 13. Размещение ордеров строго по порядку выбора
            placeSelected(ranked, selection.selectedSymbols, cfg, maxNew, budgets, equity);
        }

        // 14. Лучшие кандидаты для ротации
        setTopCandidates(ranked);
    } else {
        setTopCandidates({});
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        lastMarket_ = market;
    }

    // 15. Темп
    return pace(cycleStart, cfg);
}

// ============================================================================
// Шаги цикла
// ============================================================================

void CycleScheduler::safetyNet()
{
    try {
        int orphaned = deps_.executor->cancelOrphanedSellOrders();
        if (orphaned > 0) {
            deps_.events->logEvent("WARN", "Cancelled " + std::to_string(orphaned) +
                                               " orphaned SELL order(s)", "Safety", "Shorts");
        }
        for (const auto& [symbol, qty] : deps_.executor->closeAllShorts()) {
            deps_.events->logEvent("WARN", "Closed short position: " + std::to_string(qty) + " shares",
                                   symbol, "Shorts");
            deps_.review->forgetPosition(symbol);
        }
    } catch (const std::exception& e) {
        std::cerr << "[CycleScheduler] Safety check failed: " << e.what() << std::endl;
    }
}

void CycleScheduler::flattenBeforeClose(const domain::TradingConfig& cfg)
{
    const int minutes = cfg.intraday.flattenMinutesBeforeClose;
    std::vector<domain::Position> positions;
    try {
        positions = deps_.broker->getPositions(options_.accountTimeout);
    } catch (const std::exception& e) {
        deps_.events->logEvent("ERROR", std::string("Failed to load portfolio for flattening: ") + e.what(),
                               "IBKR", "Flatten");
        return;
    }

    const auto now = deps_.clock->now();
    for (const auto& p : positions) {
        const int qty = static_cast<int>(p.quantity);
        if (qty <= 0) {
            continue;
        }
        const std::string& symbol = p.contract.symbol;
        auto market = MarketHours::marketOf(p.contract.exchange, p.contract.currency);
        if (!MarketHours::isNearClose(market, now, minutes)) {
            continue;
        }

        const std::string label = "(" + std::to_string(minutes) + "m)";
        try {
            deps_.liveStatus->update(symbol, "Flattening before close " + label);
            deps_.events->logEvent("INFO", "Flattening position before close " + label, symbol, "Flatten");

            auto placed = deps_.executor->sellPosition(p.contract, qty);
            if (!placed) {
                continue;
            }
            deps_.review->forgetPosition(symbol);

            domain::TradeRecord trade;
            trade.timestamp = domain::Timestamp(deps_.clock->now());
            trade.symbol = symbol;
            trade.action = "SELL";
            trade.quantity = qty;
            trade.price = p.marketPrice.value_or(0.0);
            trade.status = placed->status;
            trade.rationale = "Flatten before close " + label;
            try {
                deps_.trades->insert(trade);
            } catch (const std::exception& e) {
                std::cerr << "[CycleScheduler] Failed to record flatten trade for " << symbol
                          << ": " << e.what() << std::endl;
            }
        } catch (const std::exception& e) {
            deps_.events->logEvent("ERROR", std::string("Flattening failed: ") + e.what(), symbol, "Flatten");
        }
    }
}

void CycleScheduler::runReviews(const domain::TradingConfig& cfg)
{
    const auto now = deps_.clock->now();
    const auto interval = std::chrono::seconds(cfg.positionManagement.reviewIntervalSeconds);
    if (lastReview_ && now - *lastReview_ < interval) {
        return;
    }

    const auto top = topCandidates();
    const auto market = lastMarketContext().value_or(domain::MarketContext{});
    try {
        auto reviews = deps_.review->reviewPositions(cfg, top, market);
        auto executed = std::count_if(reviews.begin(), reviews.end(),
                                      [](const domain::PositionReviewRecord& r) { return r.executed; });
        if (executed > 0) {
            deps_.events->logEvent("INFO", "Position Manager: " + std::to_string(executed) +
                                               " actions executed", "PM", "Summary");
        }

        auto orderReviews = deps_.review->reviewOrders(cfg, options_.orderReviewMinAgeMinutes, market);
        auto orderActions = std::count_if(orderReviews.begin(), orderReviews.end(),
                                          [](const domain::OrderReviewRecord& r) { return r.executed; });
        if (orderActions > 0) {
            deps_.events->logEvent("INFO", "Order Manager: " + std::to_string(orderActions) +
                                               " orders adjusted/cancelled", "OM", "Summary");
        }
        lastReview_ = now;
    } catch (const std::exception& e) {
        std::cerr << "[CycleScheduler] Position/Order management failed: " << e.what() << std::endl;
        deps_.events->logEvent("ERROR", std::string("Position/Order management failed: ") + e.what(),
                               "PM", "Error");
    }
}

std::vector<domain::Candidate> CycleScheduler::universe(const domain::TradingConfig& cfg)
{
    deps_.liveStatus->update("Screener", "Requesting IBKR scanner results");
    deps_.events->logEvent("INFO", "Requesting IBKR scanner results", "Screener", "Scan");

    auto candidates = deps_.screener->candidates(cfg.trading);
    if (candidates.empty()) {
        deps_.events->logEvent("ERROR", "Screener returned no candidates.", "Screener", "Scan");
    } else {
        deps_.events->logMessage("INFO", "Screener returned " + std::to_string(candidates.size()) + " candidates");
        deps_.events->logEvent("INFO", "Screener returned " + std::to_string(candidates.size()) + " candidates",
                               "Screener", "Scan");
    }

    if (cfg.reddit.enabled && cfg.trading.screener.includeRedditSymbols && deps_.social) {
        try {
            auto symbols = deps_.social->topSymbols(50);
            std::set<std::string> known;
            for (const auto& c : candidates) known.insert(c.contract.symbol);
            size_t added = 0;
            for (const auto& s : symbols) {
                if (known.count(s) == 0) ++added;
            }
            if (!symbols.empty()) {
                candidates = MarketScreener::mergeSocial(symbols, std::move(candidates));
                int maxCandidates = cfg.trading.screener.maxCandidates > 0
                    ? cfg.trading.screener.maxCandidates : 250;
                if (static_cast<int>(candidates.size()) > maxCandidates) {
                    candidates.resize(static_cast<size_t>(maxCandidates));
                }
                deps_.events->logEvent("INFO", "Added " + std::to_string(std::min<size_t>(added, 50)) +
                                                   " Reddit symbol(s) into universe", "Reddit", "Universe");
            }
        } catch (const std::exception& e) {
            deps_.events->logEvent("ERROR", std::string("Reddit universe augmentation failed: ") + e.what(),
                                   "Reddit", "Universe");
        }
    }
    return candidates;
}

std::vector<domain::AccountSummaryItem> CycleScheduler::snapshotAccount()
{
    std::vector<domain::AccountSummaryItem> summary;
    try {
        summary = deps_.broker->getAccountSummary(options_.accountTimeout);

        std::vector<domain::AccountSummaryItem> persisted;
        for (const auto& item : summary) {
            if (std::find(kSummaryTags.begin(), kSummaryTags.end(), item.tag) != kSummaryTags.end()) {
                persisted.push_back(item);
            }
        }

        auto equity = RiskAllocator::netLiquidation(summary);
        if (!equity) {
            throw std::runtime_error("NetLiquidation not available in account summary");
        }

        double unrealised = 0.0;
        double realised = 0.0;
        try {
            for (const auto& p : deps_.broker->getPositions(options_.accountTimeout)) {
                unrealised += p.unrealisedPnl.value_or(0.0);
                realised += p.realisedPnl.value_or(0.0);
            }
        } catch (const std::exception& e) {
            std::cerr << "[CycleScheduler] Failed to fetch PnL from portfolio: " << e.what() << std::endl;
        }
        persisted.push_back(domain::AccountSummaryItem{"UnrealizedPnL", unrealised, "USD"});
        persisted.push_back(domain::AccountSummaryItem{"RealizedPnL", realised, "USD"});
        deps_.snapshots->saveAccountSummary(persisted);

        domain::PerformanceRecord perf;
        perf.timestamp = domain::Timestamp(deps_.clock->now());
        perf.equity = *equity;
        perf.unrealisedPnl = unrealised;
        perf.realisedPnl = realised;
        deps_.snapshots->recordPerformance(perf);
    } catch (const std::exception& e) {
        std::cerr << "[CycleScheduler] Failed to update performance: " << e.what() << std::endl;
        deps_.events->logEvent("ERROR", std::string("Failed to update account snapshot: ") + e.what(),
                               "IBKR", "Account");
    }
    return summary;
}

domain::MarketContext CycleScheduler::marketContextFrom(const std::optional<domain::MarketSnapshot>& spy,
                                                        const std::optional<domain::MarketSnapshot>& qqq)
{
    domain::MarketContext ctx;
    ctx.spyChangePct = changePct(spy);
    ctx.qqqChangePct = changePct(qqq);
    double spyChange = ctx.spyChangePct.value_or(0.0);
    ctx.sentiment = spyChange > 0.3 ? "bullish" : (spyChange < -0.3 ? "bearish" : "neutral");
    return ctx;
}

domain::MarketContext CycleScheduler::fetchMarketContext()
{
    try {
        deps_.liveStatus->update("Market", "Fetching SPY/QQQ context");
        auto spy = deps_.broker->getMarketSnapshot(domain::Contract("SPY", "SMART", "USD"));
        auto qqq = deps_.broker->getMarketSnapshot(domain::Contract("QQQ", "SMART", "USD"));
        auto ctx = marketContextFrom(spy, qqq);
        deps_.events->logEvent("INFO", "Market: SPY " + percentOrNa(ctx.spyChangePct) + "%, QQQ " +
                                           percentOrNa(ctx.qqqChangePct) + "%", "Market", "Context");
        return ctx;
    } catch (const std::exception& e) {
        std::cerr << "[CycleScheduler] Failed to fetch market context: " << e.what() << std::endl;
        return domain::MarketContext{};
    }
}

void CycleScheduler::placeSelected(std::vector<Ranked>& ranked,
                                   const std::vector<std::string>& desired,
                                   const domain::TradingConfig& cfg,
                                   int maxNew,
                                   domain::BudgetLedger& budgets,
                                   std::optional<double> equity)
{
    std::set<std::string> desiredSet(desired.begin(), desired.end());
    std::map<std::string, Ranked*> bySymbol;
    for (auto& r : ranked) {
        bySymbol[r.eligible.symbol()] = &r;
        if (desiredSet.count(r.eligible.symbol()) == 0) {
            updateOutcome(r, domain::ResearchDecision::SHORTLISTED, "Shortlisted; not selected this cycle");
        }
    }

    std::vector<std::string> placed;
    for (const auto& symbol : desired) {
        if (static_cast<int>(placed.size()) >= maxNew) {
            break;
        }
        auto it = bySymbol.find(symbol);
        if (it == bySymbol.end()) {
            continue;
        }
        Ranked& r = *it->second;
        const auto& e = r.eligible;
        const std::string& currency = e.currency();
        const int rank = e.rank.value_or(0);

        auto atr = e.signals.indicators.atr;
        if (!atr || !e.signals.price) {
            updateOutcome(r, domain::ResearchDecision::SHORTLISTED,
                          "Selected by AI but ATR missing; cannot set stop-loss");
            continue;
        }
        const double price = *e.signals.price;
        const double stop = *RiskAllocator::stopLoss(price, atr, cfg.trading.stopAtrMultiplier);
        if (stop <= 0.0) {
            updateOutcome(r, domain::ResearchDecision::SHORTLISTED,
                          "Selected by AI but stop-loss would be <= 0; skipping");
            continue;
        }
        if (!equity) {
            updateOutcome(r, domain::ResearchDecision::SHORTLISTED,
                          "Selected by AI but net liquidation not available; cannot size position");
            continue;
        }
        const int quantity = RiskAllocator::sizeWithinBudget(*equity, cfg.trading.riskPerTrade, price, stop,
                                                             budgets.remaining(currency));
        if (quantity <= 0) {
            updateOutcome(r, domain::ResearchDecision::SHORTLISTED,
                          "Selected by AI but insufficient " + currency + " budget for position sizing");
            continue;
        }

        deps_.liveStatus->update(symbol, "Placing order (rank " + std::to_string(rank) + ")");
        const std::string& rationale = e.decision.rationale;
        if (!rationale.empty()) {
            deps_.events->logEvent("INFO", "AI selected for BUY (rank " + std::to_string(rank) + ") — " + rationale,
                                   symbol, "Trade");
        } else {
            deps_.events->logEvent("INFO", "Placing order (rank " + std::to_string(rank) + ")", symbol, "Trade");
        }

        const double takeProfit = RiskAllocator::takeProfit(price, stop, cfg.trading.takeProfitR);
        std::optional<OrderExecutor::BracketResult> bracket;
        try {
            bracket = deps_.executor->placeBracketBuy(e.qualified, quantity, stop, takeProfit);
        } catch (const std::exception& ex) {
            std::cerr << "[CycleScheduler] Bracket order failed for " << symbol << ": " << ex.what() << std::endl;
            deps_.events->logEvent("ERROR", std::string("Order placement failed: ") + ex.what(), symbol, "Trade");
        }
        if (!bracket) {
            updateOutcome(r, domain::ResearchDecision::SHORTLISTED, "Selected by AI but order placement failed");
            continue;
        }

        // Родитель принят или его исход неизвестен: бюджет списывается в любом случае
        budgets.debit(currency, quantity * price);

        const std::string status = bracket->parent.status.empty() ? "Submitted" : bracket->parent.status;
        std::string outcome = "Order placed (" + status + ")";
        if (bracket->parentUnknown) {
            outcome = "Order outcome unknown (broker timeout); budget reserved";
            deps_.events->logEvent("WARN", "BUY outcome unknown after timeout; " +
                                               std::to_string(quantity) + " shares reserved from " + currency +
                                               " budget", symbol, "Trade");
        }
        if (!bracket->legErrors.empty()) {
            std::string legs;
            for (size_t i = 0; i < bracket->legErrors.size(); ++i) {
                if (i > 0) legs += "; ";
                legs += bracket->legErrors[i];
            }
            outcome += "; protective order(s) missing: " + legs;
            std::cerr << "[CycleScheduler] Bracket for " << symbol << " incomplete: " << legs << std::endl;
            deps_.events->logEvent("ERROR", "Protective order placement failed: " + legs, symbol, "Trade");
        }

        domain::TradeRecord trade;
        trade.timestamp = domain::Timestamp(deps_.clock->now());
        trade.symbol = symbol;
        trade.action = "BUY";
        trade.quantity = quantity;
        trade.price = price;
        trade.stopLoss = stop;
        trade.takeProfit = takeProfit;
        trade.sentimentScore = e.decision.sentiment;
        trade.status = status;
        trade.rationale = rationale;
        try {
            deps_.trades->insert(trade);
        } catch (const std::exception& ex) {
            std::cerr << "[CycleScheduler] Failed to record trade for " << symbol << ": " << ex.what() << std::endl;
        }

        placed.push_back(symbol);
        updateOutcome(r, domain::ResearchDecision::TRADE, outcome);
        deps_.events->logMessage("INFO", "Placed BUY for " + std::to_string(quantity) + " shares of " + symbol +
                                             " (status: " + status + ")");
    }

    std::string list;
    for (size_t i = 0; i < placed.size(); ++i) {
        if (i > 0) list += ", ";
        list += placed[i];
    }
    deps_.events->logEvent("INFO", "Selected " + std::to_string(placed.size()) + " trades: " +
                                       (placed.empty() ? std::string("None") : list), "Selector", "Result");
}

void CycleScheduler::updateOutcome(const Ranked& r, domain::ResearchDecision decision, const std::string& reason)
{
    try {
        deps_.research->updateOutcome(r.eligible.researchId, decision, reason);
    } catch (const std::exception& e) {
        std::cerr << "[CycleScheduler] Failed to update research outcome for " << r.eligible.symbol()
                  << ": " << e.what() << std::endl;
    }
}

std::chrono::seconds CycleScheduler::pace(std::chrono::system_clock::time_point started,
                                          const domain::TradingConfig& cfg)
{
    const double duration = std::chrono::duration<double>(deps_.clock->now() - started).count();
    const double interval = static_cast<double>(std::max(0, cfg.intraday.cycleIntervalSeconds));
    const std::string durationMins = format1(duration / 60.0);

    if (duration >= interval) {
        char overrun[32];
        std::snprintf(overrun, sizeof(overrun), "%.0f", duration - interval);
        std::string msg = "Cycle took " + durationMins + "min (overran by " + overrun +
                          "s) — starting next immediately";
        std::cerr << "[CycleScheduler] " << msg << std::endl;
        deps_.events->logEvent("WARN", msg, "Cycle", "Timing");
        deps_.liveStatus->update("Cycle", "Overran (" + durationMins + "min) — restarting");
        return std::chrono::seconds(0);
    }

    const double remaining = interval - duration;
    const std::string remainingMins = format1(remaining / 60.0);
    std::string msg = "Cycle complete in " + durationMins + "min. Next in " + remainingMins + "min";
    std::cout << "[CycleScheduler] " << msg << std::endl;
    deps_.events->logEvent("INFO", msg, "Cycle", "Complete");
    deps_.liveStatus->update("Idle", "Next cycle in " + remainingMins + "min");
    return std::chrono::seconds(static_cast<long long>(remaining));
}

void CycleScheduler::setTopCandidates(const std::vector<Ranked>& ranked)
{
    std::vector<domain::TopCandidate> top;
    for (size_t i = 0; i < ranked.size() && i < options_.topCandidates; ++i) {
        const auto& e = ranked[i].eligible;
        top.push_back(domain::TopCandidate{e.symbol(), e.decision.score, ranked[i].reason});
    }
    std::lock_guard<std::mutex> lock(mutex_);
    topCandidates_ = std::move(top);
}

} // namespace autotrader::application
