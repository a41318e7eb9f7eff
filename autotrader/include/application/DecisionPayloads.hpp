#pragma once

#include "application/TechnicalIndicators.hpp"
#include "domain/BudgetLedger.hpp"
#include "domain/Candidate.hpp"
#include "domain/Contract.hpp"
#include "domain/MarketContext.hpp"
#include "domain/MarketSnapshot.hpp"
#include "domain/OpenOrder.hpp"
#include "domain/Signals.hpp"
#include "domain/TradingConfig.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace autotrader::application {

/**
 * @brief Данные позиции для ревью (собирает PositionReviewEngine)
 */
struct PositionReviewInput {
    domain::Contract contract;
    double entryPrice = 0.0;
    double currentPrice = 0.0;
    int quantity = 0;
    double unrealisedPnl = 0.0;
    double pnlPct = 0.0;
    double peakPnlPct = 0.0;
    double drawdownFromPeakPct = 0.0;
    int minutesHeld = 0;
    std::optional<double> currentStopLoss;
    std::optional<double> currentTakeProfit;
    std::optional<double> distanceToStopPct;
    std::optional<double> distanceToTpPct;
    std::optional<domain::Signals> signals;
    std::optional<domain::MarketSnapshot> liquidity;
    std::vector<std::string> headlines;
    std::optional<domain::SocialSentiment> social;
    std::vector<domain::TopCandidate> topCandidates;
    int adjustmentCount = 0;
};

/**
 * @brief JSON-запросы к сервису решений
 *
 * Ключи стабильны: на них ссылаются системные промпты.
 * Отсутствующие значения передаются как null, а не выдумываются.
 */
class DecisionPayloads {
public:
    using json = nlohmann::json;

    static json shortlist(const domain::Contract& contract,
                          const domain::Signals& signals,
                          const std::vector<std::string>& headlines,
                          const std::optional<domain::SocialSentiment>& social,
                          const std::optional<domain::MarketSnapshot>& snapshot,
                          const domain::MarketContext& market,
                          const domain::TradingConfig& cfg) {
        json payload;
        payload["symbol"] = contract.symbol;
        payload["exchange"] = contract.exchange;
        payload["currency"] = contract.currency;
        payload["price"] = opt(signals.price);
        payload["indicators"] = indicators(signals.indicators);
        payload["news_headlines"] = headlines;
        payload["reddit"] = socialJson(social);
        payload["intraday"] = {
            {"enabled", cfg.intraday.enabled},
            {"bar_size", cfg.intraday.barSize},
            {"duration", cfg.intraday.duration},
            {"use_rth", cfg.intraday.useRth},
            {"flatten_minutes_before_close", cfg.intraday.flattenMinutesBeforeClose},
            {"stop_atr_multiplier", cfg.trading.stopAtrMultiplier},
            {"take_profit_r", cfg.trading.takeProfitR}};
        payload["fundamentals"] = fundamentals(snapshot);
        payload["bar_momentum"] = momentum(signals.momentum);
        payload["market_context"] = marketContext(market);
        return payload;
    }

    /**
     * @brief Список шорт-листа для выбора покупок (уже отсортирован по rank)
     */
    static json selection(const std::vector<domain::EligibleCandidate>& eligible,
                          int maxNew,
                          const domain::BudgetLedger& budgets,
                          const domain::MarketContext& market) {
        json candidates = json::array();
        for (const auto& e : eligible) {
            json item;
            item["symbol"] = e.symbol();
            item["exchange"] = e.qualified.exchange;
            item["currency"] = e.currency();
            item["price"] = opt(e.signals.price);
            item["rank"] = e.rank ? json(*e.rank) : json(nullptr);
            item["score"] = e.decision.score;
            item["ai"] = {
                {"decision", e.decision.decision},
                {"confidence", e.decision.confidence},
                {"score", e.decision.score},
                {"sentiment", e.decision.sentiment},
                {"rationale", e.decision.rationale},
                {"key_factors", e.decision.keyFactors},
                {"key_risks", e.decision.keyRisks}};
            candidates.push_back(item);
        }

        json budgetJson = json::object();
        for (const auto& [currency, amount] : budgets.all()) {
            budgetJson[currency] = TechnicalIndicators::round2(amount);
        }

        return json{
            {"max_new", maxNew},
            {"budget_remaining", budgetJson},
            {"market_context", marketContext(market)},
            {"candidates", candidates}};
    }

    static json positionReview(const PositionReviewInput& in,
                               const domain::MarketContext& market,
                               const domain::TradingConfig& cfg) {
        json payload;
        payload["symbol"] = in.contract.symbol;
        payload["exchange"] = in.contract.exchange;
        payload["currency"] = in.contract.currency;
        payload["entry_price"] = in.entryPrice;
        payload["current_price"] = in.currentPrice;
        payload["quantity"] = in.quantity;
        payload["unrealised_pnl"] = TechnicalIndicators::round2(in.unrealisedPnl);
        payload["pnl_pct"] = TechnicalIndicators::round2(in.pnlPct);
        payload["peak_pnl_pct"] = TechnicalIndicators::round2(in.peakPnlPct);
        payload["drawdown_from_peak_pct"] = TechnicalIndicators::round2(in.drawdownFromPeakPct);
        payload["minutes_held"] = in.minutesHeld;
        payload["current_stop_loss"] = opt(in.currentStopLoss);
        payload["current_take_profit"] = opt(in.currentTakeProfit);
        payload["distance_to_stop_pct"] = opt(in.distanceToStopPct);
        payload["distance_to_tp_pct"] = opt(in.distanceToTpPct);
        payload["adjustments_so_far"] = in.adjustmentCount;

        if (in.signals) {
            payload["indicators"] = indicators(in.signals->indicators);
            payload["bar_momentum"] = momentum(in.signals->momentum);
        } else {
            payload["indicators"] = json::object();
            payload["bar_momentum"] = nullptr;
        }
        payload["fundamentals"] = in.liquidity ? fundamentals(in.liquidity) : json(nullptr);
        payload["market_context"] = marketContext(market);
        payload["headlines"] = in.headlines;
        payload["reddit"] = socialJson(in.social);

        if (in.topCandidates.empty()) {
            payload["top_candidates"] = nullptr;
        } else {
            json top = json::array();
            for (const auto& c : in.topCandidates) {
                top.push_back({{"symbol", c.symbol}, {"score", c.score}, {"rationale", c.rationale}});
            }
            payload["top_candidates"] = top;
        }

        payload["intraday"] = {
            {"enabled", cfg.intraday.enabled},
            {"flatten_minutes_before_close", cfg.intraday.flattenMinutesBeforeClose}};
        return payload;
    }

    static json orderReview(const domain::OpenOrder& order,
                            const std::optional<domain::MarketSnapshot>& quote,
                            std::optional<double> priceDistancePct,
                            std::optional<int> ageMinutes,
                            const domain::MarketContext& market) {
        std::optional<double> current;
        std::optional<double> bid;
        std::optional<double> ask;
        std::optional<double> spread;
        if (quote) {
            current = quote->price();
            bid = quote->bid;
            ask = quote->ask;
            spread = quote->spreadPct();
        }

        return json{
            {"symbol", order.contract.symbol},
            {"order_id", order.orderId},
            {"action", domain::toString(order.action)},
            {"type", domain::toString(order.orderType)},
            {"quantity", order.totalQuantity},
            {"order_price", opt(order.orderPrice())},
            {"age_minutes", ageMinutes ? json(*ageMinutes) : json(nullptr)},
            {"current_price", opt(current)},
            {"bid", opt(bid)},
            {"ask", opt(ask)},
            {"spread_pct", opt(spread)},
            {"price_distance_pct", opt(priceDistancePct)},
            {"market_context", marketContext(market)}};
    }

    static json marketContext(const domain::MarketContext& market) {
        return json{
            {"spy_change_pct", opt(market.spyChangePct)},
            {"qqq_change_pct", opt(market.qqqChangePct)},
            {"market_sentiment", market.sentiment}};
    }

private:
    static json opt(const std::optional<double>& v) {
        return v ? json(TechnicalIndicators::round2(*v)) : json(nullptr);
    }

    static json indicators(const domain::IndicatorSet& ind) {
        return json{
            {"rsi_14", opt(ind.rsi)},
            {"atr", opt(ind.atr)},
            {"volatility_ratio", opt(ind.volatilityRatio)},
            {"bb_mid", opt(ind.bbMid)}};
    }

    static json momentum(const std::optional<domain::BarMomentum>& m) {
        if (!m) return nullptr;
        return json{
            {"momentum_5_bars_pct", m->momentum5},
            {"momentum_10_bars_pct", m->momentum10},
            {"volume_acceleration", m->volumeAcceleration},
            {"green_bars_last_5", m->greenBarsLast5},
            {"trend", m->trend}};
    }

    static json socialJson(const std::optional<domain::SocialSentiment>& s) {
        if (!s || !s->sentiment || !s->confidence) return nullptr;
        return json{
            {"mentions", s->mentions},
            {"sentiment", *s->sentiment},
            {"confidence", *s->confidence},
            {"rationale", s->rationale}};
    }

    static json fundamentals(const std::optional<domain::MarketSnapshot>& snap) {
        if (!snap) return json::object();
        std::optional<double> relVolume;
        if (snap->volume && snap->avgVolume && *snap->avgVolume > 0.0) {
            relVolume = *snap->volume / *snap->avgVolume;
        }
        return json{
            {"volume", opt(snap->volume)},
            {"avg_volume", opt(snap->avgVolume)},
            {"relative_volume", opt(relVolume)},
            {"prev_close", opt(snap->close)},
            {"last", opt(snap->last)},
            {"bid", opt(snap->bid)},
            {"ask", opt(snap->ask)},
            {"spread_pct", opt(snap->spreadPct())}};
    }
};

} // namespace autotrader::application
