#pragma once

#include "domain/TradingConfig.hpp"
#include <IEnvironment.hpp>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace autotrader::settings {

/**
 * @brief Базовая торговая конфигурация из IEnvironment
 *
 * Ключи в config.json (плоские, через точку):
 * - trading.max_cash_utilisation, trading.risk_per_trade, trading.max_positions, ...
 * - trading.markets              "US,UK"
 * - trading.min_cash_reserve_by_currency  "USD:100,GBP:50"
 * - trading.screener.scan_codes  "MOST_ACTIVE,TOP_PERC_GAIN"
 * - ai.model, intraday.*, position_management.*, reddit.enabled
 *
 * ENV перекрывает: AUTOTRADER_AI_MODEL, AUTOTRADER_CYCLE_INTERVAL_SECONDS.
 * Оверлей из БД накладывается поверх этой базы каждый цикл.
 */
class TradingSettings {
public:
    explicit TradingSettings(std::shared_ptr<IEnvironment> env) {
        domain::TradingConfig d;
        auto& t = base_.trading;
        t.maxCashUtilisation = env->get<double>("trading.max_cash_utilisation", d.trading.maxCashUtilisation);
        t.riskPerTrade = env->get<double>("trading.risk_per_trade", d.trading.riskPerTrade);
        t.maxPositions = env->get<int>("trading.max_positions", d.trading.maxPositions);
        t.maxNewPositionsPerCycle = env->get<int>("trading.max_new_positions_per_cycle", d.trading.maxNewPositionsPerCycle);
        t.cashBudgetTag = env->get<std::string>("trading.cash_budget_tag", d.trading.cashBudgetTag);
        t.maxSharePrice = env->get<double>("trading.max_share_price", d.trading.maxSharePrice);
        t.minSharePrice = env->get<double>("trading.min_share_price", d.trading.minSharePrice);
        t.minAvgVolume = env->get<int>("trading.min_avg_volume", d.trading.minAvgVolume);
        t.excludeMicrocap = env->get<bool>("trading.exclude_microcap", d.trading.excludeMicrocap);
        t.volatilityThreshold = env->get<double>("trading.volatility_threshold", d.trading.volatilityThreshold);
        t.stopAtrMultiplier = env->get<double>("trading.stop_atr_multiplier", d.trading.stopAtrMultiplier);
        t.takeProfitR = env->get<double>("trading.take_profit_r", d.trading.takeProfitR);

        auto markets = split(env->get<std::string>("trading.markets", "US"));
        t.markets.clear();
        for (const auto& code : markets) {
            if (auto m = domain::parseMarket(code)) {
                t.markets.push_back(*m);
            }
        }
        if (t.markets.empty()) {
            t.markets.push_back(domain::Market::US);
        }

        for (const auto& pair : split(env->get<std::string>("trading.min_cash_reserve_by_currency", ""))) {
            auto colon = pair.find(':');
            if (colon != std::string::npos) {
                t.minCashReserveByCurrency[pair.substr(0, colon)] = std::stod(pair.substr(colon + 1));
            }
        }

        auto& s = t.screener;
        s.maxCandidates = env->get<int>("trading.screener.max_candidates", d.trading.screener.maxCandidates);
        auto scanCodes = split(env->get<std::string>("trading.screener.scan_codes", ""));
        if (!scanCodes.empty()) {
            s.scanCodes = scanCodes;
        }
        s.includeRedditSymbols = env->get<bool>("trading.screener.include_reddit_symbols", false);
        s.includeSymbols = split(env->get<std::string>("trading.screener.include_symbols", ""), ';');
        s.excludeSymbols = split(env->get<std::string>("trading.screener.exclude_symbols", ""));

        base_.ai.model = env->get<std::string>("ai.model", d.ai.model);

        auto& i = base_.intraday;
        i.enabled = env->get<bool>("intraday.enabled", d.intraday.enabled);
        i.cycleIntervalSeconds = env->get<int>("intraday.cycle_interval_seconds", d.intraday.cycleIntervalSeconds);
        i.cycleIntervalSecondsClosed = env->get<int>("intraday.cycle_interval_seconds_closed", d.intraday.cycleIntervalSecondsClosed);
        i.flattenMinutesBeforeClose = env->get<int>("intraday.flatten_minutes_before_close", d.intraday.flattenMinutesBeforeClose);
        i.barSize = env->get<std::string>("intraday.bar_size", d.intraday.barSize);
        i.duration = env->get<std::string>("intraday.duration", d.intraday.duration);
        i.useRth = env->get<bool>("intraday.use_rth", d.intraday.useRth);
        i.symbolTimeoutSeconds = env->get<int>("intraday.symbol_timeout_seconds", d.intraday.symbolTimeoutSeconds);

        auto& p = base_.positionManagement;
        p.reviewIntervalSeconds = env->get<int>("position_management.review_interval_seconds", d.positionManagement.reviewIntervalSeconds);
        p.maxAdjustmentsPerPosition = env->get<int>("position_management.max_adjustments_per_position", d.positionManagement.maxAdjustmentsPerPosition);
        p.rotationEnabled = env->get<bool>("position_management.opportunity_rotation_enabled", d.positionManagement.rotationEnabled);

        base_.reddit.enabled = env->get<bool>("reddit.enabled", d.reddit.enabled);

        if (const char* val = std::getenv("AUTOTRADER_AI_MODEL")) {
            base_.ai.model = val;
        }
        if (const char* val = std::getenv("AUTOTRADER_CYCLE_INTERVAL_SECONDS")) {
            i.cycleIntervalSeconds = std::stoi(val);
        }
    }

    /**
     * @brief Готовая база (без чтения окружения)
     */
    explicit TradingSettings(domain::TradingConfig base)
        : base_(std::move(base))
    {}

    const domain::TradingConfig& getBaseConfig() const { return base_; }

private:
    domain::TradingConfig base_;

    static std::vector<std::string> split(const std::string& value, char sep = ',') {
        std::vector<std::string> out;
        std::istringstream ss(value);
        std::string item;
        while (std::getline(ss, item, sep)) {
            auto b = item.find_first_not_of(" \t");
            auto e = item.find_last_not_of(" \t");
            if (b != std::string::npos) {
                out.push_back(item.substr(b, e - b + 1));
            }
        }
        return out;
    }
};

} // namespace autotrader::settings
