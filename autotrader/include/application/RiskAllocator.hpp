#pragma once

#include "domain/AccountValue.hpp"
#include "domain/BudgetLedger.hpp"
#include "domain/TradingConfig.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace autotrader::application {

/**
 * @brief Риск и денежный бюджет
 *
 * Бюджет валюты:  max(0, min(available * utilisation, available - reserve))
 * Стоп:            price - ATR * stopMultiplier
 * Тейк-профит:     price + R * (price - stop)
 * Размер позиции:  floor(equity * risk / |price - stop|), но не больше floor(budget / price)
 */
class RiskAllocator {
public:
    struct BudgetResult {
        double budget = 0.0;
        std::optional<double> available;
        std::string message;
    };

    /**
     * @brief Значение тега аккаунта для валюты
     */
    static std::optional<double> accountValue(const std::vector<domain::AccountSummaryItem>& summary,
                                              const std::string& tag,
                                              const std::string& currency) {
        for (const auto& item : summary) {
            if (item.tag == tag && item.currency == currency) {
                return item.value;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief NetLiquidation: сначала BASE, затем любая валюта
     */
    static std::optional<double> netLiquidation(const std::vector<domain::AccountSummaryItem>& summary) {
        if (auto base = accountValue(summary, "NetLiquidation", "BASE")) {
            return base;
        }
        for (const auto& item : summary) {
            if (item.tag == "NetLiquidation") {
                return item.value;
            }
        }
        return std::nullopt;
    }

    static BudgetResult budgetFor(const std::vector<domain::AccountSummaryItem>& summary,
                                  const domain::TradingSection& cfg,
                                  const std::string& currency) {
        BudgetResult result;
        result.available = accountValue(summary, cfg.cashBudgetTag, currency);
        if (!result.available) {
            result.message = cfg.cashBudgetTag + " not available for " + currency + "; budget set to 0.";
            return result;
        }

        double reserve = 0.0;
        auto it = cfg.minCashReserveByCurrency.find(currency);
        if (it != cfg.minCashReserveByCurrency.end()) {
            reserve = it->second;
        }

        double available = *result.available;
        result.budget = std::max(0.0, std::min(available * cfg.maxCashUtilisation, available - reserve));
        return result;
    }

    /**
     * @brief Заполнить бюджеты по всем валютам кандидатов
     *
     * Ошибки (нет тега) логируются через onError и дают бюджет 0.
     */
    template <typename OnInfo, typename OnError>
    static domain::BudgetLedger allocate(const std::vector<domain::AccountSummaryItem>& summary,
                                         const domain::TradingSection& cfg,
                                         const std::set<std::string>& currencies,
                                         OnInfo onInfo,
                                         OnError onError) {
        domain::BudgetLedger ledger;
        for (const auto& currency : currencies) {
            auto r = budgetFor(summary, cfg, currency);
            ledger.set(currency, r.budget);
            if (!r.available) {
                onError(currency, r.message);
                continue;
            }
            onInfo(currency, "Budget for " + currency + ": " + formatMoney(r.budget) +
                                 " (available " + formatMoney(*r.available) + ")");
        }
        return ledger;
    }

    /**
     * @return стоп или nullopt, если ATR нет
     */
    static std::optional<double> stopLoss(double price, std::optional<double> atr, double multiplier) {
        if (!atr) return std::nullopt;
        return price - *atr * multiplier;
    }

    static double takeProfit(double price, double stop, double rMultiple) {
        return price + rMultiple * (price - stop);
    }

    /**
     * @brief Размер по риску: 0, если риск на акцию нулевой
     */
    static int positionSize(double equity, double riskPerTrade, double price, double stop) {
        double riskPerShare = std::fabs(price - stop);
        if (riskPerShare <= 0.0) {
            return 0;
        }
        return toShares(std::floor(equity * riskPerTrade / riskPerShare));
    }

    /**
     * @brief Размер по риску, урезанный остатком бюджета
     */
    static int sizeWithinBudget(double equity, double riskPerTrade, double price, double stop,
                                double remainingBudget) {
        if (price <= 0.0) return 0;
        int byRisk = positionSize(equity, riskPerTrade, price, stop);
        int byBudget = toShares(std::floor(std::max(0.0, remainingBudget) / price));
        return std::max(0, std::min(byRisk, byBudget));
    }

    static int capacity(int maxPositions, int openCount, int maxNewPerCycle) {
        return std::max(0, std::min(maxPositions - openCount, maxNewPerCycle));
    }

private:
    /// Число акций в int: отрицательное и NaN дают 0, сверху предел INT_MAX
    static int toShares(double qty) {
        if (!(qty > 0.0)) return 0;
        constexpr double kMax = static_cast<double>(std::numeric_limits<int>::max());
        return qty >= kMax ? std::numeric_limits<int>::max() : static_cast<int>(qty);
    }

    static std::string formatMoney(double v) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.2f", v);
        return buf;
    }
};

} // namespace autotrader::application
