#pragma once

#include "domain/Bar.hpp"
#include "domain/Signals.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <vector>

namespace autotrader::application {

/**
 * @brief Технические сигналы по свечам
 *
 * RSI(14) и ATR(14) сглаживаются по Уайлдеру (RMA, старт со средней
 * первых 14 значений), середина Боллинджера = SMA(20) по close,
 * volatility ratio = ATR / close. Всё считается по последней свече.
 */
class TechnicalIndicators {
public:
    static constexpr size_t kMinBars = 30;
    static constexpr size_t kRsiPeriod = 14;
    static constexpr size_t kAtrPeriod = 14;
    static constexpr size_t kBollingerPeriod = 20;

    static domain::IndicatorSet compute(const std::vector<domain::Bar>& bars) {
        domain::IndicatorSet result;
        if (bars.size() < kMinBars) {
            return result;
        }

        result.rsi = rsi(bars, kRsiPeriod);
        result.atr = atr(bars, kAtrPeriod);
        result.bbMid = sma(bars, kBollingerPeriod);

        double lastClose = bars.back().close;
        if (result.atr && lastClose > 0.0) {
            result.volatilityRatio = *result.atr / lastClose;
        }
        return result;
    }

    /**
     * @brief Импульс по последним 10 свечам (нужно минимум 5)
     */
    static std::optional<domain::BarMomentum> momentum(const std::vector<domain::Bar>& bars) {
        if (bars.size() < 5) {
            return std::nullopt;
        }

        size_t start = bars.size() > 10 ? bars.size() - 10 : 0;
        std::vector<domain::Bar> recent(bars.begin() + static_cast<std::ptrdiff_t>(start), bars.end());
        const size_t n = recent.size();

        double last = recent[n - 1].close;
        double fifthBack = recent[n - 5].close;
        double first = recent[0].close;

        domain::BarMomentum m;
        m.momentum5 = fifthBack > 0.0 ? (last - fifthBack) / fifthBack * 100.0 : 0.0;
        m.momentum10 = (n >= 10 && first > 0.0) ? (last - first) / first * 100.0 : 0.0;

        double recentVol = 0.0;
        double olderVol = 0.0;
        for (size_t i = 0; i < 3; ++i) {
            recentVol += recent[n - 1 - i].volume;
            olderVol += recent[i].volume;
        }
        recentVol /= 3.0;
        olderVol /= 3.0;
        m.volumeAcceleration = olderVol > 0.0 ? recentVol / olderVol : 1.0;

        for (size_t i = n - 5; i < n; ++i) {
            if (recent[i].close > recent[i].open) {
                ++m.greenBarsLast5;
            }
        }

        if (m.momentum5 > 0.5 && m.greenBarsLast5 >= 3) {
            m.trend = "bullish";
        } else if (m.momentum5 < -0.5 && m.greenBarsLast5 <= 2) {
            m.trend = "bearish";
        } else {
            m.trend = "neutral";
        }

        m.momentum5 = round2(m.momentum5);
        m.momentum10 = round2(m.momentum10);
        m.volumeAcceleration = round2(m.volumeAcceleration);
        return m;
    }

    static domain::Signals signals(const std::vector<domain::Bar>& bars) {
        domain::Signals s;
        s.barCount = static_cast<int>(bars.size());
        if (!bars.empty()) {
            s.price = bars.back().close;
        }
        s.indicators = compute(bars);
        s.momentum = momentum(bars);
        return s;
    }

    static double round2(double value) {
        return std::round(value * 100.0) / 100.0;
    }

private:
    static std::optional<double> rsi(const std::vector<domain::Bar>& bars, size_t period) {
        if (bars.size() <= period) return std::nullopt;

        double avgGain = 0.0;
        double avgLoss = 0.0;
        for (size_t i = 1; i <= period; ++i) {
            double change = bars[i].close - bars[i - 1].close;
            avgGain += std::max(change, 0.0);
            avgLoss += std::max(-change, 0.0);
        }
        avgGain /= static_cast<double>(period);
        avgLoss /= static_cast<double>(period);

        for (size_t i = period + 1; i < bars.size(); ++i) {
            double change = bars[i].close - bars[i - 1].close;
            avgGain = (avgGain * (period - 1) + std::max(change, 0.0)) / static_cast<double>(period);
            avgLoss = (avgLoss * (period - 1) + std::max(-change, 0.0)) / static_cast<double>(period);
        }

        if (avgLoss == 0.0) {
            return avgGain == 0.0 ? 50.0 : 100.0;
        }
        double rs = avgGain / avgLoss;
        return 100.0 - 100.0 / (1.0 + rs);
    }

    static std::optional<double> atr(const std::vector<domain::Bar>& bars, size_t period) {
        if (bars.size() <= period) return std::nullopt;

        auto trueRange = [&bars](size_t i) {
            double hl = bars[i].high - bars[i].low;
            double hc = std::fabs(bars[i].high - bars[i - 1].close);
            double lc = std::fabs(bars[i].low - bars[i - 1].close);
            return std::max({hl, hc, lc});
        };

        double value = 0.0;
        for (size_t i = 1; i <= period; ++i) {
            value += trueRange(i);
        }
        value /= static_cast<double>(period);

        for (size_t i = period + 1; i < bars.size(); ++i) {
            value = (value * (period - 1) + trueRange(i)) / static_cast<double>(period);
        }
        return value;
    }

    static std::optional<double> sma(const std::vector<domain::Bar>& bars, size_t period) {
        if (bars.size() < period) return std::nullopt;
        double sum = 0.0;
        for (size_t i = bars.size() - period; i < bars.size(); ++i) {
            sum += bars[i].close;
        }
        return sum / static_cast<double>(period);
    }
};

} // namespace autotrader::application
