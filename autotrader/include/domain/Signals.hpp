#pragma once

#include <optional>
#include <string>

namespace autotrader::domain {

/**
 * @brief Индикаторы по последней свече
 *
 * Отсутствуют, если свечей меньше 30.
 */
struct IndicatorSet {
    std::optional<double> rsi;
    std::optional<double> atr;
    std::optional<double> bbMid;
    std::optional<double> volatilityRatio;
};

/**
 * @brief Краткосрочный импульс по последним 10 свечам
 */
struct BarMomentum {
    double momentum5 = 0.0;
    double momentum10 = 0.0;
    double volumeAcceleration = 0.0;
    int greenBarsLast5 = 0;
    std::string trend = "neutral";
};

/**
 * @brief Полный набор сигналов по символу
 */
struct Signals {
    std::optional<double> price;
    IndicatorSet indicators;
    std::optional<BarMomentum> momentum;
    int barCount = 0;
};

} // namespace autotrader::domain
