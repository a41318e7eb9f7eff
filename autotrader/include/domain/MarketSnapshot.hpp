#pragma once

#include <optional>

namespace autotrader::domain {

/**
 * @brief Снимок котировки (поля могут отсутствовать при задержанных данных)
 */
struct MarketSnapshot {
    std::optional<double> last;
    std::optional<double> close;
    std::optional<double> bid;
    std::optional<double> ask;
    std::optional<double> volume;
    std::optional<double> avgVolume;

    /**
     * @brief last, иначе close
     */
    std::optional<double> price() const {
        if (last && *last > 0.0) return last;
        if (close && *close > 0.0) return close;
        return std::nullopt;
    }

    std::optional<double> spreadPct() const {
        if (!bid || !ask || *bid <= 0.0 || *ask <= 0.0) return std::nullopt;
        double mid = (*bid + *ask) / 2.0;
        return (*ask - *bid) / mid * 100.0;
    }
};

} // namespace autotrader::domain
