#pragma once

#include "domain/Bar.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace autotrader::adapters::secondary {

/**
 * @brief Симулятор цен бумажного брокера
 *
 * Random walk: P(t+1) = P(t) * (1 + σ * Z), Z ~ N(0, 1), минимум 0.01.
 * Помнит цену открытия сессии (close для снимка) и средний объём,
 * умеет строить синтетическую историю свечей, заканчивающуюся на
 * текущей цене.
 *
 * Thread-safe: да (внутренняя синхронизация)
 */
class PriceSimulator {
public:
    struct Quote {
        double bid = 0.0;
        double ask = 0.0;
        double last = 0.0;
        double previousClose = 0.0;
        int64_t volume = 0;
        int64_t avgVolume = 0;
        std::chrono::system_clock::time_point timestamp;

        double mid() const {
            return (bid + ask) / 2.0;
        }

        double changePercent() const {
            if (previousClose <= 0.0) return 0.0;
            return (last - previousClose) / previousClose * 100.0;
        }
    };

    /**
     * @param seed Seed генератора (0 = random_device)
     */
    explicit PriceSimulator(unsigned int seed = 0)
        : rng_(seed == 0 ? std::random_device{}() : seed)
    {}

    /**
     * @param spread Спред bid/ask в долях (0.001 = 0.1%)
     * @param volatility Волатильность за тик в долях
     */
    void initInstrument(const std::string& symbol,
                        double basePrice,
                        double spread = 0.001,
                        double volatility = 0.002,
                        int64_t avgVolume = 2000000) {
        std::lock_guard<std::mutex> lock(mutex_);

        InstrumentState state;
        state.currentPrice = basePrice;
        state.previousClose = basePrice;
        state.spread = spread;
        state.volatility = volatility;
        state.avgVolume = avgVolume;
        state.lastUpdate = std::chrono::system_clock::now();
        instruments_[symbol] = state;
    }

    bool hasInstrument(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return instruments_.find(symbol) != instruments_.end();
    }

    std::optional<Quote> getQuote(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = instruments_.find(symbol);
        if (it == instruments_.end()) {
            return std::nullopt;
        }

        const auto& state = it->second;
        Quote q;
        q.last = state.currentPrice;
        q.bid = state.currentPrice * (1.0 - state.spread / 2.0);
        q.ask = state.currentPrice * (1.0 + state.spread / 2.0);
        q.previousClose = state.previousClose;
        q.volume = state.sessionVolume;
        q.avgVolume = state.avgVolume;
        q.timestamp = state.lastUpdate;
        return q;
    }

    /**
     * @brief Один тик цены
     * @return новая цена или 0.0, если инструмента нет
     */
    double tick(const std::string& symbol) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = instruments_.find(symbol);
        if (it == instruments_.end()) {
            return 0.0;
        }

        auto& state = it->second;
        std::normal_distribution<double> dist(0.0, state.volatility);
        state.currentPrice = std::max(0.01, state.currentPrice * (1.0 + dist(rng_)));
        state.sessionVolume += state.avgVolume / 1000;
        state.lastUpdate = std::chrono::system_clock::now();
        return state.currentPrice;
    }

    /**
     * @brief Установить цену (детерминированные тесты)
     */
    bool setPrice(const std::string& symbol, double price) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = instruments_.find(symbol);
        if (it == instruments_.end()) {
            return false;
        }
        it->second.currentPrice = std::max(0.01, price);
        it->second.lastUpdate = std::chrono::system_clock::now();
        return true;
    }

    /**
     * @param percent -5.0 = -5%
     */
    double movePricePercent(const std::string& symbol, double percent) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = instruments_.find(symbol);
        if (it == instruments_.end()) {
            return 0.0;
        }
        it->second.currentPrice = std::max(0.01, it->second.currentPrice * (1.0 + percent / 100.0));
        it->second.lastUpdate = std::chrono::system_clock::now();
        return it->second.currentPrice;
    }

    double getPrice(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = instruments_.find(symbol);
        return it == instruments_.end() ? 0.0 : it->second.currentPrice;
    }

    std::vector<std::string> symbols() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        out.reserve(instruments_.size());
        for (const auto& [symbol, state] : instruments_) {
            out.push_back(symbol);
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    /**
     * @brief Синтетическая история OHLCV, последняя свеча закрывается по текущей цене
     *
     * Цена строится назад от текущей тем же random walk.
     */
    std::vector<domain::Bar> history(const std::string& symbol, size_t count, int barMinutes) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<domain::Bar> bars;
        auto it = instruments_.find(symbol);
        if (it == instruments_.end() || count == 0) {
            return bars;
        }

        const auto& state = it->second;
        std::normal_distribution<double> walk(0.0, state.volatility * 3.0);
        std::uniform_real_distribution<double> wick(0.0, state.volatility * 2.0);
        std::uniform_real_distribution<double> vol(0.5, 1.5);

        std::vector<double> closes(count);
        closes[count - 1] = state.currentPrice;
        for (size_t i = count - 1; i > 0; --i) {
            closes[i - 1] = std::max(0.01, closes[i] / (1.0 + walk(rng_)));
        }

        auto end = std::chrono::system_clock::now();
        auto step = std::chrono::minutes(barMinutes);
        double barVolume = static_cast<double>(state.avgVolume) / 78.0;

        bars.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            domain::Bar bar;
            bar.close = closes[i];
            bar.open = i == 0 ? closes[i] : closes[i - 1];
            bar.high = std::max(bar.open, bar.close) * (1.0 + wick(rng_));
            bar.low = std::max(0.01, std::min(bar.open, bar.close) * (1.0 - wick(rng_)));
            bar.volume = std::floor(barVolume * vol(rng_));
            bar.time = formatTime(end - step * static_cast<int>(count - 1 - i));
            bars.push_back(bar);
        }
        return bars;
    }

    /**
     * @brief Начать новую сессию: текущая цена становится close
     */
    void rollSession() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [symbol, state] : instruments_) {
            state.previousClose = state.currentPrice;
            state.sessionVolume = 0;
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return instruments_.size();
    }

private:
    struct InstrumentState {
        double currentPrice = 100.0;
        double previousClose = 100.0;
        double spread = 0.001;
        double volatility = 0.002;
        int64_t avgVolume = 2000000;
        int64_t sessionVolume = 0;
        std::chrono::system_clock::time_point lastUpdate;
    };

    static std::string formatTime(std::chrono::system_clock::time_point tp) {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        return buf;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, InstrumentState> instruments_;
    std::mt19937 rng_;
};

} // namespace autotrader::adapters::secondary
