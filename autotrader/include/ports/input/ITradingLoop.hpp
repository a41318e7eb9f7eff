#pragma once

#include <chrono>

namespace autotrader::ports::input {

/**
 * @brief Основной цикл торговли
 */
class ITradingLoop {
public:
    virtual ~ITradingLoop() = default;

    virtual void start() = 0;

    /**
     * @brief Остановить цикл; прерывает текущее ожидание
     */
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;

    /**
     * @brief Одна итерация цикла
     * @return сколько ждать до следующей итерации
     */
    virtual std::chrono::seconds runCycle() = 0;
};

} // namespace autotrader::ports::input
