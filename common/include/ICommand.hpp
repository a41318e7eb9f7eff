#pragma once

/**
 * @file ICommand.hpp
 * @brief Единица работы для WorkerPool
 */

namespace autotrader::common {

/**
 * @brief Команда, которую исполняет поток пула
 *
 * Команда сама отвечает за доставку результата (обычно через std::promise).
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * @brief Выполнить команду
     * @throws std::exception если команда не смогла доставить результат
     */
    virtual void execute() = 0;
};

} // namespace autotrader::common
