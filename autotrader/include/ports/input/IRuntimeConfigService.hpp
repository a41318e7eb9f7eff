#pragma once

#include "domain/RuntimeConfigDocument.hpp"
#include "domain/TradingConfig.hpp"
#include "domain/errors/RuntimeConfigError.hpp"

namespace autotrader::ports::input {

/**
 * @brief Эффективная конфигурация = база + глобальные + активная стратегия
 */
class IRuntimeConfigService {
public:
    virtual ~IRuntimeConfigService() = default;

    /**
     * @throws domain::RuntimeConfigError если документ недоступен или невалиден
     */
    virtual domain::TradingConfig effectiveConfig() = 0;

    /**
     * @brief Текущий документ после нормализации
     */
    virtual domain::RuntimeConfigDocument document() = 0;

    /**
     * @brief Заменить документ целиком (нормализация + валидация + запись)
     * @return сохранённый нормализованный документ
     * @throws domain::RuntimeConfigError при невалидном документе (ничего не пишется)
     */
    virtual domain::RuntimeConfigDocument replace(const domain::RuntimeConfigDocument& document) = 0;
};

} // namespace autotrader::ports::input
