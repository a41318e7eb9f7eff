#pragma once

#include "domain/RuntimeConfigDocument.hpp"
#include "domain/errors/RuntimeConfigError.hpp"

namespace autotrader::ports::output {

/**
 * @brief Хранилище документа оверлея (singleton-строка)
 */
class IRuntimeConfigRepository {
public:
    virtual ~IRuntimeConfigRepository() = default;

    /**
     * @throws domain::RuntimeConfigError нет строки, NULL, невалидный JSON или не объект
     */
    virtual domain::RuntimeConfigDocument load() = 0;

    /**
     * @brief Полная замена документа
     */
    virtual void save(const domain::RuntimeConfigDocument& document) = 0;
};

} // namespace autotrader::ports::output
