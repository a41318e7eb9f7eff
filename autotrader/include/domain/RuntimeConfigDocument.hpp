#pragma once

#include <nlohmann/json.hpp>

namespace autotrader::domain {

/**
 * @brief Документ оверлея конфигурации
 *
 * {
 *   "schema_version": 1,
 *   "overrides": { ... },
 *   "strategies": [ {"name": "Default", "overrides": { ... }} ],
 *   "active_strategy": "Default"
 * }
 */
using RuntimeConfigDocument = nlohmann::json;

inline RuntimeConfigDocument defaultRuntimeConfigDocument() {
    return nlohmann::json{
        {"schema_version", 1},
        {"overrides", nlohmann::json::object()},
        {"strategies", nlohmann::json::array({
            nlohmann::json{{"name", "Default"}, {"overrides", nlohmann::json::object()}}})},
        {"active_strategy", "Default"}};
}

} // namespace autotrader::domain
