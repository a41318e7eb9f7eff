#pragma once

#include "domain/Timestamp.hpp"
#include <pqxx/pqxx>
#include <optional>
#include <string>

namespace autotrader::adapters::secondary::pg {

// Чтение nullable-колонок: NULL -> пустое значение

inline std::string text(const pqxx::field& f) {
    return f.is_null() ? "" : f.as<std::string>();
}

inline std::optional<double> optionalDouble(const pqxx::field& f) {
    if (f.is_null()) return std::nullopt;
    return f.as<double>();
}

inline std::optional<int> optionalInt(const pqxx::field& f) {
    if (f.is_null()) return std::nullopt;
    return f.as<int>();
}

inline domain::Timestamp timestamp(const pqxx::field& f) {
    return f.is_null() ? domain::Timestamp() : domain::Timestamp::fromString(f.as<std::string>());
}

/**
 * @brief Пустая строка пишется как NULL
 */
inline std::optional<std::string> nullIfEmpty(const std::string& value) {
    if (value.empty()) return std::nullopt;
    return value;
}

} // namespace autotrader::adapters::secondary::pg
