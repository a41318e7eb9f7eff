#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace autotrader::domain {

/**
 * @brief Временная метка в UTC
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Разбор "YYYY-MM-DD HH:MM:SS" или "YYYY-MM-DDTHH:MM:SS" (UTC)
     */
    static Timestamp fromString(const std::string& str) {
        std::string normalised = str;
        if (normalised.size() > 10 && normalised[10] == 'T') {
            normalised[10] = ' ';
        }
        std::tm tm = {};
        std::istringstream ss(normalised);
        ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        return Timestamp(std::chrono::system_clock::from_time_t(timegm(&tm)));
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm{};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    double minutesUntil(const Timestamp& later) const {
        return std::chrono::duration<double>(later.value - value).count() / 60.0;
    }

    bool operator<(const Timestamp& other) const {
        return value < other.value;
    }

    bool operator>(const Timestamp& other) const {
        return value > other.value;
    }
};

} // namespace autotrader::domain
