#pragma once

#include <cstdlib>
#include <string>

namespace autotrader::settings {

/**
 * @brief Настройки цикла
 *
 * Читает из ENV:
 * - AUTOTRADER_WORKER_THREADS (default: 4) - пул исследования символов
 * - AUTOTRADER_LOOP_AUTOSTART (default: true)
 * - AUTOTRADER_ORDER_REVIEW_MIN_AGE_MINUTES (default: 0)
 * - AUTOTRADER_TOP_CANDIDATES (default: 10)
 */
class LoopSettings {
public:
    LoopSettings() {
        if (const char* val = std::getenv("AUTOTRADER_WORKER_THREADS")) {
            workerThreads_ = static_cast<size_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("AUTOTRADER_LOOP_AUTOSTART")) {
            autostart_ = std::string(val) != "false" && std::string(val) != "0";
        }
        if (const char* val = std::getenv("AUTOTRADER_ORDER_REVIEW_MIN_AGE_MINUTES")) {
            orderReviewMinAgeMinutes_ = std::stod(val);
        }
        if (const char* val = std::getenv("AUTOTRADER_TOP_CANDIDATES")) {
            topCandidates_ = static_cast<size_t>(std::stoi(val));
        }
    }

    size_t getWorkerThreads() const { return workerThreads_; }
    bool getAutostart() const { return autostart_; }
    double getOrderReviewMinAgeMinutes() const { return orderReviewMinAgeMinutes_; }
    size_t getTopCandidates() const { return topCandidates_; }

private:
    size_t workerThreads_ = 4;
    bool autostart_ = true;
    double orderReviewMinAgeMinutes_ = 0.0;
    size_t topCandidates_ = 10;
};

} // namespace autotrader::settings
