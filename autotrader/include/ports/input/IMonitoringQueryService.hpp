#pragma once

#include "domain/EventRecord.hpp"
#include "domain/enums/ConnectionState.hpp"
#include <cstdint>
#include <vector>

namespace autotrader::ports::input {

/**
 * @brief Сводка состояния для /api/v1/status
 */
struct MonitoringStatus {
    domain::LiveStatus live;
    domain::ConnectionState broker = domain::ConnectionState::Disconnected;
    bool loopRunning = false;
};

/**
 * @brief Read-only запросы дашборда
 */
class IMonitoringQueryService {
public:
    virtual ~IMonitoringQueryService() = default;

    virtual MonitoringStatus status() = 0;
    virtual std::vector<domain::EventRecord> eventsAfter(int64_t afterId, int limit) = 0;
};

} // namespace autotrader::ports::input
