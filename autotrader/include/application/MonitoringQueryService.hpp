#pragma once

#include "ports/input/IMonitoringQueryService.hpp"
#include "ports/input/ITradingLoop.hpp"
#include "ports/output/IBrokerGateway.hpp"
#include "ports/output/IEventLog.hpp"
#include "ports/output/ILiveStatusRepository.hpp"

#include <algorithm>
#include <memory>

namespace autotrader::application {

/**
 * @brief Read-only состояние для дашборда
 */
class MonitoringQueryService : public ports::input::IMonitoringQueryService {
public:
    static constexpr int kMaxEventsPerPage = 500;

    MonitoringQueryService(
        std::shared_ptr<ports::output::ILiveStatusRepository> liveStatus,
        std::shared_ptr<ports::output::IEventLog> events,
        std::shared_ptr<ports::output::IBrokerGateway> broker,
        std::shared_ptr<ports::input::ITradingLoop> loop
    ) : liveStatus_(std::move(liveStatus))
      , events_(std::move(events))
      , broker_(std::move(broker))
      , loop_(std::move(loop))
    {}

    ports::input::MonitoringStatus status() override {
        ports::input::MonitoringStatus st;
        st.live = liveStatus_->get();
        st.broker = broker_->connectionState();
        st.loopRunning = loop_ && loop_->isRunning();
        return st;
    }

    /**
     * @brief События после курсора; limit приводится к [1, 500]
     */
    std::vector<domain::EventRecord> eventsAfter(int64_t afterId, int limit) override {
        limit = std::clamp(limit, 1, kMaxEventsPerPage);
        return events_->eventsAfter(std::max<int64_t>(0, afterId), limit);
    }

private:
    std::shared_ptr<ports::output::ILiveStatusRepository> liveStatus_;
    std::shared_ptr<ports::output::IEventLog> events_;
    std::shared_ptr<ports::output::IBrokerGateway> broker_;
    std::shared_ptr<ports::input::ITradingLoop> loop_;
};

} // namespace autotrader::application
