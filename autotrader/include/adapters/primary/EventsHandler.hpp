#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IMonitoringQueryService.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace autotrader::adapters::primary {

/**
 * @brief GET /api/v1/events?after_id=N&limit=M
 *
 * События с id > after_id по возрастанию. Клиент передаёт next_after_id
 * из ответа в следующий запрос, так опрос не теряет и не дублирует события.
 */
class EventsHandler : public IHttpHandler {
public:
    static constexpr int kDefaultLimit = 200;

    explicit EventsHandler(std::shared_ptr<ports::input::IMonitoringQueryService> monitoring)
        : monitoring_(std::move(monitoring))
    {
        std::cout << "[EventsHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        int64_t afterId = 0;
        int limit = kDefaultLimit;
        try {
            auto afterParam = req.getQueryParam("after_id");
            if (afterParam && !afterParam->empty()) {
                afterId = std::stoll(*afterParam);
            }
            auto limitParam = req.getQueryParam("limit");
            if (limitParam && !limitParam->empty()) {
                limit = std::stoi(*limitParam);
            }
        } catch (const std::exception&) {
            sendError(res, 400, "after_id and limit must be integers");
            return;
        }

        try {
            auto events = monitoring_->eventsAfter(afterId, limit);

            nlohmann::json response;
            response["events"] = nlohmann::json::array();
            int64_t nextAfterId = afterId;
            for (const auto& event : events) {
                response["events"].push_back(eventToJson(event));
                if (event.id > nextAfterId) nextAfterId = event.id;
            }
            response["next_after_id"] = nextAfterId;

            res.setResult(200, "application/json", response.dump());
        } catch (const std::exception& e) {
            std::cerr << "[EventsHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, std::string("Internal server error: ") + e.what());
        }
    }

private:
    std::shared_ptr<ports::input::IMonitoringQueryService> monitoring_;

    nlohmann::json eventToJson(const domain::EventRecord& event) {
        nlohmann::json j;
        j["id"] = event.id;
        j["timestamp"] = event.timestamp.toString();
        j["level"] = event.level;
        j["symbol"] = event.symbol;
        j["step"] = event.step;
        j["message"] = event.message;
        return j;
    }

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace autotrader::adapters::primary
