#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IMonitoringQueryService.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace autotrader::adapters::primary {

/**
 * @brief GET /api/v1/status — состояние цикла и связь с брокером
 */
class StatusHandler : public IHttpHandler {
public:
    explicit StatusHandler(std::shared_ptr<ports::input::IMonitoringQueryService> monitoring)
        : monitoring_(std::move(monitoring))
    {
        std::cout << "[StatusHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        try {
            auto status = monitoring_->status();

            nlohmann::json response;
            response["current_symbol"] = status.live.currentSymbol;
            response["current_step"] = status.live.currentStep;
            response["last_update"] = status.live.lastUpdate.toString();
            response["broker"] = domain::toString(status.broker);
            response["loop_running"] = status.loopRunning;

            res.setResult(200, "application/json", response.dump());
        } catch (const std::exception& e) {
            std::cerr << "[StatusHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, std::string("Internal server error: ") + e.what());
        }
    }

private:
    std::shared_ptr<ports::input::IMonitoringQueryService> monitoring_;

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace autotrader::adapters::primary
