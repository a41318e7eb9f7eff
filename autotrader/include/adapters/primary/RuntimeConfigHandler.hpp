#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IRuntimeConfigService.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace autotrader::adapters::primary {

/**
 * @brief GET / PUT /api/v1/runtime-config
 *
 * PUT заменяет документ целиком. Невалидный документ отклоняется с 400
 * и текстом ошибки валидации; в хранилище при этом ничего не пишется.
 */
class RuntimeConfigHandler : public IHttpHandler {
public:
    explicit RuntimeConfigHandler(std::shared_ptr<ports::input::IRuntimeConfigService> config)
        : config_(std::move(config))
    {
        std::cout << "[RuntimeConfigHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        const auto method = req.getMethod();
        if (method == "GET") {
            handleGet(res);
        } else if (method == "PUT") {
            handlePut(req, res);
        } else {
            sendError(res, 405, "Method not allowed");
        }
    }

private:
    std::shared_ptr<ports::input::IRuntimeConfigService> config_;

    void handleGet(IResponse& res) {
        try {
            res.setResult(200, "application/json", config_->document().dump());
        } catch (const domain::RuntimeConfigError& e) {
            std::cerr << "[RuntimeConfigHandler] GET error: " << e.what() << std::endl;
            sendError(res, 500, std::string("Runtime config unavailable: ") + e.what());
        } catch (const std::exception& e) {
            std::cerr << "[RuntimeConfigHandler] GET error: " << e.what() << std::endl;
            sendError(res, 500, std::string("Internal server error: ") + e.what());
        }
    }

    void handlePut(IRequest& req, IResponse& res) {
        nlohmann::json body;
        try {
            body = nlohmann::json::parse(req.getBody());
        } catch (const nlohmann::json::parse_error& e) {
            sendError(res, 400, std::string("Invalid JSON: ") + e.what());
            return;
        }

        try {
            auto saved = config_->replace(body);
            res.setResult(200, "application/json", saved.dump());
        } catch (const domain::RuntimeConfigError& e) {
            sendError(res, 400, e.what());
        } catch (const std::exception& e) {
            std::cerr << "[RuntimeConfigHandler] PUT error: " << e.what() << std::endl;
            sendError(res, 500, std::string("Internal server error: ") + e.what());
        }
    }

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace autotrader::adapters::primary
