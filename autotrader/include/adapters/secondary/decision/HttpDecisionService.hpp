#pragma once

#include "application/DecisionPrompts.hpp"
#include "application/DecisionValidator.hpp"
#include "domain/errors/DecisionError.hpp"
#include "ports/output/IDecisionService.hpp"
#include "settings/DecisionServiceSettings.hpp"

#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace autotrader::adapters::secondary {

/**
 * @brief Сервис решений поверх OpenAI-совместимого chat completions
 *
 * POST {path} с Bearer-ключом, temperature 0, ответ только JSON-объектом.
 * Сетевые сбои, таймауты и ответы 429/5xx повторяются до getMaxRetries() раз,
 * остальные ошибки и невалидный ответ сразу дают domain::DecisionError.
 */
class HttpDecisionService : public ports::output::IDecisionService {
public:
    using json = nlohmann::json;

    HttpDecisionService(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::DecisionServiceSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpDecisionService] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort() << settings_->getPath() << std::endl;
        if (settings_->getApiKey().empty()) {
            std::cerr << "[HttpDecisionService] API key is not set; decision calls will fail" << std::endl;
        }
    }

    domain::ShortlistDecision shortlist(const json& payload, const domain::AiSection& ai) override {
        auto content = complete(application::DecisionKind::Shortlist, payload, ai);
        return std::get<domain::ShortlistDecision>(
            application::DecisionValidator::validate(application::DecisionKind::Shortlist, content));
    }

    domain::BuySelection selectBuys(const json& payload,
                                    const std::vector<std::string>& candidates,
                                    int maxNew,
                                    const domain::AiSection& ai) override {
        if (maxNew <= 0 || candidates.empty()) {
            return domain::BuySelection{};
        }
        auto content = complete(application::DecisionKind::BuySelection, payload, ai);
        return std::get<domain::BuySelection>(application::DecisionValidator::validate(
            application::DecisionKind::BuySelection, content, candidates, maxNew));
    }

    domain::PositionReviewDecision reviewPosition(const json& payload, const domain::AiSection& ai) override {
        auto content = complete(application::DecisionKind::PositionReview, payload, ai);
        return std::get<domain::PositionReviewDecision>(
            application::DecisionValidator::validate(application::DecisionKind::PositionReview, content));
    }

    domain::OrderReviewDecision reviewOrder(const json& payload, const domain::AiSection& ai) override {
        auto content = complete(application::DecisionKind::OrderReview, payload, ai);
        return std::get<domain::OrderReviewDecision>(
            application::DecisionValidator::validate(application::DecisionKind::OrderReview, content));
    }

    /**
     * @brief Тело запроса chat completions
     */
    static json buildRequest(application::DecisionKind kind, const json& payload, const domain::AiSection& ai) {
        return json{
            {"model", ai.model},
            {"temperature", 0},
            {"max_tokens", application::DecisionPrompts::maxTokens(kind)},
            {"response_format", {{"type", "json_object"}}},
            {"messages", json::array({
                {{"role", "system"}, {"content", application::DecisionPrompts::systemPrompt(kind, ai)}},
                {{"role", "user"}, {"content", payload.dump()}}})}};
    }

    /**
     * @brief Текст ответа модели из choices[0].message.content
     */
    static std::string extractContent(const std::string& body) {
        json parsed = json::parse(body, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            throw domain::DecisionError("Decision service returned a malformed completion");
        }
        auto choices = parsed.find("choices");
        if (choices == parsed.end() || !choices->is_array() || choices->empty()) {
            throw domain::DecisionError("Decision service returned no choices");
        }
        const auto& message = (*choices)[0].value("message", json::object());
        auto content = message.find("content");
        if (content == message.end() || !content->is_string()) {
            throw domain::DecisionError("Decision service returned empty content");
        }
        return content->get<std::string>();
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::DecisionServiceSettings> settings_;

    json complete(application::DecisionKind kind, const json& payload, const domain::AiSection& ai) {
        if (settings_->getApiKey().empty()) {
            throw domain::DecisionError("Decision service API key is not configured");
        }

        const std::string body = buildRequest(kind, payload, ai).dump();
        const int attempts = 1 + std::max(0, settings_->getMaxRetries());
        std::string lastError;

        for (int attempt = 1; attempt <= attempts; ++attempt) {
            SimpleResponse response;
            try {
                response = send(body);
            } catch (const std::exception& e) {
                lastError = std::string("transport error: ") + e.what();
                std::cerr << "[HttpDecisionService] Attempt " << attempt << "/" << attempts
                          << " failed: " << lastError << std::endl;
                continue;
            }

            const int status = response.getStatus();
            if (status == 200) {
                return application::DecisionValidator::parseContent(extractContent(response.getBody()));
            }
            lastError = "HTTP " + std::to_string(status);
            if (status != 429 && status < 500) {
                throw domain::DecisionError("Decision service returned " + lastError + ": " +
                                            response.getBody().substr(0, 200));
            }
            std::cerr << "[HttpDecisionService] Attempt " << attempt << "/" << attempts
                      << " failed: " << lastError << std::endl;
        }
        throw domain::DecisionError("Decision service unavailable after " + std::to_string(attempts) +
                                    " attempt(s): " + lastError);
    }

    /**
     * @brief Отправка с ограничением ожидания
     *
     * По таймауту запрос дорабатывает в отдельном потоке, ответ отбрасывается.
     */
    SimpleResponse send(const std::string& body) {
        auto request = std::make_shared<SimpleRequest>(SimpleRequest(
            "POST",
            settings_->getPath(),
            body,
            settings_->getHost(),
            settings_->getPort(),
            {{"Content-Type", "application/json"},
             {"Authorization", "Bearer " + settings_->getApiKey()}}));

        auto task = std::make_shared<std::packaged_task<SimpleResponse()>>(
            [client = httpClient_, request]() {
                SimpleResponse response;
                if (!client->send(*request, response)) {
                    throw std::runtime_error("HTTP request to decision service failed");
                }
                return response;
            });
        auto future = task->get_future();
        std::thread([task]() { (*task)(); }).detach();

        const auto timeout = std::chrono::seconds(std::max(1, settings_->getTimeoutSeconds()));
        if (future.wait_for(timeout) != std::future_status::ready) {
            throw std::runtime_error("timed out after " + std::to_string(timeout.count()) + "s");
        }
        return future.get();
    }
};

} // namespace autotrader::adapters::secondary
