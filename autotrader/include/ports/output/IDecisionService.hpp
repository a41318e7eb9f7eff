#pragma once

#include "domain/Decisions.hpp"
#include "domain/TradingConfig.hpp"
#include "domain/errors/DecisionError.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace autotrader::ports::output {

/**
 * @brief Внешний сервис решений
 *
 * Каждый метод возвращает провалидированный ответ или бросает
 * domain::DecisionError (сетевой сбой, невалидный JSON, значения вне диапазона).
 */
class IDecisionService {
public:
    virtual ~IDecisionService() = default;

    virtual domain::ShortlistDecision shortlist(const nlohmann::json& payload,
                                                const domain::AiSection& ai) = 0;

    /**
     * @brief Выбрать не более maxNew символов из candidates
     *
     * При maxNew <= 0 или пустом списке возвращает пустой выбор без запроса.
     */
    virtual domain::BuySelection selectBuys(const nlohmann::json& payload,
                                            const std::vector<std::string>& candidates,
                                            int maxNew,
                                            const domain::AiSection& ai) = 0;

    virtual domain::PositionReviewDecision reviewPosition(const nlohmann::json& payload,
                                                          const domain::AiSection& ai) = 0;

    virtual domain::OrderReviewDecision reviewOrder(const nlohmann::json& payload,
                                                    const domain::AiSection& ai) = 0;
};

} // namespace autotrader::ports::output
