#pragma once

#include "domain/Decisions.hpp"
#include "domain/errors/DecisionError.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace autotrader::application {

/**
 * @brief Вид вызова сервиса решений
 */
enum class DecisionKind {
    Shortlist,
    BuySelection,
    PositionReview,
    OrderReview
};

/**
 * @brief Проверка ответов сервиса решений на границе системы
 *
 * Каждый вид вызова превращается в свой тип из DecisionPayload.
 * Любое отклонение (не JSON, не тот тип, значение вне диапазона,
 * нет обязательного поля) - domain::DecisionError. Значения не
 * подправляются, кроме обрезки списков до допустимой длины.
 */
class DecisionValidator {
public:
    using json = nlohmann::json;

    /**
     * @brief Разобрать текст ответа модели в JSON-объект
     *
     * Допускает обёртку в ```json ... ```.
     */
    static json parseContent(const std::string& content) {
        std::string text = stripFences(trim(content));
        json parsed = json::parse(text, nullptr, false);
        if (parsed.is_discarded()) {
            throw domain::DecisionError("Decision service returned non-JSON: " + preview(content));
        }
        if (!parsed.is_object()) {
            throw domain::DecisionError(
                std::string("Decision service returned unexpected JSON type: ") + parsed.type_name());
        }
        return parsed;
    }

    static domain::ShortlistDecision shortlist(const json& obj) {
        requireObject(obj);
        domain::ShortlistDecision d;
        d.decision = upper(optionalString(obj, "decision"));
        if (d.decision != "SHORTLIST" && d.decision != "SKIP") {
            throw domain::DecisionError("Invalid decision '" + d.decision + "'");
        }
        d.confidence = inRange(obj, "confidence", 0.0, 1.0);
        d.score = inRange(obj, "score", 0.0, 1.0);
        d.sentiment = inRange(obj, "sentiment", -1.0, 1.0);
        d.rationale = requiredRationale(obj);
        d.keyFactors = stringList(obj, "key_factors", 6, true);
        d.keyRisks = stringList(obj, "key_risks", 6, true);
        return d;
    }

    /**
     * @param candidates допустимые символы (верхний регистр)
     * @param maxNew сколько символов максимум оставить
     */
    static domain::BuySelection buySelection(const json& obj,
                                             const std::vector<std::string>& candidates,
                                             int maxNew) {
        requireObject(obj);
        auto it = obj.find("selected_symbols");
        if (it == obj.end() || !it->is_array()) {
            throw domain::DecisionError("selected_symbols must be a list of strings");
        }

        std::set<std::string> allowed;
        for (const auto& c : candidates) {
            allowed.insert(upper(trim(c)));
        }

        domain::BuySelection selection;
        std::set<std::string> seen;
        for (const auto& item : *it) {
            if (!item.is_string()) {
                throw domain::DecisionError("selected_symbols must be a list of strings");
            }
            std::string symbol = upper(trim(item.get<std::string>()));
            if (symbol.empty() || seen.count(symbol) > 0) {
                continue;
            }
            if (allowed.count(symbol) == 0) {
                throw domain::DecisionError("Selected unknown symbol: " + symbol);
            }
            if (static_cast<int>(selection.selectedSymbols.size()) >= maxNew) {
                break;
            }
            selection.selectedSymbols.push_back(symbol);
            seen.insert(symbol);
        }

        selection.rationale = trim(optionalString(obj, "rationale"));
        if (selection.rationale.empty()) {
            selection.rationale = "Selected from shortlist.";
        }
        if (selection.rationale.size() > 250) {
            selection.rationale.resize(250);
        }
        return selection;
    }

    static domain::PositionReviewDecision positionReview(const json& obj) {
        requireObject(obj);
        domain::PositionReviewDecision d;

        std::string action = upper(optionalString(obj, "action"));
        auto parsed = domain::parsePositionAction(action);
        if (!parsed) {
            throw domain::DecisionError("Invalid position action '" + action + "'");
        }
        d.action = *parsed;
        d.confidence = inRange(obj, "confidence", 0.0, 1.0);
        d.urgency = obj.contains("urgency") && !obj["urgency"].is_null()
                        ? inRange(obj, "urgency", 0.0, 1.0)
                        : 0.5;
        d.rationale = requiredRationale(obj);
        d.newStopLoss = optionalNumber(obj, "new_stop_loss");
        d.newTakeProfit = optionalNumber(obj, "new_take_profit");
        d.keyFactors = stringList(obj, "key_factors", 5, false);

        if (d.action == domain::PositionAction::ADJUST_STOP && !d.newStopLoss) {
            throw domain::DecisionError("ADJUST_STOP requires new_stop_loss");
        }
        if (d.action == domain::PositionAction::ADJUST_TP && !d.newTakeProfit) {
            throw domain::DecisionError("ADJUST_TP requires new_take_profit");
        }
        return d;
    }

    static domain::OrderReviewDecision orderReview(const json& obj) {
        requireObject(obj);
        domain::OrderReviewDecision d;

        std::string action = upper(optionalString(obj, "action"));
        auto parsed = domain::parseOrderReviewAction(action);
        if (!parsed) {
            throw domain::DecisionError("Invalid order action '" + action + "'");
        }
        d.action = *parsed;
        d.confidence = obj.contains("confidence") && !obj["confidence"].is_null()
                           ? inRange(obj, "confidence", 0.0, 1.0)
                           : 0.5;
        d.rationale = requiredRationale(obj);
        d.newPrice = optionalNumber(obj, "new_price");

        if (d.action == domain::OrderReviewAction::ADJUST_PRICE && !d.newPrice) {
            throw domain::DecisionError("ADJUST_PRICE requires new_price");
        }
        return d;
    }

    /**
     * @brief Единая точка: JSON + вид вызова -> вариант
     */
    static domain::DecisionPayload validate(DecisionKind kind,
                                            const json& obj,
                                            const std::vector<std::string>& candidates = {},
                                            int maxNew = 0) {
        switch (kind) {
            case DecisionKind::Shortlist: return shortlist(obj);
            case DecisionKind::BuySelection: return buySelection(obj, candidates, maxNew);
            case DecisionKind::PositionReview: return positionReview(obj);
            case DecisionKind::OrderReview: return orderReview(obj);
        }
        throw domain::DecisionError("Unknown decision kind");
    }

private:
    static void requireObject(const json& obj) {
        if (!obj.is_object()) {
            throw domain::DecisionError(
                std::string("Decision payload must be an object; got ") + obj.type_name());
        }
    }

    static std::string optionalString(const json& obj, const char* key) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) {
            return "";
        }
        if (!it->is_string()) {
            throw domain::DecisionError(std::string(key) + " must be a string");
        }
        return trim(it->get<std::string>());
    }

    static std::string requiredRationale(const json& obj) {
        std::string rationale = optionalString(obj, "rationale");
        if (rationale.empty()) {
            throw domain::DecisionError("rationale is empty");
        }
        return rationale;
    }

    static double inRange(const json& obj, const char* key, double lo, double hi) {
        auto it = obj.find(key);
        if (it == obj.end() || !it->is_number()) {
            throw domain::DecisionError(std::string(key) + " must be a number");
        }
        double value = it->get<double>();
        if (value < lo || value > hi) {
            throw domain::DecisionError(std::string(key) + " out of range: " + it->dump());
        }
        return value;
    }

    static std::optional<double> optionalNumber(const json& obj, const char* key) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!it->is_number()) {
            throw domain::DecisionError(std::string(key) + " must be a number or null");
        }
        return it->get<double>();
    }

    static std::vector<std::string> stringList(const json& obj, const char* key,
                                               size_t maxItems, bool required) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) {
            if (required) {
                throw domain::DecisionError(std::string(key) + " must be a list of strings");
            }
            return {};
        }
        if (!it->is_array()) {
            throw domain::DecisionError(std::string(key) + " must be a list of strings");
        }
        std::vector<std::string> out;
        for (const auto& item : *it) {
            if (!item.is_string()) {
                throw domain::DecisionError(std::string(key) + " must be a list of strings");
            }
            if (out.size() < maxItems) {
                out.push_back(item.get<std::string>());
            }
        }
        return out;
    }

    static std::string stripFences(const std::string& text) {
        if (text.rfind("```", 0) != 0) {
            return text;
        }
        auto firstNewline = text.find('\n');
        auto closing = text.rfind("```");
        if (firstNewline == std::string::npos || closing <= firstNewline) {
            return text;
        }
        return trim(text.substr(firstNewline + 1, closing - firstNewline - 1));
    }

    static std::string preview(const std::string& s) {
        return s.size() > 200 ? s.substr(0, 200) + "..." : s;
    }

    static std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    static std::string trim(const std::string& s) {
        auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
        auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
        return begin < end ? std::string(begin, end) : std::string();
    }
};

} // namespace autotrader::application
