#pragma once

#include "domain/RuntimeConfigDocument.hpp"
#include "domain/TradingConfig.hpp"
#include "domain/errors/RuntimeConfigError.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <functional>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace autotrader::application {

/**
 * @brief Оверлей runtime-конфигурации
 *
 * Документ хранит глобальные переопределения и список именованных стратегий.
 * Эффективная конфигурация = база ⊕ overrides ⊕ overrides активной стратегии.
 * Разрешены только пути из закрытого списка; у каждого пути есть валидатор
 * значения и функция записи в поле TradingConfig. Слияние идёт по
 * типизированной структуре, произвольные ключи в неё не попадают.
 */
class RuntimeConfigOverlay {
public:
    using json = nlohmann::json;

    /**
     * @brief Заполнить недостающие поля и убрать устаревшие ключи
     * @throws domain::RuntimeConfigError если документ не объект
     */
    static json normalise(const json& doc) {
        if (doc.is_null()) {
            return domain::defaultRuntimeConfigDocument();
        }
        if (!doc.is_object()) {
            throw domain::RuntimeConfigError(
                std::string("runtime config must be an object; got ") + doc.type_name());
        }

        json out = doc;
        if (!out.contains("schema_version")) {
            out["schema_version"] = 1;
        }
        if (!out.contains("overrides") || out["overrides"].is_null()) {
            out["overrides"] = json::object();
        }
        if (!out.contains("strategies") || out["strategies"].is_null()) {
            out["strategies"] = json::array({json{{"name", "Default"}, {"overrides", json::object()}}});
        }
        if (!out.contains("active_strategy")) {
            out["active_strategy"] = "Default";
        }

        migrateHolder(out["overrides"]);
        if (out["strategies"].is_array()) {
            for (auto& strategy : out["strategies"]) {
                if (strategy.is_object() && strategy.contains("overrides")) {
                    migrateHolder(strategy["overrides"]);
                }
            }
        }
        return out;
    }

    /**
     * @throws domain::RuntimeConfigError с описанием первой найденной ошибки
     */
    static void validate(const json& doc) {
        if (!doc.is_object()) {
            throw domain::RuntimeConfigError("runtime config must be an object");
        }

        json schemaVersion = field(doc, "schema_version", json(1));
        if (!schemaVersion.is_number_integer() || schemaVersion.get<long long>() != 1) {
            throw domain::RuntimeConfigError(
                "Unsupported runtime config schema_version: " + schemaVersion.dump());
        }

        json overrides = field(doc, "overrides", json::object());
        if (!overrides.is_object()) {
            throw domain::RuntimeConfigError("runtime.overrides must be an object");
        }

        json strategies = field(doc, "strategies", json::array());
        if (!strategies.is_array() || strategies.empty()) {
            throw domain::RuntimeConfigError("runtime.strategies must be a non-empty array");
        }

        std::set<std::string> seen;
        for (const auto& strategy : strategies) {
            if (!strategy.is_object()) {
                throw domain::RuntimeConfigError("Each strategy must be an object");
            }
            auto nameIt = strategy.find("name");
            if (nameIt == strategy.end() || !nameIt->is_string() || trim(nameIt->get<std::string>()).empty()) {
                throw domain::RuntimeConfigError("Strategy name must be a non-empty string");
            }
            std::string name = trim(nameIt->get<std::string>());
            if (!seen.insert(name).second) {
                throw domain::RuntimeConfigError("Duplicate strategy name: " + name);
            }
            json strategyOverrides = field(strategy, "overrides", json::object());
            if (!strategyOverrides.is_object()) {
                throw domain::RuntimeConfigError("Strategy overrides for " + name + " must be an object");
            }
            validateOverrides(strategyOverrides);
        }

        if (doc.contains("active_strategy") && !doc["active_strategy"].is_null()) {
            const auto& active = doc["active_strategy"];
            if (!active.is_string() || trim(active.get<std::string>()).empty()) {
                throw domain::RuntimeConfigError("active_strategy must be a non-empty string or null");
            }
            std::string activeName = trim(active.get<std::string>());
            if (seen.count(activeName) == 0) {
                throw domain::RuntimeConfigError("active_strategy not found in strategies: " + activeName);
            }
        }

        validateOverrides(overrides);
    }

    /**
     * @brief Эффективная конфигурация цикла
     *
     * Документ нормализуется и валидируется; при ошибке ничего не применяется.
     */
    static domain::TradingConfig apply(const domain::TradingConfig& base, const json& document) {
        json doc = normalise(document);
        validate(doc);

        domain::TradingConfig cfg = base;
        applyOverrides(cfg, field(doc, "overrides", json::object()));

        if (doc.contains("active_strategy") && doc["active_strategy"].is_string()) {
            std::string active = trim(doc["active_strategy"].get<std::string>());
            for (const auto& strategy : doc["strategies"]) {
                if (trim(strategy.value("name", std::string())) == active) {
                    applyOverrides(cfg, field(strategy, "overrides", json::object()));
                    break;
                }
            }
        }
        return cfg;
    }

    /**
     * @brief Плоский список (путь, значение)
     *
     * trading.min_cash_reserve_by_currency - один лист, а не поддерево.
     */
    static std::vector<std::pair<std::string, json>> flatten(const json& overrides,
                                                             const std::string& prefix = "") {
        std::vector<std::pair<std::string, json>> out;
        for (auto it = overrides.begin(); it != overrides.end(); ++it) {
            std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
            if (it.value().is_object() && key != "trading.min_cash_reserve_by_currency") {
                auto nested = flatten(it.value(), key);
                out.insert(out.end(), nested.begin(), nested.end());
            } else {
                out.emplace_back(key, it.value());
            }
        }
        return out;
    }

    static bool isAllowedKey(const std::string& path) {
        return fields().count(path) > 0;
    }

private:
    using Validator = std::function<void(const json&, const std::string&)>;
    using Applier = std::function<void(domain::TradingConfig&, const json&)>;

    /**
     * @brief Разрешённый путь: проверка значения и запись в типизированное поле
     */
    struct FieldSpec {
        Validator validate;
        Applier apply;
    };

    static json field(const json& obj, const char* key, json fallback) {
        auto it = obj.find(key);
        return it != obj.end() ? *it : fallback;
    }

    static void validateOverrides(const json& overrides) {
        const auto& table = fields();
        for (const auto& [path, value] : flatten(overrides)) {
            auto it = table.find(path);
            if (it == table.end()) {
                throw domain::RuntimeConfigError("Unsupported override key: " + path);
            }
            it->second.validate(value, path);
        }
    }

    static void applyOverrides(domain::TradingConfig& cfg, const json& overrides) {
        const auto& table = fields();
        for (const auto& [path, value] : flatten(overrides)) {
            table.at(path).apply(cfg, value);
        }
    }

    static void migrateHolder(json& holder) {
        if (!holder.is_object()) {
            return;
        }
        if (holder.contains("ai") && holder["ai"].is_object()) {
            json& ai = holder["ai"];
            if (ai.contains("trade_decision_system_prompt") && !ai.contains("shortlist_system_prompt")) {
                ai["shortlist_system_prompt"] = ai["trade_decision_system_prompt"];
            }
            for (const char* key : {"trade_decision_enabled",
                                    "sentiment_threshold",
                                    "sentiment_analysis_enabled",
                                    "trade_decision_system_prompt",
                                    "trade_decision_prompt_addendum",
                                    "buy_selection_prompt_addendum",
                                    "position_review_prompt_addendum",
                                    "order_review_prompt_addendum"}) {
                ai.erase(key);
            }
        }
        if (holder.contains("position_management") && holder["position_management"].is_object()) {
            holder["position_management"].erase("enabled");
        }
    }

    static std::string trim(const std::string& s) {
        auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
        auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    // ============================================
    // ВАЛИДАТОРЫ ЗНАЧЕНИЙ
    // ============================================

    static bool isNumber(const json& v) {
        return v.is_number();
    }

    static void fraction(const json& v, const std::string& name) {
        if (!isNumber(v)) throw domain::RuntimeConfigError(name + " must be a number");
        double d = v.get<double>();
        if (d < 0.0 || d > 1.0) throw domain::RuntimeConfigError(name + " must be between 0 and 1");
    }

    static void positiveNumber(const json& v, const std::string& name) {
        if (!isNumber(v)) throw domain::RuntimeConfigError(name + " must be a number");
        if (v.get<double>() <= 0.0) throw domain::RuntimeConfigError(name + " must be > 0");
    }

    static void nonNegativeNumber(const json& v, const std::string& name) {
        if (!isNumber(v) || v.get<double>() < 0.0) {
            throw domain::RuntimeConfigError(name + " must be >= 0");
        }
    }

    static void nonNegativeInt(const json& v, const std::string& name) {
        if (!v.is_number_integer()) throw domain::RuntimeConfigError(name + " must be an integer");
        // Поля конфигурации - int: всё, что в него не влезает, отклоняется
        const auto limit = static_cast<unsigned long long>(std::numeric_limits<int>::max());
        if (v.is_number_unsigned() ? v.get<unsigned long long>() > limit
                                   : v.get<long long>() > static_cast<long long>(limit)) {
            throw domain::RuntimeConfigError(name + " must be <= " + std::to_string(limit));
        }
        if (!v.is_number_unsigned() && v.get<long long>() < 0) {
            throw domain::RuntimeConfigError(name + " must be >= 0");
        }
    }

    static void positiveInt(const json& v, const std::string& name) {
        nonNegativeInt(v, name);
        if (v.get<long long>() <= 0) throw domain::RuntimeConfigError(name + " must be > 0");
    }

    static void boolean(const json& v, const std::string& name) {
        if (!v.is_boolean()) throw domain::RuntimeConfigError(name + " must be boolean");
    }

    static void nonEmptyString(const json& v, const std::string& name) {
        if (!v.is_string() || trim(v.get<std::string>()).empty()) {
            throw domain::RuntimeConfigError(name + " must be a non-empty string");
        }
    }

    static void stringList(const json& v, const std::string& name, size_t maxItems) {
        if (!v.is_array()) throw domain::RuntimeConfigError(name + " must be an array");
        if (v.size() > maxItems) {
            throw domain::RuntimeConfigError(name + " must have at most " + std::to_string(maxItems) + " entries");
        }
        for (const auto& item : v) {
            if (!item.is_string() || trim(item.get<std::string>()).empty()) {
                throw domain::RuntimeConfigError(name + " entries must be non-empty strings");
            }
        }
    }

    static void promptOverride(const json& v, const std::string& name) {
        if (!v.is_string()) throw domain::RuntimeConfigError(name + " must be a string");
        if (v.get<std::string>().size() > 20000) {
            throw domain::RuntimeConfigError(name + " is too long (max 20000 characters)");
        }
    }

    static void markets(const json& v, const std::string&) {
        if (!v.is_array() || v.empty()) {
            throw domain::RuntimeConfigError("trading.markets must be a non-empty array");
        }
        for (const auto& m : v) {
            if (!m.is_string() || trim(m.get<std::string>()).empty()) {
                throw domain::RuntimeConfigError("trading.markets entries must be non-empty strings");
            }
            std::string code = trim(m.get<std::string>());
            std::transform(code.begin(), code.end(), code.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            if (code != "US" && code != "UK") {
                throw domain::RuntimeConfigError("Unsupported market: " + code);
            }
        }
    }

    static void cashReserves(const json& v, const std::string&) {
        if (!v.is_object()) {
            throw domain::RuntimeConfigError("trading.min_cash_reserve_by_currency must be an object");
        }
        for (auto it = v.begin(); it != v.end(); ++it) {
            if (trim(it.key()).empty()) {
                throw domain::RuntimeConfigError("Currency codes must be non-empty strings");
            }
            if (!isNumber(it.value())) {
                throw domain::RuntimeConfigError("Reserve for " + it.key() + " must be a number");
            }
            if (it.value().get<double>() < 0.0) {
                throw domain::RuntimeConfigError("Reserve for " + it.key() + " must be >= 0");
            }
        }
    }

    static std::vector<std::string> stringVector(const json& v) {
        std::vector<std::string> out;
        for (const auto& item : v) {
            out.push_back(trim(item.get<std::string>()));
        }
        return out;
    }

    static std::vector<domain::Market> marketVector(const json& v) {
        std::vector<domain::Market> out;
        for (const auto& item : v) {
            std::string code = trim(item.get<std::string>());
            std::transform(code.begin(), code.end(), code.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            auto market = domain::parseMarket(code);
            if (market && std::find(out.begin(), out.end(), *market) == out.end()) {
                out.push_back(*market);
            }
        }
        return out;
    }

    static std::map<std::string, double> reserveMap(const json& v) {
        std::map<std::string, double> out;
        for (auto it = v.begin(); it != v.end(); ++it) {
            out[trim(it.key())] = it.value().get<double>();
        }
        return out;
    }

    static FieldSpec listField(size_t maxItems, std::function<void(domain::TradingConfig&, std::vector<std::string>)> set) {
        return {
            [maxItems](const json& v, const std::string& n) { stringList(v, n, maxItems); },
            [set](domain::TradingConfig& c, const json& v) { set(c, stringVector(v)); }};
    }

    static const std::map<std::string, FieldSpec>& fields() {
        using Cfg = domain::TradingConfig;
        static const std::map<std::string, FieldSpec> table = {
            // trading / risk
            {"trading.max_cash_utilisation",
             {fraction, [](Cfg& c, const json& v) { c.trading.maxCashUtilisation = v.get<double>(); }}},
            {"trading.risk_per_trade",
             {fraction, [](Cfg& c, const json& v) { c.trading.riskPerTrade = v.get<double>(); }}},
            {"trading.max_positions",
             {nonNegativeInt, [](Cfg& c, const json& v) { c.trading.maxPositions = v.get<int>(); }}},
            {"trading.max_new_positions_per_cycle",
             {nonNegativeInt, [](Cfg& c, const json& v) { c.trading.maxNewPositionsPerCycle = v.get<int>(); }}},
            {"trading.cash_budget_tag",
             {nonEmptyString, [](Cfg& c, const json& v) { c.trading.cashBudgetTag = trim(v.get<std::string>()); }}},
            {"trading.markets",
             {markets, [](Cfg& c, const json& v) { c.trading.markets = marketVector(v); }}},
            {"trading.min_cash_reserve_by_currency",
             {cashReserves, [](Cfg& c, const json& v) { c.trading.minCashReserveByCurrency = reserveMap(v); }}},
            {"trading.max_share_price",
             {positiveNumber, [](Cfg& c, const json& v) { c.trading.maxSharePrice = v.get<double>(); }}},
            {"trading.min_share_price",
             {positiveNumber, [](Cfg& c, const json& v) { c.trading.minSharePrice = v.get<double>(); }}},
            {"trading.min_avg_volume",
             {nonNegativeInt, [](Cfg& c, const json& v) { c.trading.minAvgVolume = v.get<int>(); }}},
            {"trading.exclude_microcap",
             {boolean, [](Cfg& c, const json& v) { c.trading.excludeMicrocap = v.get<bool>(); }}},
            {"trading.volatility_threshold",
             {nonNegativeNumber, [](Cfg& c, const json& v) { c.trading.volatilityThreshold = v.get<double>(); }}},
            // screener
            {"trading.screener.max_candidates",
             {positiveInt, [](Cfg& c, const json& v) { c.trading.screener.maxCandidates = v.get<int>(); }}},
            {"trading.screener.scan_codes",
             listField(20, [](Cfg& c, std::vector<std::string> v) { c.trading.screener.scanCodes = std::move(v); })},
            {"trading.screener.include_reddit_symbols",
             {boolean, [](Cfg& c, const json& v) { c.trading.screener.includeRedditSymbols = v.get<bool>(); }}},
            {"trading.screener.include_symbols",
             listField(500, [](Cfg& c, std::vector<std::string> v) { c.trading.screener.includeSymbols = std::move(v); })},
            {"trading.screener.exclude_symbols",
             listField(500, [](Cfg& c, std::vector<std::string> v) { c.trading.screener.excludeSymbols = std::move(v); })},
            // ai
            {"ai.model",
             {nonEmptyString, [](Cfg& c, const json& v) { c.ai.model = trim(v.get<std::string>()); }}},
            {"ai.shortlist_system_prompt",
             {promptOverride, [](Cfg& c, const json& v) { c.ai.shortlistSystemPrompt = v.get<std::string>(); }}},
            {"ai.buy_selection_system_prompt",
             {promptOverride, [](Cfg& c, const json& v) { c.ai.buySelectionSystemPrompt = v.get<std::string>(); }}},
            {"ai.position_review_system_prompt",
             {promptOverride, [](Cfg& c, const json& v) { c.ai.positionReviewSystemPrompt = v.get<std::string>(); }}},
            {"ai.order_review_system_prompt",
             {promptOverride, [](Cfg& c, const json& v) { c.ai.orderReviewSystemPrompt = v.get<std::string>(); }}},
            // intraday
            {"intraday.enabled",
             {boolean, [](Cfg& c, const json& v) { c.intraday.enabled = v.get<bool>(); }}},
            {"intraday.cycle_interval_seconds",
             {nonNegativeInt, [](Cfg& c, const json& v) { c.intraday.cycleIntervalSeconds = v.get<int>(); }}},
            {"intraday.cycle_interval_seconds_closed",
             {nonNegativeInt, [](Cfg& c, const json& v) { c.intraday.cycleIntervalSecondsClosed = v.get<int>(); }}},
            {"intraday.flatten_minutes_before_close",
             {nonNegativeInt, [](Cfg& c, const json& v) { c.intraday.flattenMinutesBeforeClose = v.get<int>(); }}},
            // features
            {"reddit.enabled",
             {boolean, [](Cfg& c, const json& v) { c.reddit.enabled = v.get<bool>(); }}},
        };
        return table;
    }
};

} // namespace autotrader::application
