#pragma once

#include "ports/output/IRuntimeConfigRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace autotrader::adapters::secondary {

/**
 * @brief Документ оверлея в singleton-строке runtime_config (id = 1)
 *
 * В отличие от остальных чтений, load() не подменяет ошибку значением
 * по умолчанию: цикл должен встать на паузу, а не торговать по базе.
 */
class PostgresRuntimeConfigRepository : public ports::output::IRuntimeConfigRepository {
public:
    explicit PostgresRuntimeConfigRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresRuntimeConfigRepository] Initialized" << std::endl;
    }

    domain::RuntimeConfigDocument load() override {
        std::string raw;

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec("SELECT config_json FROM runtime_config WHERE id = 1");
            txn.commit();

            if (result.empty()) {
                throw domain::RuntimeConfigError("runtime_config row (id=1) not found");
            }
            if (result[0]["config_json"].is_null()) {
                throw domain::RuntimeConfigError("runtime_config.config_json is NULL");
            }
            raw = result[0]["config_json"].as<std::string>();
        } catch (const domain::RuntimeConfigError&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresRuntimeConfigRepository] load error: " << e.what() << std::endl;
            throw domain::RuntimeConfigError(std::string("runtime_config read failed: ") + e.what());
        }

        domain::RuntimeConfigDocument document;
        try {
            document = nlohmann::json::parse(raw);
        } catch (const nlohmann::json::parse_error& e) {
            throw domain::RuntimeConfigError(
                std::string("runtime_config.config_json is not valid JSON: ") + e.what());
        }

        if (!document.is_object()) {
            throw domain::RuntimeConfigError(
                std::string("runtime_config.config_json must be a JSON object; got ") +
                document.type_name());
        }
        return document;
    }

    void save(const domain::RuntimeConfigDocument& document) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "INSERT INTO runtime_config (id, config_json, updated_at) "
                "VALUES (1, $1, (NOW() AT TIME ZONE 'utc')) "
                "ON CONFLICT (id) DO UPDATE "
                "SET config_json = EXCLUDED.config_json, updated_at = EXCLUDED.updated_at",
                document.dump()
            );

            txn.commit();
            std::cout << "[PostgresRuntimeConfigRepository] Saved runtime config" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresRuntimeConfigRepository] save error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace autotrader::adapters::secondary
