#pragma once

#include "PostgresRow.hpp"
#include "ports/output/ILiveStatusRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace autotrader::adapters::secondary {

class PostgresLiveStatusRepository : public ports::output::ILiveStatusRepository {
public:
    explicit PostgresLiveStatusRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresLiveStatusRepository] Initialized" << std::endl;
    }

    void update(const std::string& symbol, const std::string& step) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "UPDATE live_status "
                "SET current_symbol = $1, current_step = $2, "
                "    last_update = (NOW() AT TIME ZONE 'utc') "
                "WHERE id = 1",
                symbol,
                step
            );

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLiveStatusRepository] update error: " << e.what() << std::endl;
        }
    }

    domain::LiveStatus get() override {
        domain::LiveStatus status;

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec(
                "SELECT current_symbol, current_step, last_update "
                "FROM live_status WHERE id = 1"
            );

            txn.commit();

            if (!result.empty()) {
                status.currentSymbol = pg::text(result[0]["current_symbol"]);
                status.currentStep = pg::text(result[0]["current_step"]);
                status.lastUpdate = pg::timestamp(result[0]["last_update"]);
            }
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLiveStatusRepository] get error: " << e.what() << std::endl;
        }

        return status;
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace autotrader::adapters::secondary
