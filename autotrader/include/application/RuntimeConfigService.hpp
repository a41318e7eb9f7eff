#pragma once

#include "application/RuntimeConfigOverlay.hpp"
#include "ports/input/IRuntimeConfigService.hpp"
#include "ports/output/IRuntimeConfigRepository.hpp"
#include "settings/TradingSettings.hpp"

#include <iostream>
#include <memory>

namespace autotrader::application {

/**
 * @brief Сервис runtime-конфигурации
 *
 * Реализует IRuntimeConfigService: каждый вызов effectiveConfig()
 * заново читает документ из хранилища, нормализует, валидирует и
 * накладывает его на базовую конфигурацию из config.json.
 */
class RuntimeConfigService : public ports::input::IRuntimeConfigService {
public:
    RuntimeConfigService(
        std::shared_ptr<ports::output::IRuntimeConfigRepository> repository,
        std::shared_ptr<settings::TradingSettings> settings
    ) : repository_(std::move(repository))
      , settings_(std::move(settings))
    {}

    domain::TradingConfig effectiveConfig() override {
        auto doc = document();
        RuntimeConfigOverlay::validate(doc);
        return RuntimeConfigOverlay::apply(settings_->getBaseConfig(), doc);
    }

    domain::RuntimeConfigDocument document() override {
        return RuntimeConfigOverlay::normalise(repository_->load());
    }

    domain::RuntimeConfigDocument replace(const domain::RuntimeConfigDocument& document) override {
        auto normalised = RuntimeConfigOverlay::normalise(document);
        RuntimeConfigOverlay::validate(normalised);
        repository_->save(normalised);
        std::cout << "[RuntimeConfigService] Runtime config replaced (active strategy: "
                  << normalised.value("active_strategy", std::string("Default")) << ")" << std::endl;
        return normalised;
    }

private:
    std::shared_ptr<ports::output::IRuntimeConfigRepository> repository_;
    std::shared_ptr<settings::TradingSettings> settings_;
};

} // namespace autotrader::application
