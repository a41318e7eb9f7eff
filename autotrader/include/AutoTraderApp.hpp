#pragma once

#include <BoostBeastApplication.hpp>
#include <IHttpHandler.hpp>
#include <boost/di.hpp>
#include <memory>

namespace autotrader::common {
    class WorkerPool;
}

namespace autotrader::adapters::secondary {
    class BrokerBridge;
    class PaperMarketTicker;
}

namespace autotrader::application {
    class CycleScheduler;
}

namespace autotrader {

/**
 * @class AutoTraderApp
 * @brief Автономный торговый цикл + HTTP API мониторинга
 *
 * Наследует BoostBeastApplication с Template Method паттерном:
 * 1. loadEnvironment() - загрузка config.json в Environment
 * 2. configureInjection() - сборка графа объектов, регистрация handlers,
 *    запуск моста к брокеру и цикла
 * 3. start() - запуск HTTP сервера (из базового класса)
 *
 * Мост, тикер бумажного рынка и цикл владеют своими потоками;
 * деструктор останавливает их в обратном порядке.
 */
class AutoTraderApp : public BoostBeastApplication
{
public:
    AutoTraderApp();
    ~AutoTraderApp() override;

protected:
    void loadEnvironment(int argc, char* argv[]) override;
    void configureInjection() override;

private:
    std::shared_ptr<adapters::secondary::BrokerBridge> bridge_;
    std::shared_ptr<adapters::secondary::PaperMarketTicker> ticker_;
    std::shared_ptr<common::WorkerPool> pool_;
    std::shared_ptr<application::CycleScheduler> loop_;

    void printStartupBanner();
    void shutdownServices();
};

} // namespace autotrader
