#include "AutoTraderApp.hpp"

#include <HttpClient.hpp>
#include <IEnvironment.hpp>
#include <WorkerPool.hpp>

// Settings
#include "settings/BrokerSettings.hpp"
#include "settings/DbSettings.hpp"
#include "settings/DecisionServiceSettings.hpp"
#include "settings/LoopSettings.hpp"
#include "settings/TradingSettings.hpp"

// Application Services
#include "application/CandidateResearcher.hpp"
#include "application/CycleScheduler.hpp"
#include "application/MarketScreener.hpp"
#include "application/MonitoringQueryService.hpp"
#include "application/OrderExecutor.hpp"
#include "application/PositionReviewEngine.hpp"
#include "application/RuntimeConfigService.hpp"

// Secondary Adapters
#include "adapters/secondary/broker/BrokerBridge.hpp"
#include "adapters/secondary/broker/PaperBrokerSession.hpp"
#include "adapters/secondary/broker/PaperMarketTicker.hpp"
#include "adapters/secondary/broker/PriceSimulator.hpp"
#include "adapters/secondary/decision/HttpDecisionService.hpp"
#include "adapters/secondary/persistence/PostgresEventLog.hpp"
#include "adapters/secondary/persistence/PostgresLiveStatusRepository.hpp"
#include "adapters/secondary/persistence/PostgresResearchRepository.hpp"
#include "adapters/secondary/persistence/PostgresReviewRepository.hpp"
#include "adapters/secondary/persistence/PostgresRuntimeConfigRepository.hpp"
#include "adapters/secondary/persistence/PostgresSchema.hpp"
#include "adapters/secondary/persistence/PostgresSnapshotRepository.hpp"
#include "adapters/secondary/persistence/PostgresSocialSentimentSource.hpp"
#include "adapters/secondary/persistence/PostgresTradeRepository.hpp"
#include "adapters/secondary/system/SystemClock.hpp"

// Primary Adapters
#include "adapters/primary/EventsHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/RuntimeConfigHandler.hpp"
#include "adapters/primary/StatusHandler.hpp"

#include <algorithm>
#include <iostream>

namespace di = boost::di;

namespace autotrader {

// ============================================================================
// AutoTraderApp Implementation
// ============================================================================

AutoTraderApp::AutoTraderApp()
{
    std::cout << "[AutoTraderApp] Application created" << std::endl;
}

AutoTraderApp::~AutoTraderApp()
{
    shutdownServices();
    std::cout << "[AutoTraderApp] Application destroyed" << std::endl;
}

void AutoTraderApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[AutoTraderApp] Loading environment..." << std::endl;

    // Базовый метод загружает config.json в env_
    BoostBeastApplication::loadEnvironment(argc, argv);

    std::cout << "[AutoTraderApp] Environment loaded successfully" << std::endl;
}

void AutoTraderApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[AutoTraderApp] Configuring Boost.DI injection..." << std::endl;

    // ========================================================================
    // Шаг 1: Настройки и инфраструктура с собственными потоками
    // ========================================================================

    auto settingsInjector = di::make_injector(
        di::bind<settings::BrokerSettings>().in(di::singleton),
        di::bind<settings::LoopSettings>().in(di::singleton));

    auto brokerSettings = settingsInjector.create<std::shared_ptr<settings::BrokerSettings>>();
    auto loopSettings = settingsInjector.create<std::shared_ptr<settings::LoopSettings>>();

    auto simulator = std::make_shared<adapters::secondary::PriceSimulator>(brokerSettings->getPaperSeed());
    auto session = std::make_shared<adapters::secondary::PaperBrokerSession>(simulator);
    ticker_ = std::make_shared<adapters::secondary::PaperMarketTicker>(simulator, session);
    bridge_ = std::make_shared<adapters::secondary::BrokerBridge>(session, brokerSettings);
    pool_ = std::make_shared<common::WorkerPool>(loopSettings->getWorkerThreads());

    // ========================================================================
    // Шаг 2: Основной injector (порты -> адаптеры)
    // ========================================================================

    auto injector = di::make_injector(
        di::bind<IEnvironment>().to(env_),

        di::bind<settings::DbSettings>().in(di::singleton),
        di::bind<settings::DecisionServiceSettings>().in(di::singleton),
        di::bind<settings::TradingSettings>().in(di::singleton),

        di::bind<ports::output::IBrokerGateway>().to(
            std::static_pointer_cast<ports::output::IBrokerGateway>(bridge_)),

        di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
        di::bind<ports::output::IDecisionService>()
            .to<adapters::secondary::HttpDecisionService>()
            .in(di::singleton),

        di::bind<ports::output::IClock>().to<adapters::secondary::SystemClock>().in(di::singleton),

        // Repositories - PostgreSQL
        di::bind<ports::output::IEventLog>()
            .to<adapters::secondary::PostgresEventLog>()
            .in(di::singleton),
        di::bind<ports::output::ILiveStatusRepository>()
            .to<adapters::secondary::PostgresLiveStatusRepository>()
            .in(di::singleton),
        di::bind<ports::output::ITradeRepository>()
            .to<adapters::secondary::PostgresTradeRepository>()
            .in(di::singleton),
        di::bind<ports::output::IResearchRepository>()
            .to<adapters::secondary::PostgresResearchRepository>()
            .in(di::singleton),
        di::bind<ports::output::IReviewRepository>()
            .to<adapters::secondary::PostgresReviewRepository>()
            .in(di::singleton),
        di::bind<ports::output::ISnapshotRepository>()
            .to<adapters::secondary::PostgresSnapshotRepository>()
            .in(di::singleton),
        di::bind<ports::output::IRuntimeConfigRepository>()
            .to<adapters::secondary::PostgresRuntimeConfigRepository>()
            .in(di::singleton),
        di::bind<ports::output::ISocialSentimentSource>()
            .to<adapters::secondary::PostgresSocialSentimentSource>()
            .in(di::singleton),

        di::bind<ports::input::IRuntimeConfigService>()
            .to<application::RuntimeConfigService>()
            .in(di::singleton));

    try {
        injector.create<std::shared_ptr<adapters::secondary::PostgresSchema>>()->initialize();
    } catch (const std::exception& e) {
        // Цикл сам сообщит о недоступной конфигурации и встанет на паузу
        std::cerr << "[AutoTraderApp] Schema initialization failed: " << e.what() << std::endl;
    }

    auto broker = injector.create<std::shared_ptr<ports::output::IBrokerGateway>>();
    auto decisions = injector.create<std::shared_ptr<ports::output::IDecisionService>>();
    auto social = injector.create<std::shared_ptr<ports::output::ISocialSentimentSource>>();
    auto events = injector.create<std::shared_ptr<ports::output::IEventLog>>();
    auto liveStatus = injector.create<std::shared_ptr<ports::output::ILiveStatusRepository>>();
    auto trades = injector.create<std::shared_ptr<ports::output::ITradeRepository>>();
    auto clock = injector.create<std::shared_ptr<ports::output::IClock>>();
    auto configService = injector.create<std::shared_ptr<ports::input::IRuntimeConfigService>>();

    // ========================================================================
    // Шаг 3: Сервисы цикла (таймауты из настроек, поэтому без DI)
    // ========================================================================

    const auto accountTimeout = std::chrono::duration_cast<std::chrono::milliseconds>(
        brokerSettings->getRequestTimeout()) + std::chrono::seconds(2);

    auto executor = std::make_shared<application::OrderExecutor>(broker, accountTimeout);
    auto screener = std::make_shared<application::MarketScreener>(broker);
    auto researcher = std::make_shared<application::CandidateResearcher>(
        broker, decisions, social,
        injector.create<std::shared_ptr<ports::output::IResearchRepository>>(),
        events, liveStatus, clock, pool_);
    auto review = std::make_shared<application::PositionReviewEngine>(
        broker, executor, decisions, social, trades,
        injector.create<std::shared_ptr<ports::output::IReviewRepository>>(),
        events, liveStatus, clock, accountTimeout);

    application::CycleScheduler::Dependencies deps;
    deps.config = configService;
    deps.review = review;
    deps.broker = broker;
    deps.executor = executor;
    deps.screener = screener;
    deps.researcher = researcher;
    deps.decisions = decisions;
    deps.social = social;
    deps.snapshots = injector.create<std::shared_ptr<ports::output::ISnapshotRepository>>();
    deps.research = injector.create<std::shared_ptr<ports::output::IResearchRepository>>();
    deps.trades = trades;
    deps.events = events;
    deps.liveStatus = liveStatus;
    deps.clock = clock;

    application::CycleScheduler::Options options;
    options.orderReviewMinAgeMinutes = loopSettings->getOrderReviewMinAgeMinutes();
    options.topCandidates = loopSettings->getTopCandidates();
    options.accountTimeout = accountTimeout;
    options.initialInterval = std::chrono::seconds(std::max(
        0, injector.create<std::shared_ptr<settings::TradingSettings>>()->getBaseConfig().intraday.cycleIntervalSeconds));

    loop_ = std::make_shared<application::CycleScheduler>(std::move(deps), options);

    auto monitoring = std::make_shared<application::MonitoringQueryService>(
        liveStatus, events, broker, loop_);

    // ========================================================================
    // Шаг 4: HTTP Handlers
    // ========================================================================

    auto handlerInjector = di::make_injector(
        di::bind<ports::input::IMonitoringQueryService>().to(
            std::static_pointer_cast<ports::input::IMonitoringQueryService>(monitoring)),
        di::bind<ports::input::IRuntimeConfigService>().to(configService));

    {
        auto handler = handlerInjector.create<std::shared_ptr<adapters::primary::HealthHandler>>();
        handlers_[getHandlerKey("GET", "/health")] = handler;
        std::cout << "  ✓ HealthHandler: GET /health" << std::endl;
    }

    {
        auto handler = handlerInjector.create<std::shared_ptr<adapters::primary::StatusHandler>>();
        handlers_[getHandlerKey("GET", "/api/v1/status")] = handler;
        std::cout << "  ✓ StatusHandler: GET /api/v1/status" << std::endl;
    }

    {
        auto handler = handlerInjector.create<std::shared_ptr<adapters::primary::EventsHandler>>();
        handlers_[getHandlerKey("GET", "/api/v1/events")] = handler;
        std::cout << "  ✓ EventsHandler: GET /api/v1/events" << std::endl;
    }

    {
        auto handler = handlerInjector.create<std::shared_ptr<adapters::primary::RuntimeConfigHandler>>();
        handlers_[getHandlerKey("GET", "/api/v1/runtime-config")] = handler;
        handlers_[getHandlerKey("PUT", "/api/v1/runtime-config")] = handler;
        std::cout << "  ✓ RuntimeConfigHandler: GET/PUT /api/v1/runtime-config" << std::endl;
    }

    // ========================================================================
    // Шаг 5: Запуск моста и цикла ПОСЛЕ регистрации handlers
    // ========================================================================

    ticker_->start();
    bridge_->start();

    if (loopSettings->getAutostart()) {
        loop_->start();
    } else {
        std::cout << "[AutoTraderApp] Loop autostart disabled" << std::endl;
    }

    std::cout << "\n[AutoTraderApp] DI configuration completed - "
              << handlers_.size() << " routes registered" << std::endl;
}

void AutoTraderApp::shutdownServices()
{
    if (loop_) loop_->stop();
    if (pool_) pool_->stop();
    if (ticker_) ticker_->stop();
    if (bridge_) bridge_->stop();
}

void AutoTraderApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║              AutoTrader — Control Loop               ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  HTTP Server:  Boost.Beast                           ║" << std::endl;
    std::cout << "║  Storage:      PostgreSQL (libpqxx)                  ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}

} // namespace autotrader
