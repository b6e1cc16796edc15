/// @file main.cpp
/// @brief Duel service entry point.
///
/// Loads configuration, builds the style catalog and stat provider, runs
/// the duel server with its deadline ticker and broadcast pool, and shuts
/// down in reverse order on SIGINT/SIGTERM.

#include <cstdlib>
#include <iostream>
#include <string>

#include "duel/foundation/config_manager.hpp"
#include "duel/foundation/game_logger.hpp"
#include "duel/foundation/job_scheduler.hpp"
#include "duel/game/style_catalog.hpp"
#include "duel/service/deadline_ticker.hpp"
#include "duel/service/duel_server.hpp"
#include "duel/service/server_config.hpp"
#include "duel/service/service_runner.hpp"
#include "duel/service/stat_provider.hpp"
#include "duel/version.hpp"

int main(int argc, char* argv[]) {
    using duel::foundation::LogCategory;

    duel::service::SignalHandler signals;

    auto configPath = duel::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "/etc/duel/duel.yaml";
    }

    duel::foundation::ConfigManager config;
    auto loadResult = duel::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto settings = duel::service::buildServiceSettings(config);
    if (!settings) {
        std::cerr << settings.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto catalog = duel::game::StyleCatalog::fromConfig(config);
    if (!catalog) {
        std::cerr << "Failed to build style catalog: " << catalog.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto stats = duel::service::StaticStatProvider::fromConfig(config);
    if (!stats) {
        std::cerr << "Failed to configure stats: " << stats.error().message() << "\n";
        return EXIT_FAILURE;
    }

    const auto& svc = settings.value();
    duel::service::DuelServer server(
        svc.server, catalog.value(),
        std::make_shared<duel::service::StaticStatProvider>(stats.value()));

    duel::foundation::GameJobScheduler broadcastPool(svc.broadcastThreads, "duel_broadcast");
    server.setDeliveryExecutor([&broadcastPool](std::function<void()> delivery) {
        auto posted = broadcastPool.post(delivery, duel::foundation::JobPriority::High);
        if (!posted) {
            // Pool is shutting down; deliver on the publishing thread.
            delivery();
        }
    });

    auto startResult = server.start();
    if (!startResult) {
        std::cerr << "Failed to start duel server: " << startResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    duel::service::DeadlineTicker ticker(server, svc.tickerHz);
    if (!ticker.start()) {
        std::cerr << "Failed to start deadline ticker\n";
        return EXIT_FAILURE;
    }

    DUEL_LOG_INFO(LogCategory::Core, std::string(duel::Version::engine) + " " +
                                         duel::Version::string + " started");
    std::cout << "Duel server " << duel::Version::string << " started (styles: "
              << server.catalog().size() << ", ticker: " << svc.tickerHz
              << " Hz, broadcast threads: " << svc.broadcastThreads << ")\n";

    signals.waitForShutdown();

    std::cout << "Shutting down duel server...\n";
    ticker.stop();
    server.stop();
    broadcastPool.shutdown();
    (void)duel::foundation::GameLogger::instance().flush();
    std::cout << "Duel server stopped\n";
    return EXIT_SUCCESS;
}
