/// @file service_runner.cpp
/// @brief Entry-point utilities for the duel_server executable.

#include "duel/service/service_runner.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string_view>
#include <thread>

#include "duel/foundation/game_logger.hpp"

namespace duel::service {

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

// -- Config loading ----------------------------------------------------------

foundation::GameResult<void>
loadConfig(foundation::ConfigManager& config, const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv(kConfigPathEnv);
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    auto loaded = config.load(configPath);
    if (loaded) {
        DUEL_LOG_INFO(foundation::LogCategory::Config,
                      "loaded configuration from " + configPath.string());
    }
    return loaded;
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

} // namespace duel::service
