#pragma once

/// @file service_runner.hpp
/// @brief Entry-point utilities for the duel_server executable.
///
/// Signal handling, configuration loading and CLI parsing.

#include <atomic>
#include <filesystem>

#include "duel/foundation/config_manager.hpp"
#include "duel/foundation/game_result.hpp"

namespace duel::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler should exist per process. The handler does a
/// relaxed store on a lock-free atomic, which is async-signal-safe. The
/// destructor restores the default handlers so a second signal terminates
/// the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

    /// Raise the flag without a signal (tests, embedded use).
    static void requestShutdown() noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Environment variable that overrides the config path.
inline constexpr const char* kConfigPathEnv = "DUEL_CONFIG_PATH";

/// Load a YAML configuration file into @p config.
///
/// The path is resolved in order:
///   1. DUEL_CONFIG_PATH environment variable (if set and non-empty)
///   2. @p defaultPath
///
/// @return Success or ConfigLoadFailed.
[[nodiscard]] foundation::GameResult<void>
loadConfig(foundation::ConfigManager& config, const std::filesystem::path& defaultPath);

/// Parse `--config <path>` from command-line arguments.
/// @return The path, or an empty path if absent.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

} // namespace duel::service
