#pragma once

/// @file server_config.hpp
/// @brief Builds duel service settings from `duel.*` configuration keys.

#include <cstddef>
#include <cstdint>

#include "duel/foundation/config_manager.hpp"
#include "duel/foundation/game_result.hpp"
#include "duel/service/server_types.hpp"

namespace duel::service {

/// Everything the duel_server executable needs besides the catalog and
/// the stat provider.
struct DuelServiceSettings {
    DuelServerConfig server;
    uint32_t tickerHz = 10;
    std::size_t broadcastThreads = 2;
};

/// Read `duel.style_lock_seconds`, `duel.swing_phase_seconds`,
/// `duel.max_rounds`, `duel.control_bar.start`, `duel.push.*`,
/// `duel.ticker_hz` and `duel.broadcast_threads`. Absent keys keep their
/// defaults; present but invalid values are errors.
[[nodiscard]] foundation::GameResult<DuelServiceSettings> buildServiceSettings(
    const foundation::ConfigManager& config);

} // namespace duel::service
