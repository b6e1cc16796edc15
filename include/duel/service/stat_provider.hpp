#pragma once

/// @file stat_provider.hpp
/// @brief Source of per-participant base stats.

#include <mutex>
#include <unordered_map>

#include "duel/foundation/game_result.hpp"
#include "duel/foundation/types.hpp"
#include "duel/game/duel_types.hpp"

namespace duel::foundation {
class ConfigManager;
}

namespace duel::service {

/// Looks up a participant's base attributes when a match is created.
///
/// Implemented by the character/stat collaborator; errors propagate to
/// DuelServer::createMatch unchanged.
class StatProvider {
public:
    virtual ~StatProvider() = default;

    [[nodiscard]] virtual foundation::GameResult<game::BaseStats> lookup(
        foundation::PlayerId playerId) const = 0;
};

/// In-memory provider: configured defaults plus per-player overrides.
class StaticStatProvider final : public StatProvider {
public:
    explicit StaticStatProvider(game::BaseStats defaults = {});

    /// Defaults from `duel.base_swing_cap` and `duel.stats.*`.
    [[nodiscard]] static foundation::GameResult<StaticStatProvider> fromConfig(
        const foundation::ConfigManager& config);

    StaticStatProvider(const StaticStatProvider& other);
    StaticStatProvider& operator=(const StaticStatProvider&) = delete;

    /// @return InvalidArgument for an invalid id or out-of-range stats.
    foundation::GameResult<void> setOverride(foundation::PlayerId playerId,
                                             game::BaseStats stats);

    void clearOverride(foundation::PlayerId playerId);

    [[nodiscard]] foundation::GameResult<game::BaseStats> lookup(
        foundation::PlayerId playerId) const override;

    [[nodiscard]] const game::BaseStats& defaults() const noexcept { return defaults_; }

    /// Probabilities within [0, 1] and a cap of at least 1.
    [[nodiscard]] static bool isValid(const game::BaseStats& stats);

private:
    game::BaseStats defaults_;
    mutable std::mutex mutex_;
    std::unordered_map<foundation::PlayerId, game::BaseStats> overrides_;
};

} // namespace duel::service
