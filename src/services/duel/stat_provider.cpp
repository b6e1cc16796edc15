/// @file stat_provider.cpp
/// @brief StaticStatProvider implementation.

#include "duel/service/stat_provider.hpp"

#include "duel/foundation/config_manager.hpp"

namespace duel::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

StaticStatProvider::StaticStatProvider(game::BaseStats defaults)
    : defaults_(defaults) {}

StaticStatProvider::StaticStatProvider(const StaticStatProvider& other)
    : defaults_(other.defaults_) {
    std::lock_guard lock(other.mutex_);
    overrides_ = other.overrides_;
}

bool StaticStatProvider::isValid(const game::BaseStats& stats) {
    return stats.baseHitChance >= 0.0 && stats.baseHitChance <= 1.0 &&
           stats.baseCritRate >= 0.0 && stats.baseCritRate <= 1.0 &&
           stats.baseRollCap >= 1;
}

GameResult<StaticStatProvider> StaticStatProvider::fromConfig(
    const foundation::ConfigManager& config) {
    game::BaseStats defaults;
    auto hit = config.getIfPresent<double>("duel.stats.base_hit_chance", defaults.baseHitChance);
    if (!hit) {
        return GameResult<StaticStatProvider>::err(hit.error());
    }
    auto crit = config.getIfPresent<double>("duel.stats.base_crit_rate", defaults.baseCritRate);
    if (!crit) {
        return GameResult<StaticStatProvider>::err(crit.error());
    }
    auto cap = config.getIfPresent<int32_t>("duel.base_swing_cap", defaults.baseRollCap);
    if (!cap) {
        return GameResult<StaticStatProvider>::err(cap.error());
    }
    defaults.baseHitChance = hit.value();
    defaults.baseCritRate = crit.value();
    defaults.baseRollCap = cap.value();

    if (!isValid(defaults)) {
        return GameResult<StaticStatProvider>::err(GameError(
            ErrorCode::InvalidArgument, "duel.stats / duel.base_swing_cap out of range"));
    }
    return GameResult<StaticStatProvider>::ok(StaticStatProvider(defaults));
}

GameResult<void> StaticStatProvider::setOverride(foundation::PlayerId playerId,
                                                 game::BaseStats stats) {
    if (!playerId.isValid()) {
        return GameResult<void>::err(GameError(ErrorCode::InvalidArgument, "invalid player id"));
    }
    if (!isValid(stats)) {
        return GameResult<void>::err(GameError(ErrorCode::InvalidArgument, "stats out of range"));
    }
    std::lock_guard lock(mutex_);
    overrides_[playerId] = stats;
    return GameResult<void>::ok();
}

void StaticStatProvider::clearOverride(foundation::PlayerId playerId) {
    std::lock_guard lock(mutex_);
    overrides_.erase(playerId);
}

GameResult<game::BaseStats> StaticStatProvider::lookup(foundation::PlayerId playerId) const {
    if (!playerId.isValid()) {
        return GameResult<game::BaseStats>::err(
            GameError(ErrorCode::StatLookupFailed, "invalid player id"));
    }
    std::lock_guard lock(mutex_);
    auto it = overrides_.find(playerId);
    return GameResult<game::BaseStats>::ok(it != overrides_.end() ? it->second : defaults_);
}

} // namespace duel::service
