/// @file roll_generator.cpp
/// @brief RollGenerator implementation.

#include "duel/game/roll_generator.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace duel::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

Tier RollGenerator::classify(double u, const EffectiveParams& params) {
    const double crit = params.critRate;
    const double hitBand = std::max(0.0, params.hitChance - params.critRate);
    if (u < crit) {
        return Tier::Critical;
    }
    if (u < crit + hitBand) {
        return Tier::Hit;
    }
    return Tier::Miss;
}

GameResult<Tier> RollGenerator::roll(const EffectiveParams& params, RandomSource& source) {
    auto draw = source.nextUnit();
    if (!draw) {
        return GameResult<Tier>::err(GameError(
            ErrorCode::RandomSourceFailure,
            "random source failed: " + std::string(draw.error().message())));
    }
    const double u = draw.value();
    if (!(u >= 0.0 && u < 1.0)) {
        return GameResult<Tier>::err(GameError(
            ErrorCode::RandomSourceFailure,
            "random draw outside [0, 1): " + std::to_string(u)));
    }
    return GameResult<Tier>::ok(classify(u, params));
}

std::array<double, kTierCount> RollGenerator::tierProbabilities(const EffectiveParams& params) {
    const double crit = std::clamp(params.critRate, 0.0, 1.0);
    const double hit = std::clamp(std::max(0.0, params.hitChance - params.critRate), 0.0, 1.0 - crit);
    return {1.0 - crit - hit, hit, crit};
}

} // namespace duel::game
