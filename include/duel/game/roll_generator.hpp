#pragma once

/// @file roll_generator.hpp
/// @brief RollGenerator: one tier outcome per swing.

#include "duel/foundation/game_result.hpp"
#include "duel/game/duel_types.hpp"
#include "duel/game/random_source.hpp"

namespace duel::game {

/// Maps a single uniform draw onto a tier.
///
///   u <  crit                        -> Critical
///   u <  crit + max(0, hit - crit)   -> Hit
///   otherwise                        -> Miss
///
/// hitChance is the probability of hit-or-better, so a crit rate above the
/// hit chance leaves no separate hit band.
class RollGenerator {
public:
    /// Classify an already-drawn value. @p u must lie in [0, 1).
    [[nodiscard]] static Tier classify(double u, const EffectiveParams& params);

    /// Draw exactly once from @p source and classify.
    /// @return RandomSourceFailure when the source errors or leaves [0, 1).
    [[nodiscard]] static foundation::GameResult<Tier> roll(const EffectiveParams& params,
                                                           RandomSource& source);

    /// Miss/hit/critical probabilities implied by @p params, summing to 1.
    [[nodiscard]] static std::array<double, kTierCount> tierProbabilities(
        const EffectiveParams& params);
};

} // namespace duel::game
