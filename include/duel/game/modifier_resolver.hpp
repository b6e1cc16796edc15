#pragma once

/// @file modifier_resolver.hpp
/// @brief ModifierResolver: folds both seats' styles into round parameters.

#include "duel/game/duel_types.hpp"
#include "duel/game/style_catalog.hpp"

namespace duel::game {

/// Pure, multiplicative fold of style effects over base stats.
///
///   hit[P]  = clamp01(base_hit[P] * self_hit[P] * opponent_hit[opp(P)])
///   crit[P] = clamp01(base_crit[P] * self_crit[P])
///   cap[P]  = max(1, base_cap[P] + cap_delta[P])
///
/// Push multipliers and the Feint flag are copied from P's own style.
/// Computed once per round when both styles are locked.
class ModifierResolver {
public:
    [[nodiscard]] static PerSeat<EffectiveParams> resolve(
        const PerSeat<StyleEffect>& styles,
        const PerSeat<BaseStats>& base);

    /// Parameters for one seat given its own and the opposing style.
    [[nodiscard]] static EffectiveParams resolveSeat(const StyleEffect& self,
                                                     const StyleEffect& opponent,
                                                     const BaseStats& base);

    [[nodiscard]] static double clamp01(double value);
};

} // namespace duel::game
