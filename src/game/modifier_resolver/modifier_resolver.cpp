/// @file modifier_resolver.cpp
/// @brief ModifierResolver implementation.

#include "duel/game/modifier_resolver.hpp"

#include <algorithm>
#include <cmath>

namespace duel::game {

double ModifierResolver::clamp01(double value) {
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::clamp(value, 0.0, 1.0);
}

EffectiveParams ModifierResolver::resolveSeat(const StyleEffect& self,
                                              const StyleEffect& opponent,
                                              const BaseStats& base) {
    EffectiveParams params;
    params.hitChance = clamp01(base.baseHitChance * self.selfHit() * opponent.opponentHit());
    params.critRate = clamp01(base.baseCritRate * self.selfCrit());
    params.rollCap = std::max<int32_t>(1, base.baseRollCap + self.capDelta());
    params.winPushMult = self.winPush();
    params.loseOpponentPushMult = self.loseOpponentPush();
    params.feintTiebreak = self.feintTiebreak;
    return params;
}

PerSeat<EffectiveParams> ModifierResolver::resolve(const PerSeat<StyleEffect>& styles,
                                                   const PerSeat<BaseStats>& base) {
    constexpr auto a = seatIndex(Seat::A);
    constexpr auto b = seatIndex(Seat::B);
    return {resolveSeat(styles[a], styles[b], base[a]),
            resolveSeat(styles[b], styles[a], base[b])};
}

} // namespace duel::game
