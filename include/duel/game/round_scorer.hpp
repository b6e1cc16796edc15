#pragma once

/// @file round_scorer.hpp
/// @brief RoundScorer: tier comparison, Feint tie-break and push.

#include <array>
#include <optional>
#include <string>

#include "duel/foundation/game_result.hpp"
#include "duel/game/duel_types.hpp"

namespace duel::foundation {
class ConfigManager;
}

namespace duel::game {

/// Tunable base push as a function of the winning tier and the margin.
///
///   base = tierPush[winner] + marginBonus * (winner - loser)
///
/// Defaults follow the hit = 10, critical = 1.5 x hit push constants, so a
/// larger margin at the same winning tier always pushes further.
struct PushCurve {
    std::array<double, kTierCount> tierPush{0.0, 10.0, 15.0};
    double marginBonus = 2.5;

    [[nodiscard]] double basePush(Tier winner, Tier loser) const;

    /// Reads `duel.push.{miss,hit,critical,margin_bonus}`, keeping defaults
    /// for absent keys.
    /// @return InvalidArgument when a value is negative or tiers decrease.
    [[nodiscard]] static foundation::GameResult<PushCurve> fromConfig(
        const foundation::ConfigManager& config);
};

/// Inputs to scoring: everything the round recorded at submission time.
struct ScoringInput {
    PerSeat<Tier> bestOutcome{Tier::Miss, Tier::Miss};
    PerSeat<EffectiveParams> params{};
    PerSeat<std::string> styles;
};

/// Result of one round. Written once, never mutated.
struct RoundOutcome {
    std::optional<Seat> winner;
    PerSeat<Tier> tiers{Tier::Miss, Tier::Miss};
    double push = 0.0;
    bool tieBreakUsed = false;
    PerSeat<std::string> styles;

    [[nodiscard]] bool isDraw() const noexcept { return !winner.has_value(); }
};

/// Pure scoring function.
///
///   1. Higher tier wins outright.
///   2. Equal tiers: exactly one Feint seat wins (tieBreakUsed); none or
///      both is a draw with zero push.
///   3. push = basePush * winPushMult[winner] * loseOpponentPushMult[loser],
///      applied in sequence.
class RoundScorer {
public:
    explicit RoundScorer(PushCurve curve = {});

    [[nodiscard]] RoundOutcome score(const ScoringInput& input) const;

    [[nodiscard]] const PushCurve& curve() const noexcept { return curve_; }

private:
    PushCurve curve_;
};

} // namespace duel::game
