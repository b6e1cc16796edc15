/// @file round_scorer.cpp
/// @brief RoundScorer and PushCurve implementation.

#include "duel/game/round_scorer.hpp"

#include "duel/foundation/config_manager.hpp"

#include <utility>

namespace duel::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

constexpr int tierRank(Tier tier) {
    return static_cast<int>(tier);
}

} // namespace

double PushCurve::basePush(Tier winner, Tier loser) const {
    const int margin = tierRank(winner) - tierRank(loser);
    return tierPush[static_cast<std::size_t>(winner)] + marginBonus * static_cast<double>(margin);
}

GameResult<PushCurve> PushCurve::fromConfig(const foundation::ConfigManager& config) {
    PushCurve curve;
    const std::pair<const char*, double*> keys[] = {
        {"duel.push.miss", &curve.tierPush[0]},
        {"duel.push.hit", &curve.tierPush[1]},
        {"duel.push.critical", &curve.tierPush[2]},
        {"duel.push.margin_bonus", &curve.marginBonus},
    };
    for (const auto& [key, target] : keys) {
        auto value = config.getIfPresent<double>(key, *target);
        if (!value) {
            return GameResult<PushCurve>::err(value.error());
        }
        *target = value.value();
    }

    if (curve.tierPush[0] < 0.0 || curve.marginBonus < 0.0) {
        return GameResult<PushCurve>::err(
            GameError(ErrorCode::InvalidArgument, "push values must be non-negative"));
    }
    if (curve.tierPush[1] < curve.tierPush[0] || curve.tierPush[2] < curve.tierPush[1]) {
        return GameResult<PushCurve>::err(
            GameError(ErrorCode::InvalidArgument, "tier push must not decrease with tier"));
    }
    return GameResult<PushCurve>::ok(curve);
}

RoundScorer::RoundScorer(PushCurve curve) : curve_(curve) {}

RoundOutcome RoundScorer::score(const ScoringInput& input) const {
    constexpr auto a = seatIndex(Seat::A);
    constexpr auto b = seatIndex(Seat::B);

    RoundOutcome outcome;
    outcome.tiers = input.bestOutcome;
    outcome.styles = input.styles;

    const int rankA = tierRank(input.bestOutcome[a]);
    const int rankB = tierRank(input.bestOutcome[b]);

    if (rankA != rankB) {
        outcome.winner = rankA > rankB ? Seat::A : Seat::B;
    } else {
        const bool feintA = input.params[a].feintTiebreak;
        const bool feintB = input.params[b].feintTiebreak;
        if (feintA != feintB) {
            outcome.winner = feintA ? Seat::A : Seat::B;
            outcome.tieBreakUsed = true;
        }
    }

    if (!outcome.winner) {
        return outcome;
    }

    const Seat winner = *outcome.winner;
    const Seat loser = opponentOf(winner);
    double push = curve_.basePush(input.bestOutcome[seatIndex(winner)],
                                  input.bestOutcome[seatIndex(loser)]);
    push *= input.params[seatIndex(winner)].winPushMult;
    push *= input.params[seatIndex(loser)].loseOpponentPushMult;
    outcome.push = push;
    return outcome;
}

} // namespace duel::game
