#pragma once

/// @file duel_round.hpp
/// @brief DuelRound: per-round state machine.
///
/// A round moves StyleSelect -> Swing -> Resolved. Participant actions and
/// deadline messages are the only inputs; the owning match serializes them,
/// so the round itself holds no lock. Rejected actions never mutate state.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "duel/foundation/game_result.hpp"
#include "duel/foundation/types.hpp"
#include "duel/game/duel_types.hpp"
#include "duel/game/random_source.hpp"
#include "duel/game/round_scorer.hpp"
#include "duel/game/style_catalog.hpp"

namespace duel::game {

/// Per-seat round state.
struct SeatState {
    std::optional<std::string> styleLock;
    bool styleDefaulted = false;
    int32_t swingsUsed = 0;
    int32_t swingCap = 1;
    /// Last swing outcome; every swing overwrites it.
    std::optional<Tier> currentRoll;
    /// currentRoll at stop time, or Miss when forced without a swing.
    std::optional<Tier> bestOutcome;
    bool submitted = false;
    /// Submitted by the swing deadline rather than by stop().
    bool forced = false;
    BaseStats base;
    EffectiveParams params;
};

/// What a deadline message changed.
struct DeadlineEffect {
    bool stylesDefaulted = false;
    bool swingsForced = false;

    [[nodiscard]] bool resolved() const noexcept { return swingsForced; }
    [[nodiscard]] bool any() const noexcept { return stylesDefaulted || swingsForced; }
};

/// State machine for one round of a duel.
///
/// Invariants held after every call:
///  - a style lock never changes once written;
///  - swingsUsed <= swingCap;
///  - currentRoll is set iff swingsUsed >= 1;
///  - the outcome is scored at most once, after both seats submitted;
///  - phases only move forward, one step at a time (or to Aborted).
class DuelRound {
public:
    DuelRound(foundation::MatchId matchId, uint32_t roundNo,
              const PerSeat<BaseStats>& base, const StyleCatalog& catalog,
              const RoundScorer& scorer, RoundTimings timings, TimePoint startedAt);

    /// Lock @p styleId for @p seat. Enters Swing when both seats hold a style.
    /// @return The phase after the call.
    foundation::GameResult<RoundPhase> lockStyle(Seat seat, std::string_view styleId,
                                                 TimePoint now);

    /// One swing: exactly one draw from @p source.
    /// A failed draw aborts the round and returns RandomSourceFailure.
    foundation::GameResult<Tier> swing(Seat seat, RandomSource& source);

    /// Submit the current roll. Resolves the round when both seats submitted.
    /// @return True when this call resolved the round.
    foundation::GameResult<bool> stop(Seat seat);

    /// Deadline message. Applies whichever deadlines are due at @p now.
    foundation::GameResult<DeadlineEffect> fireDeadlines(TimePoint now);

    /// Terminal transition for fatal conditions. No-op once resolved.
    void abort(foundation::GameError reason);

    /// Verify every round invariant.
    /// @return InvariantViolation describing the first broken one.
    [[nodiscard]] foundation::GameResult<void> checkInvariants() const;

    [[nodiscard]] foundation::MatchId matchId() const noexcept { return matchId_; }
    [[nodiscard]] uint32_t roundNo() const noexcept { return roundNo_; }
    [[nodiscard]] RoundPhase phase() const noexcept { return phase_; }
    [[nodiscard]] bool isTerminal() const noexcept {
        return phase_ == RoundPhase::Resolved || phase_ == RoundPhase::Aborted;
    }

    [[nodiscard]] const SeatState& seat(Seat s) const { return seats_[seatIndex(s)]; }

    [[nodiscard]] TimePoint startedAt() const noexcept { return startedAt_; }
    [[nodiscard]] TimePoint styleDeadline() const noexcept { return styleDeadline_; }
    [[nodiscard]] std::optional<TimePoint> swingDeadline() const noexcept { return swingDeadline_; }

    [[nodiscard]] const std::optional<RoundOutcome>& outcome() const noexcept { return outcome_; }
    [[nodiscard]] const std::optional<foundation::GameError>& abortReason() const noexcept {
        return abortReason_;
    }

    /// Both seats' parameters are fixed once the round enters Swing.
    [[nodiscard]] bool paramsResolved() const noexcept { return paramsResolved_; }

private:
    /// Common rejection for actions on terminal rounds.
    [[nodiscard]] std::optional<foundation::GameError> terminalError() const;

    foundation::GameResult<void> transitionTo(RoundPhase next);
    foundation::GameResult<void> enterSwing(TimePoint now);
    foundation::GameResult<void> resolve();
    void submit(Seat seat, bool forced);

    foundation::MatchId matchId_;
    uint32_t roundNo_;
    const StyleCatalog& catalog_;
    const RoundScorer& scorer_;
    RoundTimings timings_;

    RoundPhase phase_ = RoundPhase::StyleSelect;
    PerSeat<SeatState> seats_;
    bool paramsResolved_ = false;

    TimePoint startedAt_;
    TimePoint styleDeadline_;
    std::optional<TimePoint> swingDeadline_;

    std::optional<RoundOutcome> outcome_;
    std::optional<foundation::GameError> abortReason_;
};

} // namespace duel::game
