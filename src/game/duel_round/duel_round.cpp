/// @file duel_round.cpp
/// @brief DuelRound state machine implementation.

#include "duel/game/duel_round.hpp"

#include "duel/foundation/game_logger.hpp"
#include "duel/game/modifier_resolver.hpp"
#include "duel/game/roll_generator.hpp"

#include <algorithm>

namespace duel::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

LogContext roundContext(foundation::MatchId matchId, uint32_t roundNo, Seat seat) {
    LogContext ctx;
    ctx.matchId = matchId;
    ctx.roundNo = roundNo;
    ctx.extra["seat"] = std::string(seatName(seat));
    return ctx;
}

} // namespace

DuelRound::DuelRound(foundation::MatchId matchId, uint32_t roundNo,
                     const PerSeat<BaseStats>& base, const StyleCatalog& catalog,
                     const RoundScorer& scorer, RoundTimings timings, TimePoint startedAt)
    : matchId_(matchId),
      roundNo_(roundNo),
      catalog_(catalog),
      scorer_(scorer),
      timings_(timings),
      startedAt_(startedAt),
      styleDeadline_(startedAt + timings.styleLock) {
    for (std::size_t i = 0; i < kSeatCount; ++i) {
        seats_[i].base = base[i];
        seats_[i].swingCap = std::max<int32_t>(1, base[i].baseRollCap);
    }
}

std::optional<GameError> DuelRound::terminalError() const {
    if (phase_ == RoundPhase::Resolved) {
        return GameError(ErrorCode::RoundAlreadyResolved,
                         "round " + std::to_string(roundNo_) + " already resolved");
    }
    if (phase_ == RoundPhase::Aborted) {
        return GameError(ErrorCode::RoundAborted,
                         "round " + std::to_string(roundNo_) + " was aborted");
    }
    return std::nullopt;
}

// ── Style selection ─────────────────────────────────────────────────────

GameResult<RoundPhase> DuelRound::lockStyle(Seat seat, std::string_view styleId,
                                            TimePoint now) {
    if (auto terminal = terminalError()) {
        return GameResult<RoundPhase>::err(std::move(*terminal));
    }
    auto& state = seats_[seatIndex(seat)];
    // A defaulted seat never chose; it missed the style phase.
    if (state.styleLock && !state.styleDefaulted) {
        return GameResult<RoundPhase>::err(GameError(
            ErrorCode::StyleAlreadyLocked, "style already locked as " + *state.styleLock));
    }
    if (phase_ != RoundPhase::StyleSelect) {
        return GameResult<RoundPhase>::err(GameError(
            ErrorCode::WrongPhase,
            "cannot lock style during " + std::string(phaseName(phase_))));
    }
    if (!catalog_.contains(styleId)) {
        return GameResult<RoundPhase>::err(GameError(
            ErrorCode::UnknownStyle, "unknown style: " + std::string(styleId)));
    }

    state.styleLock = std::string(styleId);
    DUEL_LOG_CTX(LogLevel::Debug, LogCategory::Round, "style locked",
                 roundContext(matchId_, roundNo_, seat));

    if (seats_[0].styleLock && seats_[1].styleLock) {
        auto entered = enterSwing(now);
        if (!entered) {
            return GameResult<RoundPhase>::err(entered.error());
        }
    }
    return GameResult<RoundPhase>::ok(phase_);
}

GameResult<void> DuelRound::enterSwing(TimePoint now) {
    PerSeat<StyleEffect> effects;
    PerSeat<BaseStats> base;
    for (std::size_t i = 0; i < kSeatCount; ++i) {
        auto effect = catalog_.lookup(*seats_[i].styleLock);
        if (!effect) {
            // Locks are validated on entry, so a miss here is a broken catalog.
            GameError error(ErrorCode::InvariantViolation,
                            "locked style vanished from catalog: " + *seats_[i].styleLock);
            abort(error);
            return GameResult<void>::err(std::move(error));
        }
        effects[i] = effect.value();
        base[i] = seats_[i].base;
    }

    auto params = ModifierResolver::resolve(effects, base);
    for (std::size_t i = 0; i < kSeatCount; ++i) {
        seats_[i].params = params[i];
        seats_[i].swingCap = params[i].rollCap;
    }
    paramsResolved_ = true;

    auto moved = transitionTo(RoundPhase::Swing);
    if (!moved) {
        return moved;
    }
    swingDeadline_ = now + timings_.swingPhase;
    return GameResult<void>::ok();
}

// ── Swing phase ─────────────────────────────────────────────────────────

GameResult<Tier> DuelRound::swing(Seat seat, RandomSource& source) {
    if (auto terminal = terminalError()) {
        return GameResult<Tier>::err(std::move(*terminal));
    }
    if (phase_ != RoundPhase::Swing) {
        return GameResult<Tier>::err(GameError(
            ErrorCode::WrongPhase, "cannot swing during " + std::string(phaseName(phase_))));
    }
    auto& state = seats_[seatIndex(seat)];
    if (state.submitted) {
        return GameResult<Tier>::err(
            GameError(ErrorCode::AlreadySubmitted, "already stopped this round"));
    }
    if (state.swingsUsed >= state.swingCap) {
        return GameResult<Tier>::err(GameError(
            ErrorCode::SwingCapReached,
            "swing cap of " + std::to_string(state.swingCap) + " reached"));
    }

    auto rolled = RollGenerator::roll(state.params, source);
    if (!rolled) {
        abort(rolled.error());
        return rolled;
    }

    ++state.swingsUsed;
    state.currentRoll = rolled.value();

    auto ctx = roundContext(matchId_, roundNo_, seat);
    ctx.extra["swing"] = std::to_string(state.swingsUsed);
    ctx.extra["tier"] = std::string(tierName(rolled.value()));
    DUEL_LOG_CTX(LogLevel::Debug, LogCategory::Combat, "swing rolled", ctx);
    return rolled;
}

GameResult<bool> DuelRound::stop(Seat seat) {
    if (auto terminal = terminalError()) {
        return GameResult<bool>::err(std::move(*terminal));
    }
    if (phase_ != RoundPhase::Swing) {
        return GameResult<bool>::err(GameError(
            ErrorCode::WrongPhase, "cannot stop during " + std::string(phaseName(phase_))));
    }
    const auto& state = seats_[seatIndex(seat)];
    if (state.submitted) {
        return GameResult<bool>::err(
            GameError(ErrorCode::AlreadySubmitted, "already stopped this round"));
    }
    if (state.swingsUsed == 0) {
        return GameResult<bool>::err(
            GameError(ErrorCode::NoSwingsTaken, "swing at least once before stopping"));
    }

    submit(seat, false);
    if (!(seats_[0].submitted && seats_[1].submitted)) {
        return GameResult<bool>::ok(false);
    }
    auto resolved = resolve();
    if (!resolved) {
        return GameResult<bool>::err(resolved.error());
    }
    return GameResult<bool>::ok(true);
}

void DuelRound::submit(Seat seat, bool forced) {
    auto& state = seats_[seatIndex(seat)];
    state.bestOutcome = state.currentRoll.value_or(Tier::Miss);
    state.submitted = true;
    state.forced = forced;
    DUEL_LOG_CTX(LogLevel::Debug, LogCategory::Round,
                 forced ? "seat force-submitted" : "seat stopped",
                 roundContext(matchId_, roundNo_, seat));
}

// ── Deadlines ───────────────────────────────────────────────────────────

GameResult<DeadlineEffect> DuelRound::fireDeadlines(TimePoint now) {
    DeadlineEffect effect;
    if (isTerminal()) {
        return GameResult<DeadlineEffect>::ok(effect);
    }

    if (phase_ == RoundPhase::StyleSelect && now >= styleDeadline_) {
        for (std::size_t i = 0; i < kSeatCount; ++i) {
            if (!seats_[i].styleLock) {
                seats_[i].styleLock = catalog_.defaultStyle();
                seats_[i].styleDefaulted = true;
            }
        }
        effect.stylesDefaulted = true;
        // The swing phase is timed from the scheduled deadline, not from a late tick.
        auto entered = enterSwing(styleDeadline_);
        if (!entered) {
            return GameResult<DeadlineEffect>::err(entered.error());
        }
    }

    if (phase_ == RoundPhase::Swing && swingDeadline_ && now >= *swingDeadline_) {
        for (std::size_t i = 0; i < kSeatCount; ++i) {
            if (!seats_[i].submitted) {
                submit(static_cast<Seat>(i), true);
            }
        }
        effect.swingsForced = true;
        auto resolved = resolve();
        if (!resolved) {
            return GameResult<DeadlineEffect>::err(resolved.error());
        }
    }
    return GameResult<DeadlineEffect>::ok(effect);
}

// ── Resolution ──────────────────────────────────────────────────────────

GameResult<void> DuelRound::resolve() {
    if (outcome_) {
        GameError error(ErrorCode::InvariantViolation, "round scored twice");
        abort(error);
        return GameResult<void>::err(std::move(error));
    }
    if (!(seats_[0].submitted && seats_[1].submitted)) {
        GameError error(ErrorCode::InvariantViolation, "scoring before both seats submitted");
        abort(error);
        return GameResult<void>::err(std::move(error));
    }

    ScoringInput input;
    for (std::size_t i = 0; i < kSeatCount; ++i) {
        input.bestOutcome[i] = *seats_[i].bestOutcome;
        input.params[i] = seats_[i].params;
        input.styles[i] = *seats_[i].styleLock;
    }

    auto moved = transitionTo(RoundPhase::Resolved);
    if (!moved) {
        return moved;
    }
    outcome_ = scorer_.score(input);
    return GameResult<void>::ok();
}

GameResult<void> DuelRound::transitionTo(RoundPhase next) {
    const auto current = static_cast<int>(phase_);
    const auto target = static_cast<int>(next);
    if (next != RoundPhase::Aborted && target != current + 1) {
        GameError error(ErrorCode::InvariantViolation,
                        "illegal phase transition " + std::string(phaseName(phase_)) +
                            " -> " + std::string(phaseName(next)));
        abort(error);
        return GameResult<void>::err(std::move(error));
    }
    phase_ = next;
    return GameResult<void>::ok();
}

void DuelRound::abort(GameError reason) {
    if (isTerminal()) {
        return;
    }
    LogContext ctx;
    ctx.matchId = matchId_;
    ctx.roundNo = roundNo_;
    DUEL_LOG_CTX(LogLevel::Error, LogCategory::Round,
                 "round aborted: " + std::string(reason.message()), ctx);
    abortReason_ = std::move(reason);
    phase_ = RoundPhase::Aborted;
}

// ── Invariants ──────────────────────────────────────────────────────────

GameResult<void> DuelRound::checkInvariants() const {
    auto violation = [](std::string what) {
        return GameResult<void>::err(GameError(ErrorCode::InvariantViolation, std::move(what)));
    };

    for (std::size_t i = 0; i < kSeatCount; ++i) {
        const auto& s = seats_[i];
        const std::string seat(seatName(static_cast<Seat>(i)));
        if (s.swingsUsed < 0 || s.swingsUsed > s.swingCap) {
            return violation("seat " + seat + " swings exceed cap");
        }
        if (s.currentRoll.has_value() != (s.swingsUsed >= 1)) {
            return violation("seat " + seat + " current roll out of sync with swings");
        }
        if (s.submitted != s.bestOutcome.has_value()) {
            return violation("seat " + seat + " submission without best outcome");
        }
        if (phase_ != RoundPhase::StyleSelect && phase_ != RoundPhase::Aborted &&
            !s.styleLock) {
            return violation("seat " + seat + " left style select without a style");
        }
    }
    if (outcome_.has_value() != (phase_ == RoundPhase::Resolved)) {
        return violation("outcome present outside resolved phase");
    }
    if (phase_ == RoundPhase::Resolved && !(seats_[0].submitted && seats_[1].submitted)) {
        return violation("resolved with an unsubmitted seat");
    }
    if (phase_ == RoundPhase::Swing && !swingDeadline_) {
        return violation("swing phase without a deadline");
    }
    return GameResult<void>::ok();
}

} // namespace duel::game
