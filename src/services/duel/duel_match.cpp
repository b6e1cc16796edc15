/// @file duel_match.cpp
/// @brief DuelMatch implementation: actions, control bar and completion.

#include "duel/service/duel_match.hpp"

#include <algorithm>

#include "duel/foundation/game_logger.hpp"
#include "duel/foundation/game_serializer.hpp"
#include "duel/game/roll_generator.hpp"

namespace duel::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using game::Seat;
using game::seatIndex;

namespace {

LogContext matchContext(MatchId id, uint32_t roundNo) {
    LogContext ctx;
    ctx.matchId = id;
    ctx.roundNo = roundNo;
    return ctx;
}

} // namespace

DuelMatch::DuelMatch(MatchId id, game::PerSeat<PlayerId> players,
                     game::PerSeat<game::BaseStats> stats, const game::StyleCatalog& catalog,
                     const game::RoundScorer& scorer, MatchRules rules,
                     std::unique_ptr<game::RandomSource> random, game::TimePoint now)
    : id_(id),
      players_(players),
      stats_(stats),
      catalog_(catalog),
      scorer_(scorer),
      rules_(rules),
      random_(std::move(random)),
      controlBar_(std::clamp(rules.controlBarStart, kControlBarMin, kControlBarMax)) {
    openRound(now);
}

// ── Lookup helpers ──────────────────────────────────────────────────────

GameResult<Seat> DuelMatch::seatOf(PlayerId player) const {
    for (std::size_t i = 0; i < game::kSeatCount; ++i) {
        if (players_[i] == player) {
            return GameResult<Seat>::ok(static_cast<Seat>(i));
        }
    }
    return GameResult<Seat>::err(GameError(
        ErrorCode::ParticipantNotFound,
        "player " + std::to_string(player.value()) + " is not in match " +
            std::to_string(id_.value())));
}

const game::DuelRound* DuelMatch::round(uint32_t roundNo) const {
    if (roundNo == 0 || roundNo > rounds_.size()) {
        return nullptr;
    }
    return &rounds_[roundNo - 1];
}

GameResult<game::DuelRound*> DuelMatch::activeRound(uint32_t roundNo) {
    if (roundNo == 0 || roundNo > rounds_.size()) {
        return GameResult<game::DuelRound*>::err(GameError(
            ErrorCode::RoundNotFound, "round " + std::to_string(roundNo) + " does not exist"));
    }
    auto* r = &rounds_[roundNo - 1];
    if (!r->isTerminal() && status_ != MatchStatus::Active) {
        return GameResult<game::DuelRound*>::err(GameError(
            ErrorCode::MatchNotActive,
            "match is " + std::string(matchStatusName(status_))));
    }
    return GameResult<game::DuelRound*>::ok(r);
}

// ── Participant actions ─────────────────────────────────────────────────

GameResult<LockStyleResponse> DuelMatch::lockStyle(uint32_t roundNo, PlayerId player,
                                                   std::string_view styleId,
                                                   game::TimePoint now) {
    auto seat = seatOf(player);
    if (!seat) {
        return GameResult<LockStyleResponse>::err(seat.error());
    }
    auto found = activeRound(roundNo);
    if (!found) {
        return GameResult<LockStyleResponse>::err(found.error());
    }
    auto& r = *found.value();

    auto phase = r.lockStyle(seat.value(), styleId, now);
    if (!phase) {
        handleRoundError(r, phase.error());
        return GameResult<LockStyleResponse>::err(phase.error());
    }

    LockStyleResponse response;
    response.accepted = true;
    response.lockedStyle = *r.seat(seat.value()).styleLock;
    response.opponentLocked = r.seat(game::opponentOf(seat.value())).styleLock.has_value();
    response.phase = phase.value();
    return GameResult<LockStyleResponse>::ok(std::move(response));
}

GameResult<SwingResponse> DuelMatch::swing(uint32_t roundNo, PlayerId player) {
    auto seat = seatOf(player);
    if (!seat) {
        return GameResult<SwingResponse>::err(seat.error());
    }
    auto found = activeRound(roundNo);
    if (!found) {
        return GameResult<SwingResponse>::err(found.error());
    }
    auto& r = *found.value();

    auto tier = r.swing(seat.value(), *random_);
    if (!tier) {
        handleRoundError(r, tier.error());
        return GameResult<SwingResponse>::err(tier.error());
    }

    const auto& state = r.seat(seat.value());
    SwingResponse response;
    response.outcome = tier.value();
    response.swingsUsed = state.swingsUsed;
    response.swingsRemaining = state.swingCap - state.swingsUsed;
    response.bestOutcomeSoFar = *state.currentRoll;
    return GameResult<SwingResponse>::ok(response);
}

GameResult<StopResponse> DuelMatch::stop(uint32_t roundNo, PlayerId player,
                                         game::TimePoint now) {
    auto seat = seatOf(player);
    if (!seat) {
        return GameResult<StopResponse>::err(seat.error());
    }
    auto found = activeRound(roundNo);
    if (!found) {
        return GameResult<StopResponse>::err(found.error());
    }
    auto& r = *found.value();

    auto resolved = r.stop(seat.value());
    if (!resolved) {
        handleRoundError(r, resolved.error());
        return GameResult<StopResponse>::err(resolved.error());
    }

    StopResponse response;
    response.bestOutcome = *r.seat(seat.value()).bestOutcome;
    response.roundResolved = resolved.value();
    if (resolved.value()) {
        onRoundResolved(r, now);
        response.outcome = resolved_[roundNo - 1];
    }
    return GameResult<StopResponse>::ok(std::move(response));
}

GameResult<MatchStateView> DuelMatch::forfeit(PlayerId player) {
    auto seat = seatOf(player);
    if (!seat) {
        return GameResult<MatchStateView>::err(seat.error());
    }
    if (status_ != MatchStatus::Active) {
        return GameResult<MatchStateView>::err(GameError(
            ErrorCode::MatchNotActive,
            "cannot forfeit a match that is " + std::string(matchStatusName(status_))));
    }

    auto ctx = matchContext(id_, currentRoundNo());
    ctx.playerId = player;
    DUEL_LOG_CTX(LogLevel::Info, LogCategory::Match, "participant forfeited", ctx);

    forfeitedBy_ = seat.value();
    complete(game::opponentOf(seat.value()));
    auto view = state();
    outbox_.emplace_back(MatchCompletedNotice{view});
    return GameResult<MatchStateView>::ok(std::move(view));
}

// ── Deadlines ───────────────────────────────────────────────────────────

bool DuelMatch::fireDeadlines(game::TimePoint now) {
    if (status_ != MatchStatus::Active || rounds_.empty()) {
        return false;
    }
    auto& r = rounds_.back();
    auto effect = r.fireDeadlines(now);
    if (!effect) {
        handleRoundError(r, effect.error());
        return true;
    }
    if (effect.value().stylesDefaulted) {
        DUEL_LOG_CTX(LogLevel::Debug, LogCategory::Round, "style deadline fired",
                     matchContext(id_, r.roundNo()));
    }
    if (effect.value().resolved()) {
        DUEL_LOG_CTX(LogLevel::Debug, LogCategory::Round, "swing deadline fired",
                     matchContext(id_, r.roundNo()));
        onRoundResolved(r, now);
    }
    return effect.value().any();
}

// ── Transitions ─────────────────────────────────────────────────────────

void DuelMatch::handleRoundError(const game::DuelRound& r, const GameError& error) {
    if (!error.isFatal() || r.phase() != game::RoundPhase::Aborted ||
        status_ != MatchStatus::Active) {
        return;
    }
    status_ = MatchStatus::Unresolvable;
    DUEL_LOG_CTX(LogLevel::Error, LogCategory::Match,
                 "match unresolvable: " + std::string(error.message()),
                 matchContext(id_, r.roundNo()));
    outbox_.emplace_back(RoundAbortedNotice{id_, r.roundNo(), error});
}

void DuelMatch::onRoundResolved(game::DuelRound& r, game::TimePoint now) {
    const auto& outcome = *r.outcome();
    ++roundsResolved_;

    if (outcome.winner) {
        // Seat A pulls the bar toward 0, seat B toward 100.
        const double delta = *outcome.winner == Seat::A ? -outcome.push : outcome.push;
        controlBar_ = std::clamp(controlBar_ + delta, kControlBarMin, kControlBarMax);
    }

    bool finished = false;
    if (controlBar_ <= kControlBarMin) {
        complete(Seat::A);
        finished = true;
    } else if (controlBar_ >= kControlBarMax) {
        complete(Seat::B);
        finished = true;
    } else if (rules_.maxRounds > 0 && roundsResolved_ >= rules_.maxRounds) {
        std::optional<Seat> leader;
        if (controlBar_ < rules_.controlBarStart) {
            leader = Seat::A;
        } else if (controlBar_ > rules_.controlBarStart) {
            leader = Seat::B;
        }
        complete(leader);
        finished = true;
    }

    auto resolved = std::make_shared<ResolvedRound>();
    resolved->matchId = id_;
    resolved->roundNo = r.roundNo();
    resolved->players = players_;
    resolved->outcome = outcome;
    if (outcome.winner) {
        resolved->winnerId = players_[seatIndex(*outcome.winner)];
    }
    resolved->controlBarAfter = controlBar_;
    resolved->matchOver = finished;
    if (winner_) {
        resolved->matchWinnerId = players_[seatIndex(*winner_)];
    }

    RoundResolvedPayload payload;
    payload.matchId = id_.value();
    payload.roundNo = r.roundNo();
    if (resolved->winnerId) {
        payload.winnerId = resolved->winnerId->value();
    }
    payload.tierA = outcome.tiers[seatIndex(Seat::A)];
    payload.tierB = outcome.tiers[seatIndex(Seat::B)];
    payload.push = outcome.push;
    payload.tieBreakUsed = outcome.tieBreakUsed;
    payload.styleA = outcome.styles[seatIndex(Seat::A)];
    payload.styleB = outcome.styles[seatIndex(Seat::B)];
    payload.controlBar = controlBar_;
    payload.matchOver = finished;
    if (resolved->matchWinnerId) {
        payload.matchWinnerId = resolved->matchWinnerId->value();
    }
    resolved->payload = foundation::GameSerializer::instance().serializeJson(payload);

    auto ctx = matchContext(id_, r.roundNo());
    ctx.extra["winner"] = outcome.winner ? std::string(game::seatName(*outcome.winner)) : "draw";
    ctx.extra["push"] = std::to_string(outcome.push);
    ctx.extra["bar"] = std::to_string(controlBar_);
    DUEL_LOG_CTX(LogLevel::Info, LogCategory::Match, "round resolved", ctx);

    RoundResolvedEvent event = std::move(resolved);
    resolved_[r.roundNo() - 1] = event;
    outbox_.emplace_back(RoundResolvedNotice{std::move(event)});

    if (finished) {
        outbox_.emplace_back(MatchCompletedNotice{state()});
    } else {
        openRound(now);
    }
}

void DuelMatch::complete(std::optional<Seat> winner) {
    status_ = MatchStatus::Complete;
    winner_ = winner;
    auto ctx = matchContext(id_, currentRoundNo());
    ctx.extra["winner"] = winner ? std::string(game::seatName(*winner)) : "none";
    DUEL_LOG_CTX(LogLevel::Info, LogCategory::Match, "match complete", ctx);
}

void DuelMatch::openRound(game::TimePoint now) {
    const auto roundNo = static_cast<uint32_t>(rounds_.size() + 1);
    rounds_.emplace_back(id_, roundNo, stats_, catalog_, scorer_, rules_.timings, now);
    resolved_.emplace_back();
    DUEL_LOG_CTX(LogLevel::Debug, LogCategory::Round, "round opened",
                 matchContext(id_, roundNo));
}

// ── Views ───────────────────────────────────────────────────────────────

GameResult<RoundStateView> DuelMatch::roundState(uint32_t roundNo) const {
    const auto* r = round(roundNo);
    if (r == nullptr) {
        return GameResult<RoundStateView>::err(GameError(
            ErrorCode::RoundNotFound, "round " + std::to_string(roundNo) + " does not exist"));
    }

    RoundStateView view;
    view.matchId = id_;
    view.roundNo = roundNo;
    view.phase = r->phase();
    view.styleDeadline = r->styleDeadline();
    view.swingDeadline = r->swingDeadline();
    const bool reveal = r->phase() == game::RoundPhase::Resolved;
    for (std::size_t i = 0; i < game::kSeatCount; ++i) {
        const auto& s = r->seat(static_cast<Seat>(i));
        auto& seat = view.seats[i];
        seat.playerId = players_[i];
        seat.styleLocked = s.styleLock.has_value();
        seat.styleDefaulted = s.styleDefaulted;
        if (reveal) {
            seat.style = s.styleLock;
        }
        seat.swingsUsed = s.swingsUsed;
        seat.swingCap = s.swingCap;
        seat.submitted = s.submitted;
        seat.forced = s.forced;
    }
    view.outcome = resolved_[roundNo - 1];
    view.abortReason = r->abortReason();
    return GameResult<RoundStateView>::ok(std::move(view));
}

MatchStateView DuelMatch::state() const {
    MatchStateView view;
    view.matchId = id_;
    view.players = players_;
    view.status = status_;
    view.controlBar = controlBar_;
    view.currentRound = currentRoundNo();
    view.roundsResolved = roundsResolved_;
    if (winner_) {
        view.winnerId = players_[seatIndex(*winner_)];
    }
    if (forfeitedBy_) {
        view.forfeitedBy = players_[seatIndex(*forfeitedBy_)];
    }
    return view;
}

GameResult<OddsView> DuelMatch::odds(uint32_t roundNo, PlayerId player) const {
    auto seat = seatOf(player);
    if (!seat) {
        return GameResult<OddsView>::err(seat.error());
    }
    const auto* r = round(roundNo);
    if (r == nullptr) {
        return GameResult<OddsView>::err(GameError(
            ErrorCode::RoundNotFound, "round " + std::to_string(roundNo) + " does not exist"));
    }
    if (!r->paramsResolved()) {
        return GameResult<OddsView>::err(
            GameError(ErrorCode::WrongPhase, "odds are known once both styles are locked"));
    }

    const auto& s = r->seat(seat.value());
    auto probabilities = game::RollGenerator::tierProbabilities(s.params);

    OddsView view;
    view.style = *s.styleLock;
    view.missPct = probabilities[static_cast<std::size_t>(game::Tier::Miss)] * 100.0;
    view.hitPct = probabilities[static_cast<std::size_t>(game::Tier::Hit)] * 100.0;
    view.critPct = probabilities[static_cast<std::size_t>(game::Tier::Critical)] * 100.0;
    view.swingCap = s.swingCap;
    view.swingsRemaining = s.submitted ? 0 : s.swingCap - s.swingsUsed;
    return GameResult<OddsView>::ok(std::move(view));
}

std::vector<MatchEvent> DuelMatch::takeEvents() {
    std::vector<MatchEvent> events;
    events.swap(outbox_);
    return events;
}

} // namespace duel::service
