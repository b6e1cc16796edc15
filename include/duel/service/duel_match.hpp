#pragma once

/// @file duel_match.hpp
/// @brief DuelMatch: round arena and control bar for one pair of participants.
///
/// DuelMatch is single-threaded. DuelServer serializes every call for a
/// match under that match's mutex and drains the match's outbox after each
/// call, publishing the events once the mutex is released.

#include <deque>
#include <memory>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include "duel/foundation/game_result.hpp"
#include "duel/game/duel_round.hpp"
#include "duel/game/random_source.hpp"
#include "duel/game/round_scorer.hpp"
#include "duel/game/style_catalog.hpp"
#include "duel/service/server_types.hpp"

namespace duel::service {

/// A round resolved; broadcast it and hand it to persistence.
struct RoundResolvedNotice {
    RoundResolvedEvent round;
};

/// A round was aborted by a fatal error; the match is unresolvable.
struct RoundAbortedNotice {
    MatchId matchId;
    uint32_t roundNo = 0;
    foundation::GameError reason;
};

/// The match completed.
struct MatchCompletedNotice {
    MatchStateView state;
};

using MatchEvent = std::variant<RoundResolvedNotice, RoundAbortedNotice, MatchCompletedNotice>;

/// One match: seats, rounds indexed by round number, control bar.
class DuelMatch {
public:
    DuelMatch(MatchId id, game::PerSeat<PlayerId> players,
              game::PerSeat<game::BaseStats> stats, const game::StyleCatalog& catalog,
              const game::RoundScorer& scorer, MatchRules rules,
              std::unique_ptr<game::RandomSource> random, game::TimePoint now);

    DuelMatch(const DuelMatch&) = delete;
    DuelMatch& operator=(const DuelMatch&) = delete;

    foundation::GameResult<LockStyleResponse> lockStyle(uint32_t roundNo, PlayerId player,
                                                        std::string_view styleId,
                                                        game::TimePoint now);

    foundation::GameResult<SwingResponse> swing(uint32_t roundNo, PlayerId player);

    foundation::GameResult<StopResponse> stop(uint32_t roundNo, PlayerId player,
                                              game::TimePoint now);

    /// Concede an active match; the opponent becomes the winner. The open
    /// round is left unscored and nothing is broadcast for it.
    foundation::GameResult<MatchStateView> forfeit(PlayerId player);

    /// Deadline message for the current round.
    /// @return True when a deadline fired.
    bool fireDeadlines(game::TimePoint now);

    [[nodiscard]] foundation::GameResult<RoundStateView> roundState(uint32_t roundNo) const;

    [[nodiscard]] MatchStateView state() const;

    [[nodiscard]] foundation::GameResult<OddsView> odds(uint32_t roundNo, PlayerId player) const;

    /// Events produced since the last call, in order.
    [[nodiscard]] std::vector<MatchEvent> takeEvents();

    [[nodiscard]] foundation::GameResult<game::Seat> seatOf(PlayerId player) const;

    [[nodiscard]] MatchId id() const noexcept { return id_; }
    [[nodiscard]] MatchStatus status() const noexcept { return status_; }
    [[nodiscard]] double controlBar() const noexcept { return controlBar_; }
    [[nodiscard]] uint32_t currentRoundNo() const noexcept {
        return static_cast<uint32_t>(rounds_.size());
    }
    [[nodiscard]] const game::DuelRound* round(uint32_t roundNo) const;

private:
    foundation::GameResult<game::DuelRound*> activeRound(uint32_t roundNo);

    /// Route a round error: fatal ones abort the match.
    void handleRoundError(const game::DuelRound& round, const foundation::GameError& error);

    /// Apply a freshly resolved round to the bar and open the next one.
    void onRoundResolved(game::DuelRound& round, game::TimePoint now);

    void complete(std::optional<game::Seat> winner);
    void openRound(game::TimePoint now);

    MatchId id_;
    game::PerSeat<PlayerId> players_;
    game::PerSeat<game::BaseStats> stats_;
    const game::StyleCatalog& catalog_;
    const game::RoundScorer& scorer_;
    MatchRules rules_;
    std::unique_ptr<game::RandomSource> random_;

    /// Indexed by round number - 1; a deque keeps references stable.
    std::deque<game::DuelRound> rounds_;
    /// Parallel to rounds_; set once a round resolves.
    std::vector<RoundResolvedEvent> resolved_;

    MatchStatus status_ = MatchStatus::Active;
    double controlBar_;
    uint32_t roundsResolved_ = 0;
    std::optional<game::Seat> winner_;
    std::optional<game::Seat> forfeitedBy_;

    std::vector<MatchEvent> outbox_;
};

} // namespace duel::service
