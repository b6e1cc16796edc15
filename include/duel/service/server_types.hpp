#pragma once

/// @file server_types.hpp
/// @brief Configuration, responses and views of the duel service.

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "duel/foundation/game_error.hpp"
#include "duel/foundation/game_serializer.hpp"
#include "duel/foundation/types.hpp"
#include "duel/game/duel_types.hpp"
#include "duel/game/random_source.hpp"
#include "duel/game/round_scorer.hpp"

namespace duel::service {

using foundation::MatchId;
using foundation::PlayerId;

/// Lifecycle of a match.
enum class MatchStatus : uint8_t {
    Active,       ///< Rounds are being played.
    Complete,     ///< The control bar hit a bound or max rounds elapsed.
    Unresolvable  ///< A round was aborted by a fatal error.
};

constexpr std::string_view matchStatusName(MatchStatus status) {
    switch (status) {
        case MatchStatus::Active:       return "active";
        case MatchStatus::Complete:     return "complete";
        case MatchStatus::Unresolvable: return "unresolvable";
    }
    return "unknown";
}

/// Tug-of-war bar bounds. Seat A pushes toward kControlBarMin.
inline constexpr double kControlBarMin = 0.0;
inline constexpr double kControlBarMax = 100.0;

/// Per-match rules.
struct MatchRules {
    double controlBarStart = 50.0;
    /// Resolved rounds after which the match completes; 0 = unlimited.
    uint32_t maxRounds = 0;
    game::RoundTimings timings;
};

/// Duel service configuration.
struct DuelServerConfig {
    MatchRules rules;
    game::PushCurve pushCurve;

    /// Time source for every deadline.
    std::function<game::TimePoint()> clock = [] { return game::Clock::now(); };

    /// Invoked once per match to create its random source.
    game::RandomSourceFactory randomSourceFactory = game::defaultRandomSourceFactory();
};

/// Wire form of a round_resolved broadcast.
///
/// Tiers are encoded as integers (0 miss, 1 hit, 2 critical).
struct RoundResolvedPayload {
    uint64_t matchId = 0;
    uint32_t roundNo = 0;
    std::optional<uint64_t> winnerId;
    game::Tier tierA = game::Tier::Miss;
    game::Tier tierB = game::Tier::Miss;
    double push = 0.0;
    bool tieBreakUsed = false;
    std::string styleA;
    std::string styleB;
    double controlBar = 0.0;
    bool matchOver = false;
    std::optional<uint64_t> matchWinnerId;
};

/// A resolved round, computed once and shared by the broadcast and the
/// synchronous response of the call that resolved it.
struct ResolvedRound {
    MatchId matchId;
    uint32_t roundNo = 0;
    game::PerSeat<PlayerId> players{};
    game::RoundOutcome outcome;
    std::optional<PlayerId> winnerId;
    double controlBarAfter = 0.0;
    bool matchOver = false;
    std::optional<PlayerId> matchWinnerId;
    /// JSON encoding of RoundResolvedPayload.
    std::string payload;
};

/// The broadcast event; every consumer sees the same object.
using RoundResolvedEvent = std::shared_ptr<const ResolvedRound>;

struct LockStyleResponse {
    bool accepted = false;
    std::string lockedStyle;
    bool opponentLocked = false;
    game::RoundPhase phase = game::RoundPhase::StyleSelect;
};

struct SwingResponse {
    game::Tier outcome = game::Tier::Miss;
    int32_t swingsUsed = 0;
    int32_t swingsRemaining = 0;
    /// The roll that stop() would submit now: always the latest swing.
    game::Tier bestOutcomeSoFar = game::Tier::Miss;
};

struct StopResponse {
    game::Tier bestOutcome = game::Tier::Miss;
    bool roundResolved = false;
    /// Present only when this call resolved the round.
    RoundResolvedEvent outcome;
};

/// Public per-seat fields of a round.
struct SeatView {
    PlayerId playerId;
    bool styleLocked = false;
    bool styleDefaulted = false;
    /// Revealed once the round resolves.
    std::optional<std::string> style;
    int32_t swingsUsed = 0;
    int32_t swingCap = 1;
    bool submitted = false;
    bool forced = false;
};

struct RoundStateView {
    MatchId matchId;
    uint32_t roundNo = 0;
    game::RoundPhase phase = game::RoundPhase::StyleSelect;
    game::TimePoint styleDeadline;
    std::optional<game::TimePoint> swingDeadline;
    game::PerSeat<SeatView> seats{};
    /// Same object on every read once resolved.
    RoundResolvedEvent outcome;
    std::optional<foundation::GameError> abortReason;
};

struct MatchStateView {
    MatchId matchId;
    game::PerSeat<PlayerId> players{};
    MatchStatus status = MatchStatus::Active;
    double controlBar = 50.0;
    uint32_t currentRound = 0;
    uint32_t roundsResolved = 0;
    std::optional<PlayerId> winnerId;
    /// Set when the match ended because this participant forfeited.
    std::optional<PlayerId> forfeitedBy;
};

/// Outcome odds for one participant once styles are locked.
struct OddsView {
    std::string style;
    double missPct = 0.0;
    double hitPct = 0.0;
    double critPct = 0.0;
    int32_t swingCap = 1;
    int32_t swingsRemaining = 0;
};

struct DuelServerStats {
    uint64_t matchesCreated = 0;
    uint64_t matchesCompleted = 0;
    uint64_t matchesUnresolvable = 0;
    uint64_t roundsResolved = 0;
    uint64_t roundsAborted = 0;
    uint64_t actionsRejected = 0;
    uint64_t deadlinesFired = 0;
    std::size_t activeMatches = 0;
};

} // namespace duel::service

DUEL_SERIALIZABLE(duel::service::RoundResolvedPayload, 1,
    field("match_id", &duel::service::RoundResolvedPayload::matchId),
    field("round_no", &duel::service::RoundResolvedPayload::roundNo),
    field("winner_id", &duel::service::RoundResolvedPayload::winnerId),
    field("tier_a", &duel::service::RoundResolvedPayload::tierA),
    field("tier_b", &duel::service::RoundResolvedPayload::tierB),
    field("push", &duel::service::RoundResolvedPayload::push),
    field("tie_break_used", &duel::service::RoundResolvedPayload::tieBreakUsed),
    field("style_a", &duel::service::RoundResolvedPayload::styleA),
    field("style_b", &duel::service::RoundResolvedPayload::styleB),
    field("control_bar", &duel::service::RoundResolvedPayload::controlBar),
    field("match_over", &duel::service::RoundResolvedPayload::matchOver),
    field("match_winner_id", &duel::service::RoundResolvedPayload::matchWinnerId)
);
