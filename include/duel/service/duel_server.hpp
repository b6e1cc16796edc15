#pragma once

/// @file duel_server.hpp
/// @brief DuelServer: participant-facing entry point of the duel engine.
///
/// DuelServer owns every live match. Each match is a single-writer slot:
/// actions and deadline messages for one match run under that match's
/// mutex, in arrival order, while different matches proceed in parallel.
/// Round broadcasts are published after the mutex is released by the call
/// that resolved the round, exactly once.

#include <cstddef>
#include <memory>
#include <string_view>

#include "duel/foundation/game_result.hpp"
#include "duel/foundation/signal.hpp"
#include "duel/game/style_catalog.hpp"
#include "duel/service/notification_dispatcher.hpp"
#include "duel/service/server_types.hpp"
#include "duel/service/stat_provider.hpp"

namespace duel::service {

/// Duel engine service.
///
/// Usage:
/// @code
///   DuelServer server(config, StyleCatalog::canonical(),
///                     std::make_shared<StaticStatProvider>());
///   server.start();
///
///   auto match = server.createMatch(PlayerId(1), PlayerId(2)).value();
///   server.subscribe(match, PlayerId(1), onResolved);
///   server.lockStyle(match, 1, PlayerId(1), "aggressive");
///   server.lockStyle(match, 1, PlayerId(2), "guard");
///   server.swing(match, 1, PlayerId(1));
///   server.stop(match, 1, PlayerId(1));
///
///   // Periodically, or from a DeadlineTicker:
///   server.processDeadlines();
/// @endcode
class DuelServer {
public:
    DuelServer(DuelServerConfig config, game::StyleCatalog catalog,
               std::shared_ptr<const StatProvider> stats);
    ~DuelServer();

    DuelServer(const DuelServer&) = delete;
    DuelServer& operator=(const DuelServer&) = delete;
    DuelServer(DuelServer&&) = delete;
    DuelServer& operator=(DuelServer&&) = delete;

    // -- Lifecycle ------------------------------------------------------------

    [[nodiscard]] foundation::GameResult<void> start();

    /// Stop accepting actions. Live matches are kept for inspection.
    void stop();

    [[nodiscard]] bool isRunning() const noexcept;

    // -- Matches --------------------------------------------------------------

    /// Create a match; @p challenger takes seat A, @p opponent seat B.
    /// Round 1 opens immediately in style selection.
    [[nodiscard]] foundation::GameResult<MatchId> createMatch(PlayerId challenger,
                                                              PlayerId opponent);

    /// Release a completed or unresolvable match.
    [[nodiscard]] foundation::GameResult<void> closeMatch(MatchId matchId);

    // -- Participant actions --------------------------------------------------

    [[nodiscard]] foundation::GameResult<LockStyleResponse> lockStyle(
        MatchId matchId, uint32_t roundNo, PlayerId player, std::string_view styleId);

    [[nodiscard]] foundation::GameResult<SwingResponse> swing(
        MatchId matchId, uint32_t roundNo, PlayerId player);

    /// Submit the caller's current roll. When this call resolves the round,
    /// the response carries the same ResolvedRound the broadcast delivers.
    [[nodiscard]] foundation::GameResult<StopResponse> stop(
        MatchId matchId, uint32_t roundNo, PlayerId player);

    /// Concede the match. The opponent wins, the open round is dropped
    /// without a broadcast and onMatchCompleted fires.
    [[nodiscard]] foundation::GameResult<MatchStateView> forfeit(MatchId matchId,
                                                               PlayerId player);

    // -- Reads (side-effect free) ---------------------------------------------

    [[nodiscard]] foundation::GameResult<RoundStateView> getRoundState(
        MatchId matchId, uint32_t roundNo) const;

    [[nodiscard]] foundation::GameResult<MatchStateView> getMatchState(MatchId matchId) const;

    [[nodiscard]] foundation::GameResult<OddsView> oddsFor(
        MatchId matchId, uint32_t roundNo, PlayerId player) const;

    // -- Deadlines ------------------------------------------------------------

    /// Deliver due deadline messages to every match.
    /// @return Number of matches in which a deadline fired.
    std::size_t processDeadlines();

    // -- Notifications --------------------------------------------------------

    /// Attach the participant's round stream for @p matchId.
    [[nodiscard]] foundation::GameResult<SubscriptionId> subscribe(
        MatchId matchId, PlayerId player, RoundResolvedHandler handler);

    bool unsubscribe(SubscriptionId id);

    /// Route broadcast delivery, e.g. onto a GameJobScheduler.
    void setDeliveryExecutor(DeliveryExecutor executor);

    // -- Hooks ----------------------------------------------------------------

    /// Fired once per resolved round (persistence, statistics).
    foundation::Signal<const ResolvedRound&> onRoundResolved;

    /// Fired once when a fatal error aborts a round.
    foundation::Signal<MatchId, uint32_t, const foundation::GameError&> onRoundAborted;

    /// Fired once when a match completes.
    foundation::Signal<const MatchStateView&> onMatchCompleted;

    // -- Introspection --------------------------------------------------------

    [[nodiscard]] DuelServerStats stats() const;

    [[nodiscard]] const game::StyleCatalog& catalog() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace duel::service
