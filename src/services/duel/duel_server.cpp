/// @file duel_server.cpp
/// @brief DuelServer implementation: match slots, action routing, publishing.

#include "duel/service/duel_server.hpp"

#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "duel/foundation/game_logger.hpp"
#include "duel/service/duel_match.hpp"

namespace duel::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

// -- Impl ---------------------------------------------------------------------

struct DuelServer::Impl {
    /// One match and the mutex that makes it single-writer.
    struct MatchSlot {
        template <typename... Args>
        explicit MatchSlot(Args&&... args) : match(std::forward<Args>(args)...) {}

        std::mutex mutex;
        DuelMatch match;
    };

    DuelServerConfig config;
    game::StyleCatalog catalog;
    game::RoundScorer scorer;
    std::shared_ptr<const StatProvider> statProvider;
    NotificationDispatcher dispatcher;

    std::atomic<bool> running{false};
    std::atomic<uint64_t> nextMatchId{1};

    mutable std::shared_mutex slotsMutex;
    std::unordered_map<MatchId, std::shared_ptr<MatchSlot>> slots;

    std::atomic<uint64_t> matchesCreated{0};
    std::atomic<uint64_t> matchesCompleted{0};
    std::atomic<uint64_t> matchesUnresolvable{0};
    std::atomic<uint64_t> roundsResolved{0};
    std::atomic<uint64_t> roundsAborted{0};
    std::atomic<uint64_t> actionsRejected{0};
    std::atomic<uint64_t> deadlinesFired{0};

    Impl(DuelServerConfig cfg, game::StyleCatalog cat, std::shared_ptr<const StatProvider> stats)
        : config(std::move(cfg)),
          catalog(std::move(cat)),
          scorer(config.pushCurve),
          statProvider(std::move(stats)) {
        if (!config.clock) {
            config.clock = [] { return game::Clock::now(); };
        }
        if (!config.randomSourceFactory) {
            config.randomSourceFactory = game::defaultRandomSourceFactory();
        }
    }

    game::TimePoint now() const { return config.clock(); }

    std::shared_ptr<MatchSlot> findSlot(MatchId id) const {
        std::shared_lock lock(slotsMutex);
        auto it = slots.find(id);
        return it == slots.end() ? nullptr : it->second;
    }

    template <typename T>
    GameResult<T> reject(GameError error) {
        actionsRejected.fetch_add(1, std::memory_order_relaxed);
        return GameResult<T>::err(std::move(error));
    }

    /// Run @p fn against one match under its mutex, then publish the
    /// events it produced after the mutex is released.
    ///
    /// Deadlines already due are applied first, so an action arriving after
    /// a deadline sees the phase that deadline produced.
    template <typename T, typename Fn>
    GameResult<T> act(DuelServer& server, MatchId matchId, Fn&& fn) {
        if (!running.load()) {
            return reject<T>(GameError(ErrorCode::ServerNotRunning, "duel server is not running"));
        }
        auto slot = findSlot(matchId);
        if (!slot) {
            return reject<T>(GameError(
                ErrorCode::MatchNotFound,
                "match " + std::to_string(matchId.value()) + " not found"));
        }

        std::vector<MatchEvent> events;
        auto result = [&] {
            std::lock_guard lock(slot->mutex);
            const auto at = now();
            if (slot->match.fireDeadlines(at)) {
                deadlinesFired.fetch_add(1, std::memory_order_relaxed);
            }
            auto r = fn(slot->match, at);
            events = slot->match.takeEvents();
            return r;
        }();

        if (!result) {
            actionsRejected.fetch_add(1, std::memory_order_relaxed);
        }
        publish(server, events);
        return result;
    }

    void publish(DuelServer& server, const std::vector<MatchEvent>& events) {
        for (const auto& event : events) {
            if (const auto* resolved = std::get_if<RoundResolvedNotice>(&event)) {
                roundsResolved.fetch_add(1, std::memory_order_relaxed);
                auto delivery = dispatcher.broadcast(resolved->round);
                if (!delivery) {
                    DUEL_LOG_ERROR(LogCategory::Notify,
                                   "broadcast rejected: " +
                                       std::string(delivery.error().message()));
                }
                server.onRoundResolved.emit(*resolved->round);
            } else if (const auto* aborted = std::get_if<RoundAbortedNotice>(&event)) {
                roundsAborted.fetch_add(1, std::memory_order_relaxed);
                matchesUnresolvable.fetch_add(1, std::memory_order_relaxed);
                server.onRoundAborted.emit(aborted->matchId, aborted->roundNo, aborted->reason);
            } else if (const auto* completed = std::get_if<MatchCompletedNotice>(&event)) {
                matchesCompleted.fetch_add(1, std::memory_order_relaxed);
                server.onMatchCompleted.emit(completed->state);
            }
        }
    }
};

// -- Construction / destruction -----------------------------------------------

DuelServer::DuelServer(DuelServerConfig config, game::StyleCatalog catalog,
                       std::shared_ptr<const StatProvider> stats)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(catalog), std::move(stats))) {}

DuelServer::~DuelServer() {
    if (impl_ && impl_->running.load()) {
        stop();
    }
}

// -- Lifecycle ----------------------------------------------------------------

GameResult<void> DuelServer::start() {
    if (!impl_->statProvider) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "duel server needs a stat provider"));
    }
    bool expected = false;
    if (!impl_->running.compare_exchange_strong(expected, true)) {
        return GameResult<void>::err(
            GameError(ErrorCode::ServerAlreadyStarted, "duel server is already running"));
    }
    DUEL_LOG_INFO(LogCategory::Core,
                  "duel server started with " + std::to_string(impl_->catalog.size()) +
                      " styles");
    return GameResult<void>::ok();
}

void DuelServer::stop() {
    if (impl_->running.exchange(false)) {
        DUEL_LOG_INFO(LogCategory::Core, "duel server stopped");
    }
}

bool DuelServer::isRunning() const noexcept {
    return impl_->running.load();
}

// -- Matches ------------------------------------------------------------------

GameResult<MatchId> DuelServer::createMatch(PlayerId challenger, PlayerId opponent) {
    if (!impl_->running.load()) {
        return impl_->reject<MatchId>(
            GameError(ErrorCode::ServerNotRunning, "duel server is not running"));
    }
    if (!challenger.isValid() || !opponent.isValid() || challenger == opponent) {
        return impl_->reject<MatchId>(GameError(
            ErrorCode::InvalidArgument, "a match needs two distinct, valid participants"));
    }

    game::PerSeat<game::BaseStats> stats;
    game::PerSeat<PlayerId> players{challenger, opponent};
    for (std::size_t i = 0; i < game::kSeatCount; ++i) {
        auto looked = impl_->statProvider->lookup(players[i]);
        if (!looked) {
            return impl_->reject<MatchId>(looked.error());
        }
        stats[i] = looked.value();
    }

    auto random = impl_->config.randomSourceFactory();
    if (!random) {
        return impl_->reject<MatchId>(
            GameError(ErrorCode::RandomSourceFailure, "random source factory returned null"));
    }

    MatchId id(impl_->nextMatchId.fetch_add(1, std::memory_order_relaxed));
    auto slot = std::make_shared<Impl::MatchSlot>(
        id, players, stats, impl_->catalog, impl_->scorer, impl_->config.rules,
        std::move(random), impl_->now());
    {
        std::unique_lock lock(impl_->slotsMutex);
        impl_->slots.emplace(id, std::move(slot));
    }
    impl_->matchesCreated.fetch_add(1, std::memory_order_relaxed);

    LogContext ctx;
    ctx.matchId = id;
    ctx.extra["challenger"] = std::to_string(challenger.value());
    ctx.extra["opponent"] = std::to_string(opponent.value());
    DUEL_LOG_CTX(LogLevel::Info, LogCategory::Match, "match created", ctx);
    return GameResult<MatchId>::ok(id);
}

GameResult<void> DuelServer::closeMatch(MatchId matchId) {
    auto slot = impl_->findSlot(matchId);
    if (!slot) {
        return GameResult<void>::err(GameError(
            ErrorCode::MatchNotFound, "match " + std::to_string(matchId.value()) + " not found"));
    }
    {
        std::lock_guard lock(slot->mutex);
        if (slot->match.status() == MatchStatus::Active) {
            return GameResult<void>::err(
                GameError(ErrorCode::MatchNotActive, "cannot close an active match"));
        }
    }
    {
        std::unique_lock lock(impl_->slotsMutex);
        impl_->slots.erase(matchId);
    }
    impl_->dispatcher.forgetMatch(matchId);

    LogContext ctx;
    ctx.matchId = matchId;
    DUEL_LOG_CTX(LogLevel::Info, LogCategory::Match, "match closed", ctx);
    return GameResult<void>::ok();
}

// -- Participant actions ------------------------------------------------------

GameResult<LockStyleResponse> DuelServer::lockStyle(MatchId matchId, uint32_t roundNo,
                                                    PlayerId player, std::string_view styleId) {
    return impl_->act<LockStyleResponse>(*this, matchId, [&](DuelMatch& match, game::TimePoint now) {
        return match.lockStyle(roundNo, player, styleId, now);
    });
}

GameResult<SwingResponse> DuelServer::swing(MatchId matchId, uint32_t roundNo,
                                            PlayerId player) {
    return impl_->act<SwingResponse>(*this, matchId, [&](DuelMatch& match, game::TimePoint) {
        return match.swing(roundNo, player);
    });
}

GameResult<StopResponse> DuelServer::stop(MatchId matchId, uint32_t roundNo, PlayerId player) {
    return impl_->act<StopResponse>(*this, matchId, [&](DuelMatch& match, game::TimePoint now) {
        return match.stop(roundNo, player, now);
    });
}

GameResult<MatchStateView> DuelServer::forfeit(MatchId matchId, PlayerId player) {
    return impl_->act<MatchStateView>(*this, matchId, [&](DuelMatch& match, game::TimePoint) {
        return match.forfeit(player);
    });
}

// -- Reads --------------------------------------------------------------------

GameResult<RoundStateView> DuelServer::getRoundState(MatchId matchId, uint32_t roundNo) const {
    auto slot = impl_->findSlot(matchId);
    if (!slot) {
        return GameResult<RoundStateView>::err(GameError(
            ErrorCode::MatchNotFound, "match " + std::to_string(matchId.value()) + " not found"));
    }
    std::lock_guard lock(slot->mutex);
    return slot->match.roundState(roundNo);
}

GameResult<MatchStateView> DuelServer::getMatchState(MatchId matchId) const {
    auto slot = impl_->findSlot(matchId);
    if (!slot) {
        return GameResult<MatchStateView>::err(GameError(
            ErrorCode::MatchNotFound, "match " + std::to_string(matchId.value()) + " not found"));
    }
    std::lock_guard lock(slot->mutex);
    return GameResult<MatchStateView>::ok(slot->match.state());
}

GameResult<OddsView> DuelServer::oddsFor(MatchId matchId, uint32_t roundNo,
                                         PlayerId player) const {
    auto slot = impl_->findSlot(matchId);
    if (!slot) {
        return GameResult<OddsView>::err(GameError(
            ErrorCode::MatchNotFound, "match " + std::to_string(matchId.value()) + " not found"));
    }
    std::lock_guard lock(slot->mutex);
    return slot->match.odds(roundNo, player);
}

// -- Deadlines ----------------------------------------------------------------

std::size_t DuelServer::processDeadlines() {
    if (!impl_->running.load()) {
        return 0;
    }

    std::vector<std::shared_ptr<Impl::MatchSlot>> snapshot;
    {
        std::shared_lock lock(impl_->slotsMutex);
        snapshot.reserve(impl_->slots.size());
        for (const auto& [id, slot] : impl_->slots) {
            snapshot.push_back(slot);
        }
    }

    std::size_t fired = 0;
    for (const auto& slot : snapshot) {
        std::vector<MatchEvent> events;
        {
            std::lock_guard lock(slot->mutex);
            // Read the clock under the lock so actions applied first stay first.
            if (slot->match.fireDeadlines(impl_->now())) {
                ++fired;
            }
            events = slot->match.takeEvents();
        }
        impl_->publish(*this, events);
    }

    if (fired > 0) {
        impl_->deadlinesFired.fetch_add(fired, std::memory_order_relaxed);
    }
    return fired;
}

// -- Notifications ------------------------------------------------------------

GameResult<SubscriptionId> DuelServer::subscribe(MatchId matchId, PlayerId player,
                                                 RoundResolvedHandler handler) {
    auto slot = impl_->findSlot(matchId);
    if (!slot) {
        return GameResult<SubscriptionId>::err(GameError(
            ErrorCode::MatchNotFound, "match " + std::to_string(matchId.value()) + " not found"));
    }
    {
        std::lock_guard lock(slot->mutex);
        auto seat = slot->match.seatOf(player);
        if (!seat) {
            return GameResult<SubscriptionId>::err(seat.error());
        }
    }
    return GameResult<SubscriptionId>::ok(
        impl_->dispatcher.subscribe(matchId, player, std::move(handler)));
}

bool DuelServer::unsubscribe(SubscriptionId id) {
    return impl_->dispatcher.unsubscribe(id);
}

void DuelServer::setDeliveryExecutor(DeliveryExecutor executor) {
    impl_->dispatcher.setExecutor(std::move(executor));
}

// -- Introspection ------------------------------------------------------------

DuelServerStats DuelServer::stats() const {
    DuelServerStats s;
    s.matchesCreated = impl_->matchesCreated.load();
    s.matchesCompleted = impl_->matchesCompleted.load();
    s.matchesUnresolvable = impl_->matchesUnresolvable.load();
    s.roundsResolved = impl_->roundsResolved.load();
    s.roundsAborted = impl_->roundsAborted.load();
    s.actionsRejected = impl_->actionsRejected.load();
    s.deadlinesFired = impl_->deadlinesFired.load();
    {
        std::shared_lock lock(impl_->slotsMutex);
        s.activeMatches = impl_->slots.size();
    }
    return s;
}

const game::StyleCatalog& DuelServer::catalog() const noexcept {
    return impl_->catalog;
}

} // namespace duel::service
