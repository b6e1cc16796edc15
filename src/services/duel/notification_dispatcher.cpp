/// @file notification_dispatcher.cpp
/// @brief NotificationDispatcher implementation.

#include "duel/service/notification_dispatcher.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include "duel/foundation/game_logger.hpp"

namespace duel::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

DeliveryExecutor inlineExecutor() {
    return [](std::function<void()> job) { job(); };
}

struct NotificationDispatcher::Impl {
    struct Stream {
        SubscriptionId id = 0;
        RoundResolvedHandler handler;
    };

    struct MatchEntry {
        std::map<PlayerId, Stream> streams;
        std::unordered_set<uint32_t> broadcastRounds;
    };

    DeliveryExecutor executor;
    std::atomic<SubscriptionId> nextId{1};
    std::unordered_map<MatchId, MatchEntry> matches;
    std::unordered_map<SubscriptionId, std::pair<MatchId, PlayerId>> index;
    mutable std::mutex mutex;
};

NotificationDispatcher::NotificationDispatcher(DeliveryExecutor executor)
    : impl_(std::make_unique<Impl>()) {
    impl_->executor = executor ? std::move(executor) : inlineExecutor();
}

NotificationDispatcher::~NotificationDispatcher() = default;

SubscriptionId NotificationDispatcher::subscribe(MatchId matchId, PlayerId playerId,
                                                 RoundResolvedHandler handler) {
    auto id = impl_->nextId.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard lock(impl_->mutex);
    auto& stream = impl_->matches[matchId].streams[playerId];
    if (stream.id != 0) {
        impl_->index.erase(stream.id);
    }
    stream.id = id;
    stream.handler = std::move(handler);
    impl_->index.emplace(id, std::make_pair(matchId, playerId));
    return id;
}

bool NotificationDispatcher::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->index.find(id);
    if (it == impl_->index.end()) {
        return false;
    }
    auto [matchId, playerId] = it->second;
    impl_->index.erase(it);

    auto matchIt = impl_->matches.find(matchId);
    if (matchIt != impl_->matches.end()) {
        matchIt->second.streams.erase(playerId);
    }
    return true;
}

GameResult<DeliveryReport> NotificationDispatcher::broadcast(const RoundResolvedEvent& event) {
    if (!event) {
        return GameResult<DeliveryReport>::err(
            GameError(ErrorCode::InvalidArgument, "empty round event"));
    }

    DeliveryReport report;
    std::vector<RoundResolvedHandler> handlers;
    DeliveryExecutor executor;
    {
        std::lock_guard lock(impl_->mutex);
        auto& entry = impl_->matches[event->matchId];
        if (!entry.broadcastRounds.insert(event->roundNo).second) {
            LogContext ctx;
            ctx.matchId = event->matchId;
            ctx.roundNo = event->roundNo;
            DUEL_LOG_CTX(LogLevel::Error, LogCategory::Notify,
                         "duplicate round broadcast suppressed", ctx);
            return GameResult<DeliveryReport>::err(GameError(
                ErrorCode::DuplicateBroadcast,
                "round " + std::to_string(event->roundNo) + " of match " +
                    std::to_string(event->matchId.value()) + " already broadcast"));
        }

        for (const auto& player : event->players) {
            auto it = entry.streams.find(player);
            if (it == entry.streams.end()) {
                report.offline.push_back(player);
                continue;
            }
            report.delivered.push_back(player);
            handlers.push_back(it->second.handler);
        }
        executor = impl_->executor;
    }

    // Handlers run outside the lock so they may call back into the engine.
    for (auto& handler : handlers) {
        executor([handler = std::move(handler), event] { handler(event); });
    }

    LogContext ctx;
    ctx.matchId = event->matchId;
    ctx.roundNo = event->roundNo;
    ctx.extra["delivered"] = std::to_string(report.delivered.size());
    ctx.extra["offline"] = std::to_string(report.offline.size());
    DUEL_LOG_CTX(LogLevel::Debug, LogCategory::Notify, "round broadcast", ctx);
    return GameResult<DeliveryReport>::ok(std::move(report));
}

bool NotificationDispatcher::wasBroadcast(MatchId matchId, uint32_t roundNo) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->matches.find(matchId);
    return it != impl_->matches.end() && it->second.broadcastRounds.count(roundNo) > 0;
}

std::size_t NotificationDispatcher::subscriberCount(MatchId matchId) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->matches.find(matchId);
    return it == impl_->matches.end() ? 0 : it->second.streams.size();
}

void NotificationDispatcher::forgetMatch(MatchId matchId) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->matches.find(matchId);
    if (it == impl_->matches.end()) {
        return;
    }
    for (const auto& [player, stream] : it->second.streams) {
        impl_->index.erase(stream.id);
    }
    impl_->matches.erase(it);
}

void NotificationDispatcher::setExecutor(DeliveryExecutor executor) {
    std::lock_guard lock(impl_->mutex);
    impl_->executor = executor ? std::move(executor) : inlineExecutor();
}

} // namespace duel::service
