#pragma once

/// @file notification_dispatcher.hpp
/// @brief Fan-out of round_resolved events to participant streams.

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "duel/foundation/game_result.hpp"
#include "duel/service/server_types.hpp"

namespace duel::service {

using SubscriptionId = uint64_t;

/// Participant stream callback.
using RoundResolvedHandler = std::function<void(const RoundResolvedEvent&)>;

/// Runs one delivery. The default runs it inline on the publishing thread.
using DeliveryExecutor = std::function<void(std::function<void()>)>;

[[nodiscard]] DeliveryExecutor inlineExecutor();

/// Which participants a broadcast reached.
struct DeliveryReport {
    std::vector<PlayerId> delivered;
    /// Not subscribed; they recover through getRoundState.
    std::vector<PlayerId> offline;
};

/// Delivers each resolved round to each participant at most once.
///
/// A ledger keyed by (match, round) rejects any second broadcast of the
/// same round with DuplicateBroadcast before anything is delivered. Each
/// (match, participant) pair holds at most one stream; subscribing again
/// replaces the previous handler.
class NotificationDispatcher {
public:
    explicit NotificationDispatcher(DeliveryExecutor executor = inlineExecutor());
    ~NotificationDispatcher();

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    SubscriptionId subscribe(MatchId matchId, PlayerId playerId, RoundResolvedHandler handler);

    /// @return False when the id is unknown or was replaced.
    bool unsubscribe(SubscriptionId id);

    [[nodiscard]] foundation::GameResult<DeliveryReport> broadcast(const RoundResolvedEvent& event);

    [[nodiscard]] bool wasBroadcast(MatchId matchId, uint32_t roundNo) const;

    [[nodiscard]] std::size_t subscriberCount(MatchId matchId) const;

    /// Drop subscriptions and ledger entries of a closed match.
    void forgetMatch(MatchId matchId);

    void setExecutor(DeliveryExecutor executor);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace duel::service
