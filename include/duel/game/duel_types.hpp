#pragma once

/// @file duel_types.hpp
/// @brief Enumerations and value types shared by the duel game layer.

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace duel::game {

/// Clock used for every round deadline.
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/// Seat of a participant within a match.
///
/// Seat A is the challenger, seat B the opponent.
enum class Seat : uint8_t {
    A = 0,
    B = 1
};

inline constexpr std::size_t kSeatCount = 2;

/// The other seat.
constexpr Seat opponentOf(Seat seat) {
    return seat == Seat::A ? Seat::B : Seat::A;
}

constexpr std::size_t seatIndex(Seat seat) {
    return static_cast<std::size_t>(seat);
}

/// Ordered swing outcome category, miss < hit < critical.
enum class Tier : uint8_t {
    Miss     = 0,
    Hit      = 1,
    Critical = 2
};

inline constexpr std::size_t kTierCount = 3;

/// Lifecycle of a single round.
///
/// Transitions are monotonic: StyleSelect -> Swing -> Resolved. Aborted is
/// terminal and reachable from any non-resolved phase.
enum class RoundPhase : uint8_t {
    StyleSelect = 0,
    Swing       = 1,
    Resolved    = 2,
    Aborted     = 3
};

constexpr std::string_view seatName(Seat seat) {
    return seat == Seat::A ? "A" : "B";
}

constexpr std::string_view tierName(Tier tier) {
    switch (tier) {
        case Tier::Miss:     return "miss";
        case Tier::Hit:      return "hit";
        case Tier::Critical: return "critical";
    }
    return "unknown";
}

constexpr std::string_view phaseName(RoundPhase phase) {
    switch (phase) {
        case RoundPhase::StyleSelect: return "style_select";
        case RoundPhase::Swing:       return "swing";
        case RoundPhase::Resolved:    return "resolved";
        case RoundPhase::Aborted:     return "aborted";
    }
    return "unknown";
}

/// Participant attributes supplied by the stat provider.
struct BaseStats {
    double baseHitChance = 0.65;
    double baseCritRate = 0.10;
    int32_t baseRollCap = 3;
};

/// Per-seat parameters for one round after both styles are folded in.
struct EffectiveParams {
    double hitChance = 0.0;
    double critRate = 0.0;
    int32_t rollCap = 1;
    double winPushMult = 1.0;
    double loseOpponentPushMult = 1.0;
    bool feintTiebreak = false;
};

/// Per-seat container indexed by Seat.
template <typename T>
using PerSeat = std::array<T, kSeatCount>;

/// Round durations.
struct RoundTimings {
    std::chrono::milliseconds styleLock{std::chrono::seconds(10)};
    std::chrono::milliseconds swingPhase{std::chrono::seconds(30)};
};

} // namespace duel::game
