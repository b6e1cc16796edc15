#pragma once

/// @file types.hpp
/// @brief Strong ID types shared across the engine.

#include <cstdint>
#include <functional>

namespace duel::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Keeps a MatchId from being passed where a PlayerId is expected while
/// sharing the same underlying representation.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct PlayerIdTag {};
struct MatchIdTag {};

/// Identifier of a participant, issued by the identity layer.
using PlayerId = StrongId<PlayerIdTag>;

/// Identifier of a match, issued by DuelServer::createMatch.
using MatchId = StrongId<MatchIdTag>;

} // namespace duel::foundation

template <typename Tag, typename T>
struct std::hash<duel::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const duel::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
