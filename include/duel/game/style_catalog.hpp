#pragma once

/// @file style_catalog.hpp
/// @brief StyleCatalog: immutable table of named style modifiers.
///
/// Styles are data, not code paths: every effect is a multiplier or a
/// delta that the ModifierResolver folds generically, so adding a style is
/// a table change.

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "duel/foundation/game_result.hpp"

namespace duel::foundation {
class ConfigManager;
}

namespace duel::game {

/// Modifier record for one style. Absent fields read as identity.
struct StyleEffect {
    std::optional<double> selfHitMult;
    std::optional<double> selfCritMult;
    std::optional<int32_t> selfRollCapDelta;
    std::optional<double> opponentHitMult;
    std::optional<double> winPushMult;
    std::optional<double> loseOpponentPushMult;
    bool feintTiebreak = false;

    [[nodiscard]] double selfHit() const { return selfHitMult.value_or(1.0); }
    [[nodiscard]] double selfCrit() const { return selfCritMult.value_or(1.0); }
    [[nodiscard]] int32_t capDelta() const { return selfRollCapDelta.value_or(0); }
    [[nodiscard]] double opponentHit() const { return opponentHitMult.value_or(1.0); }
    [[nodiscard]] double winPush() const { return winPushMult.value_or(1.0); }
    [[nodiscard]] double loseOpponentPush() const {
        return loseOpponentPushMult.value_or(1.0);
    }
};

/// Canonical style identifiers.
namespace styles {
inline constexpr std::string_view kBalanced = "balanced";
inline constexpr std::string_view kAggressive = "aggressive";
inline constexpr std::string_view kPrecise = "precise";
inline constexpr std::string_view kPower = "power";
inline constexpr std::string_view kGuard = "guard";
inline constexpr std::string_view kFeint = "feint";
} // namespace styles

/// Immutable mapping from style id to StyleEffect.
///
/// Style ids are case-sensitive lowercase strings. The catalog also names
/// the default style that deadlines assign to seats that never locked one.
class StyleCatalog {
public:
    /// The six canonical styles with "balanced" as default.
    [[nodiscard]] static StyleCatalog canonical();

    /// Canonical styles overlaid with `duel.styles.<id>.<field>` entries.
    ///
    /// Listed fields of an existing style replace its values; a new id adds
    /// a style whose unlisted fields are identity. `duel.default_style`
    /// selects the default and must name a catalog entry.
    [[nodiscard]] static foundation::GameResult<StyleCatalog> fromConfig(
        const foundation::ConfigManager& config);

    /// Build from explicit entries.
    /// @return InvalidArgument for malformed ids or negative multipliers,
    ///         UnknownStyle when @p defaultStyle is not among @p entries.
    [[nodiscard]] static foundation::GameResult<StyleCatalog> create(
        std::map<std::string, StyleEffect, std::less<>> entries,
        std::string defaultStyle);

    /// @return The effect, or UnknownStyle.
    [[nodiscard]] foundation::GameResult<StyleEffect> lookup(std::string_view styleId) const;

    [[nodiscard]] bool contains(std::string_view styleId) const;

    [[nodiscard]] const std::string& defaultStyle() const noexcept { return defaultStyle_; }

    /// All style ids in lexicographic order.
    [[nodiscard]] std::vector<std::string> styleIds() const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    StyleCatalog(std::map<std::string, StyleEffect, std::less<>> entries,
                 std::string defaultStyle);

    std::map<std::string, StyleEffect, std::less<>> entries_;
    std::string defaultStyle_;
};

} // namespace duel::game
