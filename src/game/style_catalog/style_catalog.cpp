/// @file style_catalog.cpp
/// @brief StyleCatalog construction and validation.

#include "duel/game/style_catalog.hpp"

#include "duel/foundation/config_manager.hpp"
#include "duel/foundation/game_logger.hpp"

#include <algorithm>

namespace duel::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

constexpr std::string_view kStylesPrefix = "duel.styles";

bool isValidStyleId(std::string_view id) {
    if (id.empty()) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    });
}

bool isNegative(const std::optional<double>& v) {
    return v.has_value() && *v < 0.0;
}

/// Apply one `duel.styles.<id>.<field>` entry to @p effect.
GameResult<void> applyField(const foundation::ConfigManager& config,
                            const std::string& key, std::string_view fieldName,
                            StyleEffect& effect) {
    auto readDouble = [&](std::optional<double>& slot) -> GameResult<void> {
        auto v = config.get<double>(key);
        if (!v) {
            return GameResult<void>::err(v.error());
        }
        slot = v.value();
        return GameResult<void>::ok();
    };

    if (fieldName == "self_hit_mult") return readDouble(effect.selfHitMult);
    if (fieldName == "self_crit_mult") return readDouble(effect.selfCritMult);
    if (fieldName == "opponent_hit_mult") return readDouble(effect.opponentHitMult);
    if (fieldName == "win_push_mult") return readDouble(effect.winPushMult);
    if (fieldName == "lose_opponent_push_mult") {
        return readDouble(effect.loseOpponentPushMult);
    }
    if (fieldName == "self_roll_cap_delta") {
        auto v = config.get<int32_t>(key);
        if (!v) {
            return GameResult<void>::err(v.error());
        }
        effect.selfRollCapDelta = v.value();
        return GameResult<void>::ok();
    }
    if (fieldName == "feint_tiebreak") {
        auto v = config.get<bool>(key);
        if (!v) {
            return GameResult<void>::err(v.error());
        }
        effect.feintTiebreak = v.value();
        return GameResult<void>::ok();
    }
    return GameResult<void>::err(GameError(
        ErrorCode::InvalidArgument, "unknown style field: " + key));
}

} // namespace

StyleCatalog::StyleCatalog(std::map<std::string, StyleEffect, std::less<>> entries,
                           std::string defaultStyle)
    : entries_(std::move(entries)), defaultStyle_(std::move(defaultStyle)) {}

StyleCatalog StyleCatalog::canonical() {
    std::map<std::string, StyleEffect, std::less<>> entries;

    entries.emplace(std::string(styles::kBalanced), StyleEffect{});

    StyleEffect aggressive;
    aggressive.selfHitMult = 0.80;
    aggressive.selfRollCapDelta = 1;
    entries.emplace(std::string(styles::kAggressive), aggressive);

    StyleEffect precise;
    precise.selfHitMult = 1.20;
    precise.selfCritMult = 0.50;
    entries.emplace(std::string(styles::kPrecise), precise);

    StyleEffect power;
    power.winPushMult = 1.25;
    power.loseOpponentPushMult = 1.20;
    entries.emplace(std::string(styles::kPower), power);

    StyleEffect guard;
    guard.selfRollCapDelta = -1;
    guard.opponentHitMult = 0.80;
    entries.emplace(std::string(styles::kGuard), guard);

    StyleEffect feint;
    feint.feintTiebreak = true;
    entries.emplace(std::string(styles::kFeint), feint);

    return StyleCatalog(std::move(entries), std::string(styles::kBalanced));
}

GameResult<StyleCatalog> StyleCatalog::create(
    std::map<std::string, StyleEffect, std::less<>> entries, std::string defaultStyle) {
    for (const auto& [id, effect] : entries) {
        if (!isValidStyleId(id)) {
            return GameResult<StyleCatalog>::err(GameError(
                ErrorCode::InvalidArgument, "invalid style id: '" + id + "'"));
        }
        if (isNegative(effect.selfHitMult) || isNegative(effect.selfCritMult) ||
            isNegative(effect.opponentHitMult) || isNegative(effect.winPushMult) ||
            isNegative(effect.loseOpponentPushMult)) {
            return GameResult<StyleCatalog>::err(GameError(
                ErrorCode::InvalidArgument, "negative multiplier in style '" + id + "'"));
        }
    }
    if (entries.find(defaultStyle) == entries.end()) {
        return GameResult<StyleCatalog>::err(GameError(
            ErrorCode::UnknownStyle, "default style not in catalog: " + defaultStyle));
    }
    return GameResult<StyleCatalog>::ok(
        StyleCatalog(std::move(entries), std::move(defaultStyle)));
}

GameResult<StyleCatalog> StyleCatalog::fromConfig(const foundation::ConfigManager& config) {
    auto entries = canonical().entries_;

    for (const auto& key : config.keysWithPrefix(kStylesPrefix)) {
        // key = duel.styles.<id>.<field>
        auto rest = std::string_view(key).substr(kStylesPrefix.size() + 1);
        auto dot = rest.find('.');
        if (dot == std::string_view::npos || dot == 0 || dot + 1 >= rest.size()) {
            return GameResult<StyleCatalog>::err(GameError(
                ErrorCode::InvalidArgument, "malformed style key: " + key));
        }
        std::string id(rest.substr(0, dot));
        auto fieldName = rest.substr(dot + 1);

        auto applied = applyField(config, key, fieldName, entries[id]);
        if (!applied) {
            return GameResult<StyleCatalog>::err(applied.error());
        }
    }

    auto defaultStyle = config.getOr<std::string>("duel.default_style",
                                                  std::string(styles::kBalanced));
    auto catalog = create(std::move(entries), std::move(defaultStyle));
    if (catalog) {
        DUEL_LOG_INFO(LogCategory::Config,
                      "style catalog loaded with " + std::to_string(catalog.value().size()) +
                          " styles, default '" + catalog.value().defaultStyle() + "'");
    }
    return catalog;
}

GameResult<StyleEffect> StyleCatalog::lookup(std::string_view styleId) const {
    auto it = entries_.find(styleId);
    if (it == entries_.end()) {
        return GameResult<StyleEffect>::err(GameError(
            ErrorCode::UnknownStyle, "unknown style: " + std::string(styleId)));
    }
    return GameResult<StyleEffect>::ok(it->second);
}

bool StyleCatalog::contains(std::string_view styleId) const {
    return entries_.find(styleId) != entries_.end();
}

std::vector<std::string> StyleCatalog::styleIds() const {
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, effect] : entries_) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace duel::game
