#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping kcenon logger_system for structured engine logging.
///
/// Provides category-based filtering, structured logging with match and
/// participant context, and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "duel/foundation/game_result.hpp"
#include "duel/foundation/types.hpp"

namespace duel::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Engine log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core   = 0, ///< Server lifecycle
    Config = 1, ///< Configuration loading
    Match  = 2, ///< Match creation, control bar, completion
    Round  = 3, ///< Round phases and participant actions
    Combat = 4, ///< Rolls and scoring
    Notify = 5, ///< Broadcast fan-out
    Thread = 6  ///< Ticker and job scheduling
};

inline constexpr std::size_t kLogCategoryCount = 7;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Config", "Match", "Round", "Combat", "Notify", "Thread"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.matchId = MatchId(7);
///   ctx.roundNo = 2;
///   ctx.extra["tier"] = "critical";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Combat,
///                         "swing rolled", ctx);
/// @endcode
struct LogContext {
    std::optional<MatchId> matchId;
    std::optional<PlayerId> playerId;
    std::optional<uint32_t> roundNo;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger wrapping kcenon's logging system.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Config   | Info          |
/// | Match    | Info          |
/// | Round    | Debug         |
/// | Combat   | Debug         |
/// | Notify   | Info          |
/// | Thread   | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    GameResult<void> flush();

    /// Get the global GameLogger singleton instance.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace duel::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace, macros are global)
// ---------------------------------------------------------------------------

/// DUEL_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off

#ifndef DUEL_MIN_LOG_LEVEL
    #define DUEL_MIN_LOG_LEVEL 0
#endif

#define DUEL_LOG(level, cat, msg)                                                 \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= DUEL_MIN_LOG_LEVEL &&                      \
            ::duel::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                         \
            ::duel::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define DUEL_LOG_CTX(level, cat, msg, ctx)                                        \
    do {                                                                          \
        if (static_cast<int>(level) >= DUEL_MIN_LOG_LEVEL &&                      \
            ::duel::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                         \
            ::duel::foundation::GameLogger::instance().logWithContext(            \
                (level), (cat), (msg), (ctx));                                    \
        }                                                                         \
    } while (0)

#define DUEL_LOG_DEBUG(cat, msg) \
    DUEL_LOG(::duel::foundation::LogLevel::Debug, (cat), (msg))

#define DUEL_LOG_INFO(cat, msg) \
    DUEL_LOG(::duel::foundation::LogLevel::Info, (cat), (msg))

#define DUEL_LOG_WARN(cat, msg) \
    DUEL_LOG(::duel::foundation::LogLevel::Warning, (cat), (msg))

#define DUEL_LOG_ERROR(cat, msg) \
    DUEL_LOG(::duel::foundation::LogLevel::Error, (cat), (msg))
