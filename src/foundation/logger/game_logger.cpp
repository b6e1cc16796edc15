/// @file game_logger.cpp
/// @brief GameLogger implementation wrapping kcenon logger_system.

#include "duel/foundation/game_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace duel::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: duel -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Info,   // Config
    LogLevel::Info,   // Match
    LogLevel::Debug,  // Round
    LogLevel::Debug,  // Combat
    LogLevel::Info,   // Notify
    LogLevel::Info    // Thread
};

// ---------------------------------------------------------------------------
// Context serialization
// ---------------------------------------------------------------------------
static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.matchId && ctx.matchId->isValid()) {
        append("match_id", std::to_string(ctx.matchId->value()));
    }
    if (ctx.roundNo) {
        append("round_no", std::to_string(*ctx.roundNo));
    }
    if (ctx.playerId && ctx.playerId->isValid()) {
        append("player_id", std::to_string(ctx.playerId->value()));
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct GameLogger::Impl {
    // Per-category log levels (atomic for lock-free reads on the hot path)
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers registered in GlobalLoggerRegistry, one per category
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("duel.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    /// Named category logger if one is registered, otherwise the default.
    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        auto& registry = kci::GlobalLoggerRegistry::instance();
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto logger = registry.get_logger(loggerNames[idx]);
        if (logger == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void emit(LogLevel level, LogCategory cat, const std::string& line) const {
        auto logger = getLogger(cat);
        // Logging must never become an error path for the engine.
        (void)logger->log(mapLevel(level), line);
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
GameLogger::GameLogger() : impl_(std::make_unique<Impl>()) {}

GameLogger::~GameLogger() = default;

GameLogger::GameLogger(GameLogger&&) noexcept = default;
GameLogger& GameLogger::operator=(GameLogger&&) noexcept = default;

// ---------------------------------------------------------------------------
// log()
// ---------------------------------------------------------------------------
void GameLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }

    // Format: [Category] message
    std::string formatted;
    formatted.reserve(msg.size() + 16);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;

    impl_->emit(level, cat, formatted);
}

// ---------------------------------------------------------------------------
// logWithContext()
// ---------------------------------------------------------------------------
void GameLogger::logWithContext(LogLevel level, LogCategory cat,
                                std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }

    std::string ctxStr = formatContext(ctx);

    // Format: [Category] message {key=val, ...}
    std::string formatted;
    formatted.reserve(msg.size() + ctxStr.size() + 20);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;
    if (!ctxStr.empty()) {
        formatted += " {";
        formatted += ctxStr;
        formatted += '}';
    }

    impl_->emit(level, cat, formatted);
}

// ---------------------------------------------------------------------------
// Category level control
// ---------------------------------------------------------------------------
void GameLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel GameLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool GameLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

// ---------------------------------------------------------------------------
// flush()
// ---------------------------------------------------------------------------
GameResult<void> GameLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return GameResult<void>::ok();
}

GameLogger& GameLogger::instance() {
    static GameLogger inst;
    return inst;
}

} // namespace duel::foundation
