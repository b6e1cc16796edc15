#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the duel engine.

#include <cstdint>
#include <string_view>

namespace duel::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,
    JobCancelled = 0x0703,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,

    // Duel (0x0A00 - 0x0AFF)
    ServerNotRunning = 0x0A00,
    ServerAlreadyStarted = 0x0A01,
    MatchNotFound = 0x0A02,
    MatchNotActive = 0x0A03,
    RoundNotFound = 0x0A04,
    ParticipantNotFound = 0x0A05,
    UnknownStyle = 0x0A06,
    StyleAlreadyLocked = 0x0A07,
    WrongPhase = 0x0A08,
    SwingCapReached = 0x0A09,
    AlreadySubmitted = 0x0A0A,
    NoSwingsTaken = 0x0A0B,
    RoundAlreadyResolved = 0x0A0C,
    RoundAborted = 0x0A0D,
    StatLookupFailed = 0x0A0E,

    // Fatal duel conditions (abort the round)
    RandomSourceFailure = 0x0A80,
    InvariantViolation = 0x0A81,
    DuplicateBroadcast = 0x0A82,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        case 0x0A00: return "Duel";
        default: return "Unknown";
    }
}

/// Fatal duel codes live in the upper half of the Duel range.
constexpr bool isFatalDuelError(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    return (value & 0xFF00) == 0x0A00 && (value & 0x00FF) >= 0x80;
}

} // namespace duel::foundation
