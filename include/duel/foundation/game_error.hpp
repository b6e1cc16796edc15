#pragma once

/// @file game_error.hpp
/// @brief Engine error type used with Result<T, GameError>.

#include <string>
#include <string_view>
#include <utility>

#include "duel/foundation/error_code.hpp"

namespace duel::foundation {

/// Error carrying a categorized code and a human-readable message.
///
/// Caller errors (a rejected action) and fatal conditions (a failed random
/// draw) share this type; isFatal() separates the two.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code)
        : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// True for conditions that abort a round instead of rejecting a call.
    [[nodiscard]] bool isFatal() const noexcept {
        return isFatalDuelError(code_);
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
};

} // namespace duel::foundation
