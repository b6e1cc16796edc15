#pragma once

/// @file result.hpp
/// @brief Result<T,E> type for explicit error handling without exceptions.

#include <string>
#include <utility>
#include <variant>

namespace duel {

/// Minimal error payload for code that does not need the richer GameError.
struct Error {
    int code = 0;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : code(-1), message(std::move(msg)) {}
    Error(int c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Result type for explicit error propagation.
///
/// Engine operations never throw across their public surface: a rejected
/// participant action, a missing config key or a failed random draw all
/// come back as the error alternative of a Result.
///
/// @tparam T The success value type.
/// @tparam E The error type (defaults to duel::Error).
///
/// Example:
/// @code
///   auto result = server.swing(matchId, 1, playerId);
///   if (result.hasValue()) {
///       render(result.value().outcome);
///   } else {
///       reply(result.error().message());
///   }
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    /// Construct a success result.
    static Result ok(T value) { return Result(std::move(value)); }

    /// Construct an error result.
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool hasError() const noexcept { return std::holds_alternative<E>(data_); }

    /// True on success.
    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the success value (std::bad_variant_access if error).
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    /// Access the error (std::bad_variant_access if success).
    [[nodiscard]] const E& error() const& { return std::get<E>(data_); }
    [[nodiscard]] E& error() & { return std::get<E>(data_); }

    [[nodiscard]] T valueOr(T defaultValue) const& {
        return hasValue() ? value() : std::move(defaultValue);
    }

private:
    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(E error) : data_(std::move(error)) {}

    std::variant<T, E> data_;
};

/// Specialization for operations that only succeed or fail.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    explicit Result(bool) : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

}  // namespace duel
