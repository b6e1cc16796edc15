#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for engine error handling.

#include "duel/core/result.hpp"
#include "duel/foundation/game_error.hpp"

namespace duel::foundation {

/// Result type specialized with GameError.
///
/// Example:
/// @code
///   GameResult<uint32_t> swingCap(int32_t base, int32_t delta) {
///       if (base < 1) {
///           return GameResult<uint32_t>::err(
///               GameError(ErrorCode::InvalidArgument, "base cap below 1"));
///       }
///       return GameResult<uint32_t>::ok(std::max(1, base + delta));
///   }
/// @endcode
template <typename T>
using GameResult = duel::Result<T, GameError>;

}  // namespace duel::foundation
