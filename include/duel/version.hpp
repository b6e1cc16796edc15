#pragma once

/// @file version.hpp
/// @brief Duel engine version, reported in the server banner and logs.

#define DUEL_VERSION_MAJOR 0
#define DUEL_VERSION_MINOR 1
#define DUEL_VERSION_PATCH 0
#define DUEL_VERSION_STRING "0.1.0"

namespace duel {

struct Version {
    static constexpr int major = DUEL_VERSION_MAJOR;
    static constexpr int minor = DUEL_VERSION_MINOR;
    static constexpr int patch = DUEL_VERSION_PATCH;
    static constexpr const char* string = DUEL_VERSION_STRING;

    /// Engine name used as the log prefix of the server banner.
    static constexpr const char* engine = "duel-match-engine";
};

} // namespace duel
