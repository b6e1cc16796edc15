#pragma once

/// @file random_source.hpp
/// @brief Uniform random draws for swings.

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <random>

#include "duel/foundation/game_result.hpp"

namespace duel::game {

/// Source of uniform draws in [0, 1).
///
/// Each match owns its own source, so draws never contend across matches.
/// An implementation may fail; the caller treats any error or any value
/// outside [0, 1) as fatal for the round.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    [[nodiscard]] virtual foundation::GameResult<double> nextUnit() = 0;
};

/// Process-wide seed generator. Thread-safe.
class SeedGenerator {
public:
    static SeedGenerator& instance();

    /// Reseed deterministically (tests, replays).
    void reseed(uint64_t seed);

    [[nodiscard]] uint64_t nextSeed();

private:
    SeedGenerator();

    std::mutex mutex_;
    std::mt19937_64 engine_;
};

/// Production source: a 64-bit Mersenne Twister owned by one match.
class MersenneRandomSource final : public RandomSource {
public:
    /// Seeded from SeedGenerator.
    MersenneRandomSource();

    explicit MersenneRandomSource(uint64_t seed);

    [[nodiscard]] foundation::GameResult<double> nextUnit() override;

    [[nodiscard]] uint64_t seed() const noexcept { return seed_; }

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
};

/// Factory invoked once per match.
using RandomSourceFactory = std::function<std::unique_ptr<RandomSource>()>;

[[nodiscard]] RandomSourceFactory defaultRandomSourceFactory();

} // namespace duel::game
