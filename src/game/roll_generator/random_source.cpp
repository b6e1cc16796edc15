/// @file random_source.cpp
/// @brief SeedGenerator and MersenneRandomSource.

#include "duel/game/random_source.hpp"

namespace duel::game {

SeedGenerator& SeedGenerator::instance() {
    static SeedGenerator inst;
    return inst;
}

SeedGenerator::SeedGenerator() {
    std::random_device device;
    std::seed_seq seq{device(), device(), device(), device()};
    engine_.seed(seq);
}

void SeedGenerator::reseed(uint64_t seed) {
    std::lock_guard lock(mutex_);
    engine_.seed(seed);
}

uint64_t SeedGenerator::nextSeed() {
    std::lock_guard lock(mutex_);
    return engine_();
}

MersenneRandomSource::MersenneRandomSource()
    : MersenneRandomSource(SeedGenerator::instance().nextSeed()) {}

MersenneRandomSource::MersenneRandomSource(uint64_t seed)
    : seed_(seed), engine_(seed) {}

foundation::GameResult<double> MersenneRandomSource::nextUnit() {
    // Top 53 bits scaled by 2^-53: exactly representable and strictly < 1.
    constexpr double kScale = 1.0 / 9007199254740992.0;
    return foundation::GameResult<double>::ok(
        static_cast<double>(engine_() >> 11) * kScale);
}

RandomSourceFactory defaultRandomSourceFactory() {
    return [] { return std::make_unique<MersenneRandomSource>(); };
}

} // namespace duel::game
