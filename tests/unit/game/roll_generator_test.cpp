#include <gtest/gtest.h>

#include <array>
#include <limits>

#include "duel/game/roll_generator.hpp"
#include "support/duel_test_support.hpp"

using namespace duel::game;
using duel::foundation::ErrorCode;
using duel::test::ScriptedRandomSource;

namespace {

EffectiveParams params(double hit, double crit) {
    EffectiveParams p;
    p.hitChance = hit;
    p.critRate = crit;
    return p;
}

} // namespace

// ===========================================================================
// Band classification
// ===========================================================================

TEST(RollGeneratorTest, BandBoundaries) {
    auto p = params(0.65, 0.10);
    EXPECT_EQ(RollGenerator::classify(0.0, p), Tier::Critical);
    EXPECT_EQ(RollGenerator::classify(0.0999, p), Tier::Critical);
    EXPECT_EQ(RollGenerator::classify(0.10, p), Tier::Hit);
    EXPECT_EQ(RollGenerator::classify(0.6499, p), Tier::Hit);
    EXPECT_EQ(RollGenerator::classify(0.65, p), Tier::Miss);
    EXPECT_EQ(RollGenerator::classify(0.9999, p), Tier::Miss);
}

TEST(RollGeneratorTest, HitBandFlooredAtZero) {
    // Crit above hit chance leaves no hit band.
    auto p = params(0.05, 0.20);
    EXPECT_EQ(RollGenerator::classify(0.15, p), Tier::Critical);
    EXPECT_EQ(RollGenerator::classify(0.20, p), Tier::Miss);
}

TEST(RollGeneratorTest, ZeroChanceAlwaysMisses) {
    auto p = params(0.0, 0.0);
    EXPECT_EQ(RollGenerator::classify(0.0, p), Tier::Miss);
}

// ===========================================================================
// Draws
// ===========================================================================

TEST(RollGeneratorTest, RollConsumesExactlyOneDraw) {
    ScriptedRandomSource source({0.30, 0.05});
    auto p = params(0.65, 0.10);

    auto first = RollGenerator::roll(p, source);
    ASSERT_TRUE(first.hasValue());
    EXPECT_EQ(first.value(), Tier::Hit);
    EXPECT_EQ(source.draws(), 1u);

    auto second = RollGenerator::roll(p, source);
    ASSERT_TRUE(second.hasValue());
    EXPECT_EQ(second.value(), Tier::Critical);
    EXPECT_EQ(source.draws(), 2u);
}

TEST(RollGeneratorTest, SourceErrorBecomesRandomSourceFailure) {
    ScriptedRandomSource source;
    auto result = RollGenerator::roll(params(0.65, 0.10), source);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::RandomSourceFailure);
    EXPECT_TRUE(result.error().isFatal());
}

TEST(RollGeneratorTest, OutOfRangeDrawIsRejected) {
    ScriptedRandomSource source({1.0, -0.01, std::numeric_limits<double>::quiet_NaN()});
    auto p = params(0.65, 0.10);
    for (int i = 0; i < 3; ++i) {
        auto result = RollGenerator::roll(p, source);
        ASSERT_TRUE(result.hasError());
        EXPECT_EQ(result.error().code(), ErrorCode::RandomSourceFailure);
    }
}

TEST(RollGeneratorTest, MersenneSourceStaysInUnitInterval) {
    MersenneRandomSource source(12345);
    EXPECT_EQ(source.seed(), 12345u);
    for (int i = 0; i < 10000; ++i) {
        auto u = source.nextUnit();
        ASSERT_TRUE(u.hasValue());
        ASSERT_GE(u.value(), 0.0);
        ASSERT_LT(u.value(), 1.0);
    }
}

TEST(RollGeneratorTest, SameSeedSameSequence) {
    MersenneRandomSource a(77);
    MersenneRandomSource b(77);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(a.nextUnit().value(), b.nextUnit().value());
    }
}

// ===========================================================================
// Probabilities
// ===========================================================================

TEST(RollGeneratorTest, TierProbabilitiesSumToOne) {
    auto probs = RollGenerator::tierProbabilities(params(0.416, 0.10));
    EXPECT_NEAR(probs[static_cast<std::size_t>(Tier::Critical)], 0.10, 1e-12);
    EXPECT_NEAR(probs[static_cast<std::size_t>(Tier::Hit)], 0.316, 1e-12);
    EXPECT_NEAR(probs[static_cast<std::size_t>(Tier::Miss)], 0.584, 1e-12);
    EXPECT_NEAR(probs[0] + probs[1] + probs[2], 1.0, 1e-12);
}

TEST(RollGeneratorTest, EmpiricalFrequenciesMatchBands) {
    MersenneRandomSource source(2024);
    auto p = params(0.65, 0.10);
    std::array<int, kTierCount> counts{};
    constexpr int kDraws = 200000;
    for (int i = 0; i < kDraws; ++i) {
        ++counts[static_cast<std::size_t>(RollGenerator::roll(p, source).value())];
    }
    EXPECT_NEAR(counts[2] / static_cast<double>(kDraws), 0.10, 0.01);
    EXPECT_NEAR(counts[1] / static_cast<double>(kDraws), 0.55, 0.01);
    EXPECT_NEAR(counts[0] / static_cast<double>(kDraws), 0.35, 0.01);
}
