#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "duel/game/duel_round.hpp"
#include "support/duel_test_support.hpp"

using namespace duel::game;
using namespace std::chrono_literals;
using duel::foundation::ErrorCode;
using duel::foundation::MatchId;
using duel::test::kRollCritical;
using duel::test::kRollHit;
using duel::test::kRollMiss;
using duel::test::ScriptedRandomSource;

class DuelRoundTest : public ::testing::Test {
protected:
    DuelRound makeRound(BaseStats base = {}) {
        return DuelRound(MatchId(1), 1, {base, base}, catalog_, scorer_, timings_, t0_);
    }

    void lockBoth(DuelRound& round, std::string_view a, std::string_view b) {
        ASSERT_TRUE(round.lockStyle(Seat::A, a, t0_).hasValue());
        ASSERT_TRUE(round.lockStyle(Seat::B, b, t0_).hasValue());
        ASSERT_EQ(round.phase(), RoundPhase::Swing);
    }

    StyleCatalog catalog_ = StyleCatalog::canonical();
    RoundScorer scorer_;
    RoundTimings timings_;
    TimePoint t0_ = Clock::now();
};

// ===========================================================================
// Style selection
// ===========================================================================

TEST_F(DuelRoundTest, StartsInStyleSelect) {
    auto round = makeRound();
    EXPECT_EQ(round.phase(), RoundPhase::StyleSelect);
    EXPECT_EQ(round.styleDeadline(), t0_ + timings_.styleLock);
    EXPECT_FALSE(round.swingDeadline().has_value());
    EXPECT_FALSE(round.paramsResolved());
    EXPECT_TRUE(round.checkInvariants().hasValue());
}

TEST_F(DuelRoundTest, SecondLockEntersSwingAndResolvesParams) {
    auto round = makeRound();
    auto first = round.lockStyle(Seat::A, styles::kAggressive, t0_);
    ASSERT_TRUE(first.hasValue());
    EXPECT_EQ(first.value(), RoundPhase::StyleSelect);

    auto later = t0_ + 3s;
    auto second = round.lockStyle(Seat::B, styles::kGuard, later);
    ASSERT_TRUE(second.hasValue());
    EXPECT_EQ(second.value(), RoundPhase::Swing);

    EXPECT_TRUE(round.paramsResolved());
    EXPECT_EQ(round.seat(Seat::A).swingCap, 4);
    EXPECT_EQ(round.seat(Seat::B).swingCap, 2);
    EXPECT_NEAR(round.seat(Seat::A).params.hitChance, 0.416, 1e-12);
    ASSERT_TRUE(round.swingDeadline().has_value());
    EXPECT_EQ(*round.swingDeadline(), later + timings_.swingPhase);
}

TEST_F(DuelRoundTest, LockIsImmutable) {
    auto round = makeRound();
    ASSERT_TRUE(round.lockStyle(Seat::A, styles::kPower, t0_).hasValue());

    auto again = round.lockStyle(Seat::A, styles::kFeint, t0_);
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::StyleAlreadyLocked);
    EXPECT_EQ(*round.seat(Seat::A).styleLock, "power");
}

TEST_F(DuelRoundTest, UnknownStyleLeavesSeatUnlocked) {
    auto round = makeRound();
    auto result = round.lockStyle(Seat::A, "ninja", t0_);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UnknownStyle);
    EXPECT_FALSE(round.seat(Seat::A).styleLock.has_value());
}

TEST_F(DuelRoundTest, ActionsInWrongPhaseAreRejected) {
    auto round = makeRound();
    ScriptedRandomSource source({kRollHit});

    auto swing = round.swing(Seat::A, source);
    ASSERT_TRUE(swing.hasError());
    EXPECT_EQ(swing.error().code(), ErrorCode::WrongPhase);
    EXPECT_EQ(source.draws(), 0u);

    auto stop = round.stop(Seat::A);
    ASSERT_TRUE(stop.hasError());
    EXPECT_EQ(stop.error().code(), ErrorCode::WrongPhase);

    lockBoth(round, styles::kBalanced, styles::kBalanced);
    auto lateLock = round.lockStyle(Seat::A, styles::kFeint, t0_);
    ASSERT_TRUE(lateLock.hasError());
    EXPECT_EQ(lateLock.error().code(), ErrorCode::StyleAlreadyLocked);
}

// ===========================================================================
// Swing phase
// ===========================================================================

TEST_F(DuelRoundTest, LastRollWinsForEverySwingCount) {
    for (int n = 1; n <= 3; ++n) {
        SCOPED_TRACE("swings=" + std::to_string(n));
        auto round = makeRound();
        lockBoth(round, styles::kBalanced, styles::kBalanced);

        // Earlier swings are critical, the last one a miss.
        ScriptedRandomSource source;
        for (int i = 1; i < n; ++i) {
            source.push(kRollCritical);
        }
        source.push(kRollMiss);

        for (int i = 0; i < n; ++i) {
            ASSERT_TRUE(round.swing(Seat::A, source).hasValue());
        }
        EXPECT_EQ(round.seat(Seat::A).swingsUsed, n);
        ASSERT_TRUE(round.stop(Seat::A).hasValue());
        EXPECT_EQ(*round.seat(Seat::A).bestOutcome, Tier::Miss);
    }
}

TEST_F(DuelRoundTest, SwingCapEnforcedForEveryStyle) {
    for (const auto& id : catalog_.styleIds()) {
        SCOPED_TRACE(id);
        auto round = makeRound();
        lockBoth(round, id, styles::kBalanced);

        const int cap = round.seat(Seat::A).swingCap;
        ScriptedRandomSource source;
        for (int i = 0; i <= cap; ++i) {
            source.push(kRollHit);
        }
        for (int i = 0; i < cap; ++i) {
            ASSERT_TRUE(round.swing(Seat::A, source).hasValue());
        }
        auto extra = round.swing(Seat::A, source);
        ASSERT_TRUE(extra.hasError());
        EXPECT_EQ(extra.error().code(), ErrorCode::SwingCapReached);
        EXPECT_EQ(round.seat(Seat::A).swingsUsed, cap);
        EXPECT_EQ(source.draws(), static_cast<std::size_t>(cap));
        EXPECT_TRUE(round.checkInvariants().hasValue());
    }
}

TEST_F(DuelRoundTest, StopRequiresASwing) {
    auto round = makeRound();
    lockBoth(round, styles::kBalanced, styles::kBalanced);
    auto stop = round.stop(Seat::B);
    ASSERT_TRUE(stop.hasError());
    EXPECT_EQ(stop.error().code(), ErrorCode::NoSwingsTaken);
    EXPECT_FALSE(round.seat(Seat::B).submitted);
}

TEST_F(DuelRoundTest, SubmittedSeatCannotActAgain) {
    auto round = makeRound();
    lockBoth(round, styles::kBalanced, styles::kBalanced);
    ScriptedRandomSource source({kRollHit, kRollCritical});

    ASSERT_TRUE(round.swing(Seat::A, source).hasValue());
    auto stopped = round.stop(Seat::A);
    ASSERT_TRUE(stopped.hasValue());
    EXPECT_FALSE(stopped.value());

    auto swing = round.swing(Seat::A, source);
    ASSERT_TRUE(swing.hasError());
    EXPECT_EQ(swing.error().code(), ErrorCode::AlreadySubmitted);
    auto stop = round.stop(Seat::A);
    ASSERT_TRUE(stop.hasError());
    EXPECT_EQ(stop.error().code(), ErrorCode::AlreadySubmitted);
    EXPECT_EQ(source.draws(), 1u);
}

TEST_F(DuelRoundTest, SecondStopResolvesExactlyOnce) {
    auto round = makeRound();
    lockBoth(round, styles::kBalanced, styles::kBalanced);
    ScriptedRandomSource source({kRollHit, kRollMiss});

    ASSERT_TRUE(round.swing(Seat::A, source).hasValue());
    ASSERT_TRUE(round.swing(Seat::B, source).hasValue());
    EXPECT_FALSE(round.stop(Seat::A).value());
    EXPECT_TRUE(round.stop(Seat::B).value());

    EXPECT_EQ(round.phase(), RoundPhase::Resolved);
    ASSERT_TRUE(round.outcome().has_value());
    EXPECT_EQ(*round.outcome()->winner, Seat::A);
    EXPECT_DOUBLE_EQ(round.outcome()->push, 12.5);

    auto late = round.swing(Seat::B, source);
    ASSERT_TRUE(late.hasError());
    EXPECT_EQ(late.error().code(), ErrorCode::RoundAlreadyResolved);
    EXPECT_TRUE(round.checkInvariants().hasValue());
}

// ===========================================================================
// Deadlines
// ===========================================================================

TEST_F(DuelRoundTest, StyleDeadlineAssignsDefaultToUnlockedSeats) {
    auto round = makeRound();
    ASSERT_TRUE(round.lockStyle(Seat::A, styles::kGuard, t0_).hasValue());

    auto early = round.fireDeadlines(t0_ + 9s);
    ASSERT_TRUE(early.hasValue());
    EXPECT_FALSE(early.value().any());

    auto due = t0_ + timings_.styleLock;
    auto effect = round.fireDeadlines(due);
    ASSERT_TRUE(effect.hasValue());
    EXPECT_TRUE(effect.value().stylesDefaulted);
    EXPECT_FALSE(effect.value().resolved());

    EXPECT_EQ(round.phase(), RoundPhase::Swing);
    EXPECT_EQ(*round.seat(Seat::A).styleLock, "guard");
    EXPECT_FALSE(round.seat(Seat::A).styleDefaulted);
    EXPECT_EQ(*round.seat(Seat::B).styleLock, "balanced");
    EXPECT_TRUE(round.seat(Seat::B).styleDefaulted);
    EXPECT_EQ(*round.swingDeadline(), due + timings_.swingPhase);
}

TEST_F(DuelRoundTest, DefaultedSeatCannotLockAfterStyleDeadline) {
    auto round = makeRound();
    ASSERT_TRUE(round.lockStyle(Seat::A, styles::kGuard, t0_).hasValue());
    auto due = t0_ + timings_.styleLock;
    ASSERT_TRUE(round.fireDeadlines(due).hasValue());

    auto missed = round.lockStyle(Seat::B, styles::kAggressive, due + 1s);
    ASSERT_TRUE(missed.hasError());
    EXPECT_EQ(missed.error().code(), ErrorCode::WrongPhase);
    EXPECT_EQ(*round.seat(Seat::B).styleLock, "balanced");

    auto relock = round.lockStyle(Seat::A, styles::kFeint, due + 1s);
    ASSERT_TRUE(relock.hasError());
    EXPECT_EQ(relock.error().code(), ErrorCode::StyleAlreadyLocked);
}

TEST_F(DuelRoundTest, SwingDeadlineForcesSubmissionWithoutRolling) {
    auto round = makeRound();
    lockBoth(round, styles::kBalanced, styles::kBalanced);
    ScriptedRandomSource source({kRollCritical});
    ASSERT_TRUE(round.swing(Seat::A, source).hasValue());

    auto effect = round.fireDeadlines(*round.swingDeadline());
    ASSERT_TRUE(effect.hasValue());
    EXPECT_TRUE(effect.value().resolved());
    EXPECT_EQ(source.draws(), 1u);

    const auto& a = round.seat(Seat::A);
    const auto& b = round.seat(Seat::B);
    EXPECT_TRUE(a.forced);
    EXPECT_EQ(*a.bestOutcome, Tier::Critical);
    EXPECT_TRUE(b.forced);
    EXPECT_EQ(b.swingsUsed, 0);
    EXPECT_EQ(*b.bestOutcome, Tier::Miss);

    ASSERT_TRUE(round.outcome().has_value());
    EXPECT_EQ(*round.outcome()->winner, Seat::A);
    EXPECT_TRUE(round.checkInvariants().hasValue());
}

TEST_F(DuelRoundTest, BothDeadlinesInOneMessage) {
    auto round = makeRound();
    // Swing deadline counts from the style deadline, not from the late message.
    auto effect = round.fireDeadlines(t0_ + timings_.styleLock + timings_.swingPhase);
    ASSERT_TRUE(effect.hasValue());
    EXPECT_TRUE(effect.value().stylesDefaulted);
    EXPECT_TRUE(effect.value().swingsForced);
    EXPECT_EQ(round.phase(), RoundPhase::Resolved);
    EXPECT_TRUE(round.outcome()->isDraw());
}

TEST_F(DuelRoundTest, DeadlinesIgnoredOnceTerminal) {
    auto round = makeRound();
    ASSERT_TRUE(round.fireDeadlines(t0_ + 1h).hasValue());
    ASSERT_EQ(round.phase(), RoundPhase::Resolved);
    auto again = round.fireDeadlines(t0_ + 2h);
    ASSERT_TRUE(again.hasValue());
    EXPECT_FALSE(again.value().any());
}

TEST_F(DuelRoundTest, StopAfterForcedSubmissionIsRejected) {
    auto round = makeRound();
    lockBoth(round, styles::kBalanced, styles::kBalanced);
    ScriptedRandomSource source({kRollHit});
    ASSERT_TRUE(round.swing(Seat::A, source).hasValue());
    ASSERT_TRUE(round.fireDeadlines(*round.swingDeadline()).hasValue());

    auto stop = round.stop(Seat::A);
    ASSERT_TRUE(stop.hasError());
    EXPECT_EQ(stop.error().code(), ErrorCode::RoundAlreadyResolved);
}

// ===========================================================================
// Fatal conditions
// ===========================================================================

TEST_F(DuelRoundTest, RandomFailureAbortsRound) {
    auto round = makeRound();
    lockBoth(round, styles::kBalanced, styles::kBalanced);
    ScriptedRandomSource source;
    source.failNext();

    auto swing = round.swing(Seat::A, source);
    ASSERT_TRUE(swing.hasError());
    EXPECT_EQ(swing.error().code(), ErrorCode::RandomSourceFailure);
    EXPECT_EQ(round.phase(), RoundPhase::Aborted);
    ASSERT_TRUE(round.abortReason().has_value());
    EXPECT_EQ(round.abortReason()->code(), ErrorCode::RandomSourceFailure);
    EXPECT_FALSE(round.outcome().has_value());
    EXPECT_EQ(round.seat(Seat::A).swingsUsed, 0);

    auto stop = round.stop(Seat::B);
    ASSERT_TRUE(stop.hasError());
    EXPECT_EQ(stop.error().code(), ErrorCode::RoundAborted);
    EXPECT_TRUE(round.checkInvariants().hasValue());
}

TEST_F(DuelRoundTest, AbortIsNoOpAfterResolution) {
    auto round = makeRound();
    ASSERT_TRUE(round.fireDeadlines(t0_ + 1h).hasValue());
    round.abort(duel::foundation::GameError(ErrorCode::InvariantViolation, "late"));
    EXPECT_EQ(round.phase(), RoundPhase::Resolved);
    EXPECT_FALSE(round.abortReason().has_value());
}
