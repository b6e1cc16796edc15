#pragma once

/// @file duel_test_support.hpp
/// @brief Deterministic random sources and clocks for duel tests.

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "duel/foundation/game_result.hpp"
#include "duel/game/duel_types.hpp"
#include "duel/game/random_source.hpp"

namespace duel::test {

/// Draw values that select a tier for the default base stats
/// (hit 0.65, crit 0.10) with balanced styles.
inline constexpr double kRollCritical = 0.05;
inline constexpr double kRollHit = 0.30;
inline constexpr double kRollMiss = 0.90;

/// Returns scripted draws in order, then fails once exhausted.
class ScriptedRandomSource final : public game::RandomSource {
public:
    ScriptedRandomSource() = default;
    explicit ScriptedRandomSource(std::vector<double> values)
        : values_(values.begin(), values.end()) {}

    void push(double value) {
        std::lock_guard lock(mutex_);
        values_.push_back(value);
    }

    /// Make the next draw an error instead of a value.
    void failNext() {
        std::lock_guard lock(mutex_);
        failNext_ = true;
    }

    [[nodiscard]] std::size_t draws() const {
        std::lock_guard lock(mutex_);
        return draws_;
    }

    foundation::GameResult<double> nextUnit() override {
        std::lock_guard lock(mutex_);
        ++draws_;
        if (failNext_ || values_.empty()) {
            failNext_ = false;
            return foundation::GameResult<double>::err(foundation::GameError(
                foundation::ErrorCode::Unknown, "scripted source exhausted"));
        }
        double v = values_.front();
        values_.pop_front();
        return foundation::GameResult<double>::ok(v);
    }

private:
    mutable std::mutex mutex_;
    std::deque<double> values_;
    bool failNext_ = false;
    std::size_t draws_ = 0;
};

/// Factory that hands out sources the test keeps a handle to.
///
/// Each created match takes the next prepared source; unprepared matches
/// get an empty (always failing) one.
class ScriptedSourceFactory {
public:
    std::shared_ptr<ScriptedRandomSource> prepare(std::vector<double> values = {}) {
        auto source = std::make_shared<ScriptedRandomSource>(std::move(values));
        std::lock_guard lock(mutex_);
        pending_.push_back(source);
        return source;
    }

    game::RandomSourceFactory factory() {
        return [this]() -> std::unique_ptr<game::RandomSource> {
            std::shared_ptr<ScriptedRandomSource> next;
            {
                std::lock_guard lock(mutex_);
                if (!pending_.empty()) {
                    next = pending_.front();
                    pending_.pop_front();
                }
            }
            if (!next) {
                next = std::make_shared<ScriptedRandomSource>();
            }
            return std::make_unique<Forwarding>(std::move(next));
        };
    }

private:
    /// Lets the match own a source while the test keeps scripting it.
    class Forwarding final : public game::RandomSource {
    public:
        explicit Forwarding(std::shared_ptr<ScriptedRandomSource> target)
            : target_(std::move(target)) {}

        foundation::GameResult<double> nextUnit() override { return target_->nextUnit(); }

    private:
        std::shared_ptr<ScriptedRandomSource> target_;
    };

    std::mutex mutex_;
    std::deque<std::shared_ptr<ScriptedRandomSource>> pending_;
};

/// Manually advanced clock.
class ManualClock {
public:
    ManualClock() : base_(game::Clock::now()) {}

    [[nodiscard]] game::TimePoint now() const {
        return base_ + std::chrono::milliseconds(offsetMs_->load());
    }

    void advance(std::chrono::milliseconds delta) { offsetMs_->fetch_add(delta.count()); }

    /// Clock function sharing this clock's offset.
    [[nodiscard]] std::function<game::TimePoint()> fn() const {
        auto base = base_;
        auto offset = offsetMs_;
        return [base, offset] { return base + std::chrono::milliseconds(offset->load()); };
    }

private:
    game::TimePoint base_;
    std::shared_ptr<std::atomic<int64_t>> offsetMs_ = std::make_shared<std::atomic<int64_t>>(0);
};

} // namespace duel::test
