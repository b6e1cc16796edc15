#pragma once

/// @file job_scheduler.hpp
/// @brief GameJobScheduler wrapping kcenon thread_system for background work.

#include "duel/foundation/game_result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace duel::foundation {

/// Priority levels for scheduled jobs.
///
/// Maps to kcenon::thread::job_priority internally:
///   Critical -> highest, High -> high, Normal -> normal, Low -> low
enum class JobPriority { Critical, High, Normal, Low };

/// Job scheduler over a kcenon thread_pool.
///
/// The duel service uses it to fan round broadcasts out to participant
/// streams without holding up the caller that resolved the round. PIMPL
/// keeps thread_system headers out of the public API.
///
/// Example:
/// @code
///   GameJobScheduler scheduler(2, "duel_broadcast");
///   auto id = scheduler.schedule([=] { handler(event); }, JobPriority::High);
///   (void)scheduler.wait(id.value());
/// @endcode
class GameJobScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    /// Construct a scheduler with @p numThreads workers.
    explicit GameJobScheduler(std::size_t numThreads = std::thread::hardware_concurrency(),
                              std::string poolName = "duel_jobs");

    ~GameJobScheduler();

    GameJobScheduler(const GameJobScheduler&) = delete;
    GameJobScheduler& operator=(const GameJobScheduler&) = delete;
    GameJobScheduler(GameJobScheduler&&) noexcept;
    GameJobScheduler& operator=(GameJobScheduler&&) noexcept;

    /// Schedule a job with the given priority.
    /// @return The assigned JobId, or JobScheduleFailed.
    GameResult<JobId> schedule(JobFunc job, JobPriority priority = JobPriority::Normal);

    /// Fire-and-forget: run @p job on the pool without tracking it.
    GameResult<void> post(JobFunc job, JobPriority priority = JobPriority::Normal);

    /// Block until the job identified by @p id completes.
    /// Completed jobs are forgotten once waited on.
    GameResult<void> wait(JobId id);

    /// Request cancellation of a pending job.
    /// Already-completed jobs return JobCancelled.
    GameResult<void> cancel(JobId id);

    /// Number of jobs scheduled but not yet waited on.
    [[nodiscard]] std::size_t trackedJobs() const;

    /// Stop accepting jobs and join the workers after running queued ones.
    void shutdown();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace duel::foundation
