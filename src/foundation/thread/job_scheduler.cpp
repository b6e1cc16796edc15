/// @file job_scheduler.cpp
/// @brief GameJobScheduler implementation wrapping kcenon thread_system.

#include "duel/foundation/job_scheduler.hpp"

#include "duel/foundation/game_logger.hpp"

#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace duel::foundation {

namespace {

kcenon::thread::job_priority mapPriority(JobPriority p) {
    switch (p) {
        case JobPriority::Critical: return kcenon::thread::job_priority::highest;
        case JobPriority::High:     return kcenon::thread::job_priority::high;
        case JobPriority::Normal:   return kcenon::thread::job_priority::normal;
        case JobPriority::Low:      return kcenon::thread::job_priority::low;
    }
    return kcenon::thread::job_priority::normal;
}

} // namespace

struct GameJobScheduler::Impl {
    struct Tracked {
        std::shared_future<void> future;
        std::shared_ptr<std::atomic<bool>> cancelled;
    };

    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<uint64_t> nextJobId{1};
    std::unordered_map<JobId, Tracked> jobs;
    bool stopped = false;
    mutable std::mutex mutex;
};

GameJobScheduler::GameJobScheduler(std::size_t numThreads, std::string poolName)
    : impl_(std::make_unique<Impl>())
{
    if (numThreads == 0) {
        numThreads = 1;
    }
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>(poolName);

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads);
    for (std::size_t i = 0; i < numThreads; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();

    DUEL_LOG_INFO(LogCategory::Thread,
                  "job pool '" + poolName + "' started with " +
                      std::to_string(numThreads) + " workers");
}

GameJobScheduler::~GameJobScheduler() {
    if (impl_) {
        shutdown();
    }
}

GameJobScheduler::GameJobScheduler(GameJobScheduler&&) noexcept = default;
GameJobScheduler& GameJobScheduler::operator=(GameJobScheduler&&) noexcept = default;

GameResult<GameJobScheduler::JobId> GameJobScheduler::schedule(
    JobFunc job, JobPriority priority)
{
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->stopped) {
            return GameResult<JobId>::err(
                GameError(ErrorCode::JobScheduleFailed, "scheduler is shut down"));
        }
    }

    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    auto threadJob = kcenon::thread::job_builder()
        .name("duel_job_" + std::to_string(id))
        .priority(mapPriority(priority))
        .work([fn = std::move(job), cancelled, promise]()
              -> kcenon::common::VoidResult {
            try {
                if (!cancelled->load(std::memory_order_acquire)) {
                    fn();
                }
                promise->set_value();
            } catch (const std::exception& e) {
                DUEL_LOG_ERROR(LogCategory::Thread,
                               std::string("job threw: ") + e.what());
                promise->set_exception(std::current_exception());
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    // Track before enqueueing so a fast job can always be waited on.
    {
        std::lock_guard lock(impl_->mutex);
        impl_->jobs[id] = Impl::Tracked{future, cancelled};
    }

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        std::lock_guard lock(impl_->mutex);
        impl_->jobs.erase(id);
        return GameResult<JobId>::err(
            GameError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }

    return GameResult<JobId>::ok(id);
}

GameResult<void> GameJobScheduler::post(JobFunc job, JobPriority priority) {
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->stopped) {
            return GameResult<void>::err(
                GameError(ErrorCode::JobScheduleFailed, "scheduler is shut down"));
        }
    }

    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto threadJob = kcenon::thread::job_builder()
        .name("duel_post_" + std::to_string(id))
        .priority(mapPriority(priority))
        .work([fn = std::move(job)]() -> kcenon::common::VoidResult {
            try {
                fn();
            } catch (const std::exception& e) {
                DUEL_LOG_ERROR(LogCategory::Thread,
                               std::string("posted job threw: ") + e.what());
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }
    return GameResult<void>::ok();
}

GameResult<void> GameJobScheduler::wait(JobId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->jobs.find(id);
        if (it == impl_->jobs.end()) {
            return GameResult<void>::err(
                GameError(ErrorCode::JobNotFound, "job not found"));
        }
        future = it->second.future;
    }

    bool failed = false;
    try {
        future.get();
    } catch (const std::exception&) {
        failed = true;
    }

    {
        std::lock_guard lock(impl_->mutex);
        impl_->jobs.erase(id);
    }

    if (failed) {
        return GameResult<void>::err(
            GameError(ErrorCode::ThreadError, "job execution failed"));
    }
    return GameResult<void>::ok();
}

GameResult<void> GameJobScheduler::cancel(JobId id) {
    std::lock_guard lock(impl_->mutex);

    auto it = impl_->jobs.find(id);
    if (it == impl_->jobs.end()) {
        return GameResult<void>::err(
            GameError(ErrorCode::JobNotFound, "job not found"));
    }

    auto status = it->second.future.wait_for(std::chrono::seconds(0));
    if (status == std::future_status::ready) {
        return GameResult<void>::err(
            GameError(ErrorCode::JobCancelled, "job already completed"));
    }

    it->second.cancelled->store(true, std::memory_order_release);
    return GameResult<void>::ok();
}

std::size_t GameJobScheduler::trackedJobs() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->jobs.size();
}

void GameJobScheduler::shutdown() {
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->stopped) {
            return;
        }
        impl_->stopped = true;
    }
    if (impl_->pool) {
        impl_->pool->stop(false);
    }
    DUEL_LOG_INFO(LogCategory::Thread, "job pool stopped");
}

} // namespace duel::foundation
