/// @file deadline_ticker.cpp
/// @brief DeadlineTicker implementation.

#include "duel/service/deadline_ticker.hpp"

#include "duel/foundation/game_logger.hpp"
#include "duel/service/duel_server.hpp"

namespace duel::service {

using foundation::LogCategory;

DeadlineTicker::DeadlineTicker(DuelServer& server, uint32_t tickRate)
    : server_(server),
      tickRate_(tickRate > 0 ? tickRate : 10),
      period_(std::chrono::microseconds(1'000'000 / (tickRate > 0 ? tickRate : 10))) {}

DeadlineTicker::~DeadlineTicker() {
    stop();
}

void DeadlineTicker::setMetricsCallback(MetricsCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    metricsCallback_ = std::move(callback);
}

bool DeadlineTicker::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return false;
    }
    thread_ = std::thread([this] { run(); });
    DUEL_LOG_INFO(LogCategory::Thread,
                  "deadline ticker started at " + std::to_string(tickRate_) + " Hz");
    return true;
}

void DeadlineTicker::stop() {
    const bool wasRunning = running_.exchange(false);
    if (thread_.joinable()) {
        thread_.join();
    }
    if (wasRunning) {
        DUEL_LOG_INFO(LogCategory::Thread,
                      "deadline ticker stopped after " + std::to_string(tickCount()) + " ticks");
    }
}

SweepMetrics DeadlineTicker::tickOnce() {
    auto metrics = sweep();
    std::lock_guard<std::mutex> lock(metricsMutex_);
    lastMetrics_ = metrics;
    return metrics;
}

bool DeadlineTicker::isRunning() const noexcept {
    return running_.load();
}

uint64_t DeadlineTicker::tickCount() const noexcept {
    return tickCount_.load();
}

SweepMetrics DeadlineTicker::lastMetrics() const {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    return lastMetrics_;
}

void DeadlineTicker::run() {
    auto nextTick = std::chrono::steady_clock::now();

    while (running_.load()) {
        nextTick += period_;

        auto metrics = sweep();
        {
            std::lock_guard<std::mutex> lock(metricsMutex_);
            lastMetrics_ = metrics;
        }
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            if (metricsCallback_) {
                metricsCallback_(metrics);
            }
        }
        if (metrics.overrun) {
            DUEL_LOG_WARN(LogCategory::Thread,
                          "deadline sweep overran: " +
                              std::to_string(metrics.sweepTime.count()) + "us");
        }

        auto now = std::chrono::steady_clock::now();
        if (now < nextTick) {
            std::this_thread::sleep_until(nextTick);
        } else {
            // Overran: restart the schedule instead of catching up.
            nextTick = now;
        }
    }
}

SweepMetrics DeadlineTicker::sweep() {
    auto start = std::chrono::steady_clock::now();
    auto fired = server_.processDeadlines();
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    SweepMetrics metrics;
    metrics.sweepTime = elapsed;
    metrics.matchesFired = fired;
    metrics.tickNumber = tickCount_.fetch_add(1);
    metrics.overrun = elapsed > period_;
    return metrics;
}

} // namespace duel::service
