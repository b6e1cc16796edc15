#pragma once

/// @file deadline_ticker.hpp
/// @brief Fixed-rate thread that delivers deadline messages to a DuelServer.
///
/// DeadlineTicker calls DuelServer::processDeadlines() at a configurable
/// rate (default 10 Hz) on a dedicated thread. Each sweep is timed so
/// overruns (sweeps longer than the tick period) can be observed.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace duel::service {

class DuelServer;

/// Timing of one deadline sweep.
struct SweepMetrics {
    std::chrono::microseconds sweepTime{0};
    /// Matches in which a deadline fired during this sweep.
    std::size_t matchesFired = 0;
    uint64_t tickNumber = 0;
    bool overrun = false;
};

/// Drives DuelServer deadlines from its own thread.
///
/// @code
///   DeadlineTicker ticker(server, 10);
///   ticker.start();
///   // ...
///   ticker.stop();
/// @endcode
class DeadlineTicker {
public:
    using MetricsCallback = std::function<void(const SweepMetrics&)>;

    explicit DeadlineTicker(DuelServer& server, uint32_t tickRate = 10);
    ~DeadlineTicker();

    DeadlineTicker(const DeadlineTicker&) = delete;
    DeadlineTicker& operator=(const DeadlineTicker&) = delete;
    DeadlineTicker(DeadlineTicker&&) = delete;
    DeadlineTicker& operator=(DeadlineTicker&&) = delete;

    void setMetricsCallback(MetricsCallback callback);

    /// @return false if already running.
    [[nodiscard]] bool start();

    /// Signal the thread to stop and join it.
    void stop();

    /// Run one sweep on the calling thread. Not for use while running.
    SweepMetrics tickOnce();

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] uint32_t tickRate() const noexcept { return tickRate_; }
    [[nodiscard]] std::chrono::microseconds period() const noexcept { return period_; }
    [[nodiscard]] uint64_t tickCount() const noexcept;
    [[nodiscard]] SweepMetrics lastMetrics() const;

private:
    void run();
    SweepMetrics sweep();

    DuelServer& server_;
    uint32_t tickRate_;
    std::chrono::microseconds period_;

    MetricsCallback metricsCallback_;
    mutable std::mutex callbackMutex_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> tickCount_{0};
    std::thread thread_;

    mutable std::mutex metricsMutex_;
    SweepMetrics lastMetrics_;
};

} // namespace duel::service
