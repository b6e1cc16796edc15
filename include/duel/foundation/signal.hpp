#pragma once

/// @file signal.hpp
/// @brief Thread-safe Signal<Args...> used for the engine's outbound hooks.
///
/// Collaborators outside the engine (persistence, statistics, telemetry)
/// attach with connect() and are invoked on emit(). Uses std::shared_mutex
/// so concurrent emit() calls from different matches do not serialize on
/// each other.

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace duel::foundation {

/// Thread-safe signal dispatching to registered callbacks.
///
/// @tparam Args The argument types passed to each slot when the signal fires.
///
/// Example:
/// @code
///   Signal<const ResolvedRound&> onRoundResolved;
///   auto id = onRoundResolved.connect([&](const ResolvedRound& r) {
///       history.append(r.payload);
///   });
///   onRoundResolved.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;
    ~Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /// Register a callback. Returns a SlotId for later disconnect().
    SlotId connect(Slot slot) {
        auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock lock(mutex_);
        slots_.emplace(id, std::move(slot));
        return id;
    }

    /// Remove a previously registered callback. Unknown ids are ignored.
    void disconnect(SlotId id) {
        std::unique_lock lock(mutex_);
        slots_.erase(id);
    }

    void disconnectAll() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

    /// Invoke every registered slot with the given args.
    /// Slots run outside the lock on a snapshot, so a slot may connect or
    /// disconnect without deadlocking.
    void emit(Args... args) const {
        std::vector<Slot> snapshot;
        {
            std::shared_lock lock(mutex_);
            snapshot.reserve(slots_.size());
            for (const auto& [id, slot] : slots_) {
                snapshot.push_back(slot);
            }
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const {
        std::shared_lock lock(mutex_);
        return slots_.size();
    }

private:
    std::unordered_map<SlotId, Slot> slots_;
    std::atomic<SlotId> nextId_{1};
    mutable std::shared_mutex mutex_;
};

} // namespace duel::foundation
