#pragma once
#include <atomic>
#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <unordered_set>
#include "Phase.hpp"
#include "WorkerRoster.hpp"

// Reusable checkpoint for the workers of a run. A cycle releases once every
// live worker has arrived, or once a waiter's timeout fires, in which case
// every worker that has not arrived is failed, dropped from the party count
// and terminated. Failed workers never hold up later cycles.
//
// Two phases back each cycle: `primary_` is the rendezvous itself and
// `secondary_` drains the cycle so that no worker enters the next one while
// another is still leaving this one.
class FlexibleBarrier {
public:
    static constexpr int NO_POSITION = -1;
    static constexpr long WAIT_FOREVER = -1;

    explicit FlexibleBarrier(WorkerRoster& roster);

    FlexibleBarrier(const FlexibleBarrier&) = delete;
    FlexibleBarrier& operator=(const FlexibleBarrier&) = delete;

    // Returns the caller's arrival order within the cycle, or NO_POSITION
    // when `timeout_ms` is 0. Throws WorkerTerminated when the calling worker
    // has already been failed, std::logic_error outside of a worker thread.
    int await();
    int await(long timeout_ms);

    // Drops one party from both phases for good
    void dec();

    // External failure path: fails `worker` and drops its party, unless it
    // was already failed. Returns whether this call failed it.
    bool remove(WorkerContext& worker);

    // Re-arms both phases at the current, possibly reduced, party count
    void reset();

    // Back to the full roster size with no failures, for a new run
    void refresh();

    std::size_t parties() const { return primary_.registered_parties(); }
    std::size_t arrived_count() const;
    bool timed_out() const { return timedout_.load(); }

private:
    void on_timeout();

    // Fails every roster worker that has neither arrived nor failed yet.
    // Caller holds mutex_.
    void unlock_locked();

    void clear_cycle_locked();
    void rearm_locked(std::size_t parties);

    WorkerRoster& roster_;
    Phase primary_;
    Phase secondary_;

    // Exclusive for registration and the unlock procedure, shared for observers
    mutable std::shared_mutex mutex_;
    std::unordered_set<const WorkerContext*> arrived_;
    std::atomic<int> primary_order_{0};
    std::atomic<int> secondary_order_{0};
    // Registrations of the current cycle not yet past the primary phase
    std::atomic<std::size_t> pending_{0};
    std::atomic<bool> timedout_{false};
};
