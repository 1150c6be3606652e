#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

// Re-armable rendezvous with a resizable party count. Each phase completes
// when every registered party has arrived (or deregistered); the phase
// number then advances and all waiters of that phase are released.
class Phase {
public:
    using Clock = std::chrono::steady_clock;

    explicit Phase(std::size_t parties);

    // Arrive without waiting; returns the phase number arrived at
    uint64_t arrive();

    // Arrive and permanently drop one party
    uint64_t arrive_and_deregister();

    uint64_t arrive_and_await_advance();

    // Block until the phase number moves past `phase`
    uint64_t await_advance(uint64_t phase);

    // Same, bounded by `deadline`. Returns false on timeout.
    bool await_advance_until(uint64_t phase, Clock::time_point deadline);

    void bulk_register(std::size_t parties);

    // Re-arm with a fresh party count; stale waiters are released
    void reset(std::size_t parties);

    std::size_t registered_parties() const;
    std::size_t unarrived_parties() const;
    uint64_t phase() const;

private:
    // Caller holds mutex_
    void arrive_locked();
    void advance_locked();

    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::size_t parties_;
    std::size_t unarrived_;
    uint64_t phase_ = 0;
};
