#include "FlexibleBarrier.hpp"
#include "LogUtils.hpp"
#include "TimeUtils.hpp"
#include <chrono>
#include <stdexcept>

FlexibleBarrier::FlexibleBarrier(WorkerRoster& roster)
    : roster_(roster),
      primary_(roster.size()),
      secondary_(roster.size()) {
    if (roster.size() == 0) {
        throw std::invalid_argument("FlexibleBarrier: roster has no workers");
    }
}

int FlexibleBarrier::await() {
    return await(WAIT_FOREVER);
}

int FlexibleBarrier::await(long timeout_ms) {
    WorkerContext* worker = WorkerContext::current();
    if (worker == nullptr) {
        throw std::logic_error("FlexibleBarrier::await called outside of a worker thread");
    }

    if (roster_.failed().contains(*worker)) {
        LogUtils::debug("Failed worker {} reached a barrier and has been terminated", worker->name());
        throw WorkerTerminated(worker->name());
    }

    if (timeout_ms == 0) {
        return NO_POSITION;
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        // A timeout may have failed this worker after the check above
        if (roster_.failed().contains(*worker)) {
            throw WorkerTerminated(worker->name());
        }
        arrived_.insert(worker);
        pending_++;
        LogUtils::trace("registered {}", worker->name());
    }

    const uint64_t phase = primary_.arrive();

    const auto deadline = timeout_ms < 0
        ? std::nullopt
        : TimeUtils::deadline_after<Phase::Clock>(std::chrono::milliseconds(timeout_ms));
    if (!deadline) {
        primary_.await_advance(phase);
    } else if (!primary_.await_advance_until(phase, *deadline)) {
        on_timeout();
    }

    const int order = primary_order_.fetch_add(1);

    if (pending_.fetch_sub(1) == 1) {
        // Last registered worker past the primary phase closes the cycle
        secondary_order_.store(0);
        std::unique_lock<std::shared_mutex> lock(mutex_);
        unlock_locked();
        clear_cycle_locked();
    }

    secondary_.arrive_and_await_advance();

    if (secondary_order_.fetch_add(1) == 0) {
        primary_order_.store(0);
    }

    LogUtils::debug("free {} as order {}", worker->name(), order);
    return order;
}

void FlexibleBarrier::on_timeout() {
    if (timedout_.load()) {
        return;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!timedout_.load()) {
        timedout_.store(true);
        LogUtils::warn("Barrier timed out with {} of {} workers arrived",
                       arrived_.size(), primary_.registered_parties());
        unlock_locked();
    }
}

void FlexibleBarrier::unlock_locked() {
    for (const auto& worker : roster_.workers()) {
        if (arrived_.count(worker.get()) != 0) {
            continue;
        }
        if (roster_.failed().contains(*worker)) {
            continue;
        }
        if (!roster_.failed().insert(*worker)) {
            continue;
        }

        LogUtils::warn("Worker {} did not reach the barrier, marking it failed", worker->name());
        dec();
        roster_.terminate(*worker);
    }
}

void FlexibleBarrier::clear_cycle_locked() {
    arrived_.clear();
    timedout_.store(false);
}

void FlexibleBarrier::dec() {
    primary_.arrive_and_deregister();
    secondary_.arrive_and_deregister();
}

bool FlexibleBarrier::remove(WorkerContext& worker) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!roster_.failed().insert(worker)) {
        return false;
    }
    LogUtils::warn("Worker {} failed, dropping it from the barrier", worker.name());
    dec();
    return true;
}

void FlexibleBarrier::rearm_locked(std::size_t parties) {
    clear_cycle_locked();
    primary_order_.store(0);
    secondary_order_.store(0);
    pending_.store(0);
    primary_.reset(parties);
    secondary_.reset(parties);
}

void FlexibleBarrier::reset() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    rearm_locked(primary_.registered_parties());
}

void FlexibleBarrier::refresh() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    roster_.revive_all();
    rearm_locked(roster_.size());
}

std::size_t FlexibleBarrier::arrived_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return arrived_.size();
}
