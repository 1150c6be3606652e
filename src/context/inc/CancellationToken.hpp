#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>

// Thrown inside a worker's own thread to unwind it once the worker has been
// force-failed. Only the runner that owns the thread catches it.
class WorkerTerminated : public std::runtime_error {
public:
    explicit WorkerTerminated(const std::string& worker)
        : std::runtime_error("Worker terminated: " + worker), worker_(worker) {}

    const std::string& worker() const { return worker_; }

private:
    std::string worker_;
};

// Non-cooperative stop request for one worker. The worker observes it at its
// safe points: barrier entry, interruptible sleeps and explicit checks.
class CancellationToken {
public:
    explicit CancellationToken(std::string owner);

    void cancel();
    bool is_cancelled() const { return cancelled_.load(); }
    void throw_if_cancelled() const;

    // Sleeps for `duration` unless cancelled first, then throws WorkerTerminated
    void sleep_for(std::chrono::milliseconds duration);

    // Clears a previous cancellation so the worker can take part in a new run
    void rearm();

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

private:
    const std::string owner_;
    std::mutex mutex_;
    std::condition_variable cond_;
    std::atomic<bool> cancelled_{false};
};
