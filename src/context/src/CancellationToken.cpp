#include "CancellationToken.hpp"
#include "TimeUtils.hpp"

CancellationToken::CancellationToken(std::string owner) : owner_(std::move(owner)) {}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cond_.notify_all();
}

void CancellationToken::throw_if_cancelled() const {
    if (cancelled_.load()) {
        throw WorkerTerminated(owner_);
    }
}

void CancellationToken::sleep_for(std::chrono::milliseconds duration) {
    const auto deadline = TimeUtils::deadline_after<std::chrono::steady_clock>(duration);
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto cancelled = [this] { return cancelled_.load(); };
        if (deadline) {
            cond_.wait_until(lock, *deadline, cancelled);
        } else {
            cond_.wait(lock, cancelled);
        }
    }
    throw_if_cancelled();
}

void CancellationToken::rearm() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_.store(false);
}
