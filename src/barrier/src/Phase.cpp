#include "Phase.hpp"
#include <stdexcept>

Phase::Phase(std::size_t parties) : parties_(parties), unarrived_(parties) {}

void Phase::arrive_locked() {
    if (unarrived_ == 0) {
        throw std::logic_error("Phase: arrival of an unregistered party");
    }
    if (--unarrived_ == 0) {
        advance_locked();
    }
}

void Phase::advance_locked() {
    phase_++;
    unarrived_ = parties_;
    cond_.notify_all();
}

uint64_t Phase::arrive() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto current = phase_;
    arrive_locked();
    return current;
}

uint64_t Phase::arrive_and_deregister() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto current = phase_;
    if (parties_ == 0) {
        return current;
    }
    parties_--;
    arrive_locked();
    return current;
}

uint64_t Phase::arrive_and_await_advance() {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto current = phase_;
    arrive_locked();
    cond_.wait(lock, [this, current] { return phase_ != current; });
    return phase_;
}

uint64_t Phase::await_advance(uint64_t phase) {
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this, phase] { return phase_ != phase; });
    return phase_;
}

bool Phase::await_advance_until(uint64_t phase, Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    // The predicate form re-checks after spurious wake-ups against the same deadline
    return cond_.wait_until(lock, deadline, [this, phase] { return phase_ != phase; });
}

void Phase::bulk_register(std::size_t parties) {
    std::lock_guard<std::mutex> lock(mutex_);
    parties_ += parties;
    unarrived_ += parties;
}

void Phase::reset(std::size_t parties) {
    std::lock_guard<std::mutex> lock(mutex_);
    parties_ = parties;
    phase_++;
    unarrived_ = parties_;
    cond_.notify_all();
}

std::size_t Phase::registered_parties() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return parties_;
}

std::size_t Phase::unarrived_parties() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unarrived_;
}

uint64_t Phase::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}
