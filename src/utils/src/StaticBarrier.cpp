#include "StaticBarrier.hpp"
#include <stdexcept>

StaticBarrier::StaticBarrier(std::size_t parties)
    : threshold_(parties), count_(parties), generation_(0) {
    if (parties == 0) {
        throw std::invalid_argument("StaticBarrier: party count must be positive");
    }
}

std::size_t StaticBarrier::arrive() {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto gen = generation_;
    if (--count_ == 0) {
        generation_++;
        count_ = threshold_;
        cond_.notify_all();
    } else {
        cond_.wait(lock, [this, gen] { return gen != generation_; });
    }
    return gen;
}
