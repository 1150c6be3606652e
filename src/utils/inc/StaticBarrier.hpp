#pragma once
#include <mutex>
#include <condition_variable>
#include <cstddef>

// Fixed-size rendezvous: the last of `parties` arrivals releases everyone.
// Reusable, one generation per release. No timeout and no resizing, so it is
// only safe where no participant can fail before arriving.
class StaticBarrier {
public:
    explicit StaticBarrier(std::size_t parties);

    // Returns the generation the caller arrived in.
    std::size_t arrive();

    std::size_t parties() const { return threshold_; }

private:
    std::mutex mutex_;
    std::condition_variable cond_;
    const std::size_t threshold_;
    std::size_t count_;
    std::size_t generation_;
};
