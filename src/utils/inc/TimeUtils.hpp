#pragma once
#include <chrono>
#include <optional>

namespace TimeUtils {

// Absolute deadline `timeout` from now on `Clock`. Empty when the deadline
// lies past the clock's range, in which case callers wait without a bound.
template <typename Clock>
std::optional<typename Clock::time_point> deadline_after(std::chrono::milliseconds timeout) {
    const auto now = Clock::now();
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    if (timeout >= headroom) {
        return std::nullopt;
    }
    return now + timeout;
}

}
