#include "retry.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace retry {

RetryPolicy::RetryPolicy(int max_attempts, std::chrono::milliseconds delay, Sleeper sleeper)
    : max_attempts_(max_attempts), delay_(delay), sleeper_(std::move(sleeper)) {
    if (max_attempts_ < 1) {
        throw std::invalid_argument("max_attempts must be at least 1");
    }
    if (delay_.count() < 0) {
        throw std::invalid_argument("retry delay must not be negative");
    }
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

bool RetryPolicy::wait_before_retry() const {
    if (!cancel_flag_) {
        sleeper_(delay_);
        return true;
    }
    // Sleep in slices so an interrupt is noticed promptly.
    constexpr std::chrono::milliseconds slice{100};
    std::chrono::milliseconds remaining = delay_;
    while (remaining.count() > 0) {
        if (cancelled()) {
            return false;
        }
        std::chrono::milliseconds step = std::min(slice, remaining);
        sleeper_(step);
        remaining -= step;
    }
    return !cancelled();
}

bool RetryPolicy::is_retryable(const protocol::TransferError& error) {
    return dynamic_cast<const protocol::ConnectError*>(&error) != nullptr ||
           dynamic_cast<const protocol::ConnectionLost*>(&error) != nullptr ||
           dynamic_cast<const protocol::IoTimeout*>(&error) != nullptr;
}

} // namespace retry
