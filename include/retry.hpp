#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include "logger.hpp"
#include "protocol/errors.hpp"

namespace retry {

// Fixed attempt count, fixed delay. Wraps a whole connect-through-transfer
// sequence, never a single step of it: a half-sent header cannot be resumed.
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    static constexpr int DEFAULT_MAX_ATTEMPTS = 3;
    static constexpr std::chrono::milliseconds DEFAULT_DELAY{5000};

    RetryPolicy(int max_attempts = DEFAULT_MAX_ATTEMPTS, std::chrono::milliseconds delay = DEFAULT_DELAY,
                Sleeper sleeper = nullptr);

    // Once the flag is set no further attempt starts and a pending delay is
    // cut short; the failure in hand is rethrown.
    void set_cancel_flag(const std::atomic<bool>* cancel_flag) { cancel_flag_ = cancel_flag; }

    int max_attempts() const { return max_attempts_; }
    std::chrono::milliseconds delay() const { return delay_; }

    // Runs op until it returns or fails with something not worth retrying.
    // The last failure is rethrown once attempts run out.
    template <typename Op>
    auto run(Op&& op, logging::Logger& logger, const std::string& label) const -> decltype(op()) {
        for (int attempt = 1;; ++attempt) {
            try {
                return op();
            } catch (const protocol::TransferError& e) {
                if (cancelled()) {
                    logger.warn(label + " interrupted: " + e.what());
                    throw;
                }
                if (!is_retryable(e)) {
                    logger.error(label + " failed: " + e.what());
                    throw;
                }
                if (attempt >= max_attempts_) {
                    logger.error(label + " failed after " + std::to_string(max_attempts_) + " attempts: " + e.what());
                    throw;
                }
                logger.warn(label + " attempt " + std::to_string(attempt) + " failed, retrying in " +
                            std::to_string(delay_.count()) + " ms: " + e.what());
                if (!wait_before_retry()) {
                    logger.warn(label + " interrupted while waiting to retry");
                    throw;
                }
            }
        }
    }

    // ConnectError, ConnectionLost and both timeouts are transient. A malformed
    // header or a local cancel is not.
    static bool is_retryable(const protocol::TransferError& error);

private:
    bool cancelled() const { return cancel_flag_ && cancel_flag_->load(); }
    // Returns false if cancelled before the delay ran out.
    bool wait_before_retry() const;

    int max_attempts_;
    std::chrono::milliseconds delay_;
    Sleeper sleeper_;
    const std::atomic<bool>* cancel_flag_ = nullptr;
};

} // namespace retry
