#include "chanarc/retry_policy.h"
#include <algorithm>
#include <thread>

namespace chanarc {

void ThreadSleeper::sleepFor(std::chrono::milliseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

RetryPolicy::RetryPolicy(const RetryConfig& config)
    : config_(config) {
    if (config_.max_backoff < config_.initial_backoff) {
        config_.max_backoff = config_.initial_backoff;
    }
}

std::chrono::milliseconds RetryPolicy::backoffFor(uint32_t attempt) const {
    std::chrono::milliseconds delay = config_.initial_backoff;
    for (uint32_t i = 0; i < attempt; i++) {
        if (delay >= config_.max_backoff / 2) {
            return config_.max_backoff;
        }
        delay *= 2;
    }
    return std::min(delay, config_.max_backoff);
}

std::chrono::milliseconds RetryPolicy::rateLimitDelay(uint32_t attempt,
                                                      std::chrono::milliseconds retry_after) const {
    // The platform's value wins when given; backoff only covers a missing hint
    if (retry_after.count() > 0) {
        return retry_after;
    }
    return backoffFor(attempt);
}

}  // namespace chanarc
