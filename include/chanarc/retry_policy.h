#ifndef CHANARC_RETRY_POLICY_H_
#define CHANARC_RETRY_POLICY_H_

#include "constants.h"
#include <chrono>
#include <cstdint>

namespace chanarc {

// ============================================================================
// Sleeper - blocking wait, replaceable in tests
// ============================================================================

class ISleeper {
public:
    virtual ~ISleeper() = default;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

/// Sleeps the calling thread
class ThreadSleeper : public ISleeper {
public:
    void sleepFor(std::chrono::milliseconds duration) override;
};

// ============================================================================
// Retry Policy - capped exponential backoff with bounded attempts
// ============================================================================

struct RetryConfig {
    std::chrono::milliseconds initial_backoff{kDefaultInitialBackoffMs};
    std::chrono::milliseconds max_backoff{kDefaultMaxBackoffMs};
    uint32_t max_attempts = kDefaultMaxAttempts;   // retries before FATAL
};

class RetryPolicy {
public:
    explicit RetryPolicy(const RetryConfig& config = RetryConfig());

    /// Backoff before retry number `attempt` (0-based): initial * 2^attempt, capped
    std::chrono::milliseconds backoffFor(uint32_t attempt) const;

    /// Wait before retrying a rate-limited request; never shorter than retry_after
    std::chrono::milliseconds rateLimitDelay(uint32_t attempt,
                                             std::chrono::milliseconds retry_after) const;

    /// True once `attempts` consecutive failures exhaust the budget
    bool exhausted(uint32_t attempts) const { return attempts >= config_.max_attempts; }

    const RetryConfig& getConfig() const { return config_; }

private:
    RetryConfig config_;
};

}  // namespace chanarc

#endif  // CHANARC_RETRY_POLICY_H_
