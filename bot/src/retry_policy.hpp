#ifndef RETRY_POLICY_HPP
#define RETRY_POLICY_HPP

#include <cstdint>

// Attempt budget plus the delay between attempts. Every retry loop in the
// bot is described by one of these.
struct RetryPolicy {
    int max_attempts = 3;
    int64_t base_delay_ms = 1000;
    int64_t max_delay_ms = 60000;
    int64_t jitter_ms = 1000;      // Uniform [0, jitter_ms] added to each delay
    bool exponential = true;

    // Delay after failed attempt number `attempt` (0-based)
    int64_t delay_for(int attempt) const;

    static RetryPolicy fixed(int max_attempts, int64_t interval_ms);
    static RetryPolicy exponential_backoff(int max_attempts, int64_t base_delay_ms,
                                           int64_t max_delay_ms, int64_t jitter_ms);
};

#endif // RETRY_POLICY_HPP
