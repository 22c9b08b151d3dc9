#include "retry_policy.hpp"
#include "util.hpp"
#include <algorithm>

int64_t RetryPolicy::delay_for(int attempt) const {
    int64_t delay = base_delay_ms;
    if (exponential) {
        int shift = std::min(std::max(attempt, 0), 30);
        delay = base_delay_ms * (int64_t{1} << shift);
    }
    delay += util::random_jitter_ms(jitter_ms);
    return std::min(delay, max_delay_ms);
}

RetryPolicy RetryPolicy::fixed(int max_attempts, int64_t interval_ms) {
    RetryPolicy policy;
    policy.max_attempts = max_attempts;
    policy.base_delay_ms = interval_ms;
    policy.max_delay_ms = interval_ms;
    policy.jitter_ms = 0;
    policy.exponential = false;
    return policy;
}

RetryPolicy RetryPolicy::exponential_backoff(int max_attempts, int64_t base_delay_ms,
                                             int64_t max_delay_ms, int64_t jitter_ms) {
    RetryPolicy policy;
    policy.max_attempts = max_attempts;
    policy.base_delay_ms = base_delay_ms;
    policy.max_delay_ms = max_delay_ms;
    policy.jitter_ms = jitter_ms;
    policy.exponential = true;
    return policy;
}
