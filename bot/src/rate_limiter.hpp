#ifndef RATE_LIMITER_HPP
#define RATE_LIMITER_HPP

#include "clock.hpp"
#include <string>
#include <map>
#include <mutex>
#include <cstdint>

// Adaptive per-method request pacing. The effective limit shrinks by `step`
// every `throttle_threshold` consecutive throttle signals and recovers one
// request/second per success once the throttle streak has drained to zero.
class RateLimiter {
public:
    struct Options {
        int ceiling = 20;               // requests per second
        int floor = 5;
        int step = 5;
        int throttle_threshold = 3;
        int64_t post_jitter_ms = 100;
        int64_t get_jitter_ms = 50;
    };

    explicit RateLimiter(Clock& clock);
    RateLimiter(Clock& clock, const Options& options);

    // Blocks until `method` may issue its next request. Returns false if the
    // clock was stopped while waiting.
    bool acquire(const std::string& method);

    void on_throttle();
    void on_success();

    int current_limit() const;
    int consecutive_throttle_errors() const;
    int ceiling() const { return options_.ceiling; }
    int floor() const { return options_.floor; }

private:
    Clock& clock_;
    Options options_;

    mutable std::mutex mutex_;
    int current_limit_;
    int consecutive_errors_ = 0;
    std::map<std::string, int64_t> next_slot_ms_;
};

#endif // RATE_LIMITER_HPP
