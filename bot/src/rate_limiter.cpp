#include "rate_limiter.hpp"
#include "logger.hpp"
#include "util.hpp"
#include <algorithm>

RateLimiter::RateLimiter(Clock& clock)
    : RateLimiter(clock, Options()) {
}

RateLimiter::RateLimiter(Clock& clock, const Options& options)
    : clock_(clock)
    , options_(options)
    , current_limit_(options.ceiling) {
}

bool RateLimiter::acquire(const std::string& method) {
    int64_t wait_until = 0;
    bool paced = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = clock_.now_ms();
        int64_t interval_ms = 1000 / std::max(current_limit_, 1);

        auto it = next_slot_ms_.find(method);
        if (it != next_slot_ms_.end() && it->second > now) {
            wait_until = it->second;
            paced = true;
        } else {
            wait_until = now;
        }
        // Reserve the slot so concurrent callers queue behind it
        next_slot_ms_[method] = wait_until + interval_ms;
    }

    if (!paced) {
        return !clock_.stop_requested();
    }

    int64_t jitter = util::random_jitter_ms(method == "POST" ? options_.post_jitter_ms : options_.get_jitter_ms);
    LOG_DEBUG("Rate limiting " + method + ": sleeping " +
              std::to_string(wait_until - clock_.now_ms() + jitter) + "ms");
    return clock_.sleep_until_ms(wait_until + jitter);
}

void RateLimiter::on_throttle() {
    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_errors_++;
    if (consecutive_errors_ % options_.throttle_threshold == 0) {
        int previous = current_limit_;
        current_limit_ = std::max(options_.floor, current_limit_ - options_.step);
        if (current_limit_ != previous) {
            LOG_WARNING("Rate limit lowered to " + std::to_string(current_limit_) + "/s after " +
                        std::to_string(consecutive_errors_) + " throttle errors");
        }
    }
}

void RateLimiter::on_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (consecutive_errors_ > 0) {
        consecutive_errors_--;
        return;
    }
    if (current_limit_ < options_.ceiling) {
        current_limit_++;
        LOG_DEBUG("Rate limit recovered to " + std::to_string(current_limit_) + "/s");
    }
}

int RateLimiter::current_limit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_limit_;
}

int RateLimiter::consecutive_throttle_errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_errors_;
}
