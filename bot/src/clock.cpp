#include "clock.hpp"
#include "util.hpp"
#include <chrono>

int64_t SystemClock::now_ms() const {
    return util::now_epoch_ms();
}

bool SystemClock::sleep_ms(int64_t ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (ms > 0) {
        cv_.wait_for(lock, std::chrono::milliseconds(ms), [this] { return stop_.load(); });
    }
    return !stop_;
}

void SystemClock::request_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
}
