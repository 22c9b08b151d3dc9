#ifndef CLOCK_HPP
#define CLOCK_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>

// Time source shared by every loop. Sleeping is interruptible so a stop
// request wakes all waiting workers promptly.
class Clock {
public:
    virtual ~Clock() = default;

    virtual int64_t now_ms() const = 0;

    // Returns false if a stop was requested before the delay elapsed
    virtual bool sleep_ms(int64_t ms) = 0;

    virtual void request_stop() = 0;
    virtual bool stop_requested() const = 0;

    int64_t now() const { return now_ms() / 1000; }

    bool sleep_until_ms(int64_t epoch_ms) {
        int64_t delay = epoch_ms - now_ms();
        if (delay <= 0) {
            return !stop_requested();
        }
        return sleep_ms(delay);
    }

    bool sleep_until(int64_t epoch_seconds) { return sleep_until_ms(epoch_seconds * 1000); }
};

class SystemClock : public Clock {
public:
    int64_t now_ms() const override;
    bool sleep_ms(int64_t ms) override;
    void request_stop() override;
    bool stop_requested() const override { return stop_; }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stop_{false};
};

#endif // CLOCK_HPP
