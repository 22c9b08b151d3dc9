#ifndef WORKER_HPP
#define WORKER_HPP

#include "clock.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

// One long-lived background loop. The step returns the delay in ms until
// its next run; a negative delay ends the loop.
class Worker {
public:
    using Step = std::function<int64_t()>;
    using ErrorHandler = std::function<void(const std::string&)>;

    static constexpr int64_t ERROR_DELAY_MS = 60 * 1000;

    Worker(const std::string& name, Clock& clock, Step step, ErrorHandler on_error = nullptr);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    void start();
    void join();

    bool running() const { return running_; }
    int64_t runs() const { return runs_; }
    const std::string& name() const { return name_; }

private:
    void run();

    std::string name_;
    Clock& clock_;
    Step step_;
    ErrorHandler on_error_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<int64_t> runs_{0};
};

#endif // WORKER_HPP
