#include "worker.hpp"
#include "logger.hpp"

Worker::Worker(const std::string& name, Clock& clock, Step step, ErrorHandler on_error)
    : name_(name)
    , clock_(clock)
    , step_(std::move(step))
    , on_error_(std::move(on_error)) {
}

Worker::~Worker() {
    join();
}

void Worker::start() {
    if (thread_.joinable()) {
        LOG_WARNING("Worker " + name_ + " already started");
        return;
    }
    running_ = true;
    thread_ = std::thread(&Worker::run, this);
}

void Worker::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void Worker::run() {
    LOG_DEBUG("Worker " + name_ + " started");

    while (!clock_.stop_requested()) {
        int64_t delay = 0;
        try {
            delay = step_();
            runs_++;
        } catch (const std::exception& e) {
            std::string msg = "Worker " + name_ + " error: " + std::string(e.what());
            LOG_ERROR(msg);
            if (on_error_) {
                on_error_(msg);
            }
            delay = ERROR_DELAY_MS;
        }

        if (delay < 0) {
            break;
        }
        if (!clock_.sleep_ms(delay)) {
            break;
        }
    }

    running_ = false;
    LOG_DEBUG("Worker " + name_ + " stopped");
}
