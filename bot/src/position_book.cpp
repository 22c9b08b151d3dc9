#include "position_book.hpp"
#include "logger.hpp"

std::string exit_path_to_string(ExitPath path) {
    switch (path) {
        case ExitPath::SCHEDULED:   return "SCHEDULED";
        case ExitPath::STOP_LOSS:   return "STOP_LOSS";
        case ExitPath::TAKE_PROFIT: return "TAKE_PROFIT";
        case ExitPath::SWEEP:       return "SWEEP";
        case ExitPath::WATCHDOG:    return "WATCHDOG";
        case ExitPath::KILL:        return "KILL";
        default:                    return "UNKNOWN";
    }
}

void PositionBook::track(const TrackedPosition& tracked) {
    std::lock_guard<std::mutex> lock(mutex_);
    tracked_[tracked.position.position_id] = tracked;
}

bool PositionBook::is_tracked(const std::string& position_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracked_.count(position_id) > 0;
}

std::vector<TrackedPosition> PositionBook::tracked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TrackedPosition> out;
    for (const auto& [id, t] : tracked_) {
        out.push_back(t);
    }
    return out;
}

std::optional<TrackedPosition> PositionBook::find(const std::string& position_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tracked_.find(position_id);
    if (it == tracked_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PositionBook::claim(const std::string& position_id, ExitPath path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_.count(position_id) > 0) {
        LOG_DEBUG("Position " + position_id + " already closed, refusing " + exit_path_to_string(path));
        return false;
    }
    auto it = claims_.find(position_id);
    if (it != claims_.end()) {
        LOG_DEBUG("Position " + position_id + " already claimed by " + exit_path_to_string(it->second) +
                  ", refusing " + exit_path_to_string(path));
        return false;
    }
    claims_[position_id] = path;
    return true;
}

std::optional<ExitPath> PositionBook::claim_of(const std::string& position_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = claims_.find(position_id);
    if (it == claims_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void PositionBook::release_claim(const std::string& position_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    claims_.erase(position_id);
}

void PositionBook::complete(const std::string& position_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    tracked_.erase(position_id);
    claims_.erase(position_id);
    closed_.insert(position_id);
}

bool PositionBook::is_closed(const std::string& position_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_.count(position_id) > 0;
}

void PositionBook::begin_pending(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_[symbol]++;
}

void PositionBook::end_pending(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(symbol);
    if (it == pending_.end()) {
        return;
    }
    if (--it->second <= 0) {
        pending_.erase(it);
    }
}

bool PositionBook::has_pending(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(symbol) > 0;
}

size_t PositionBook::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracked_.size();
}
