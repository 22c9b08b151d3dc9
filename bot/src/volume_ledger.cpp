#include "volume_ledger.hpp"
#include "logger.hpp"
#include <algorithm>

DailyVolumeLedger::DailyVolumeLedger(int64_t cap_per_symbol)
    : cap_(cap_per_symbol) {
}

bool DailyVolumeLedger::reserve(const std::string& symbol, int64_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t current = volumes_[symbol];
    if (size <= 0 || current + size > cap_) {
        LOG_WARNING("Daily volume cap reached for " + symbol + ": " + std::to_string(current) +
                    " + " + std::to_string(size) + " > " + std::to_string(cap_));
        return false;
    }
    volumes_[symbol] = current + size;
    return true;
}

void DailyVolumeLedger::release(const std::string& symbol, int64_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = volumes_.find(symbol);
    if (it == volumes_.end()) {
        return;
    }
    it->second = std::max<int64_t>(0, it->second - size);
}

void DailyVolumeLedger::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    volumes_.clear();
    LOG_INFO("Daily volume ledger reset");
}

int64_t DailyVolumeLedger::volume(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = volumes_.find(symbol);
    return it == volumes_.end() ? 0 : it->second;
}

int64_t DailyVolumeLedger::remaining(const std::string& symbol) const {
    return cap_ - volume(symbol);
}
