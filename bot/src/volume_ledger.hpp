#ifndef VOLUME_LEDGER_HPP
#define VOLUME_LEDGER_HPP

#include <string>
#include <map>
#include <mutex>
#include <cstdint>

// Per-symbol executed volume for the current calendar day
class DailyVolumeLedger {
public:
    explicit DailyVolumeLedger(int64_t cap_per_symbol);

    // Atomically checks the cap and books `size`. Returns false, booking
    // nothing, if the symbol would exceed the cap.
    bool reserve(const std::string& symbol, int64_t size);

    // Returns a reservation whose order was never filled
    void release(const std::string& symbol, int64_t size);

    void reset();

    int64_t volume(const std::string& symbol) const;
    int64_t remaining(const std::string& symbol) const;
    int64_t cap() const { return cap_; }

private:
    int64_t cap_;
    mutable std::mutex mutex_;
    std::map<std::string, int64_t> volumes_;
};

#endif // VOLUME_LEDGER_HPP
