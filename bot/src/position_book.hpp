#ifndef POSITION_BOOK_HPP
#define POSITION_BOOK_HPP

#include "trade_types.hpp"
#include <string>
#include <map>
#include <set>
#include <vector>
#include <mutex>
#include <optional>
#include <cstdint>

enum class ExitPath {
    SCHEDULED,
    STOP_LOSS,
    TAKE_PROFIT,
    SWEEP,
    WATCHDOG,
    KILL
};

std::string exit_path_to_string(ExitPath path);

struct TrackedPosition {
    Position position;
    std::string entry_key;            // Empty for positions the plan never opened
    int plan_index = 0;
    int64_t entry_time = 0;           // epoch seconds
    int64_t scheduled_exit = 0;       // epoch seconds
};

// Registry of positions the scheduler owns. Every exit path goes through
// claim(); the first claim for a position wins and all later ones are refused.
class PositionBook {
public:
    void track(const TrackedPosition& tracked);

    bool is_tracked(const std::string& position_id) const;
    std::vector<TrackedPosition> tracked() const;
    std::optional<TrackedPosition> find(const std::string& position_id) const;

    bool claim(const std::string& position_id, ExitPath path);
    std::optional<ExitPath> claim_of(const std::string& position_id) const;

    // Drops the claim so another path may retry the close
    void release_claim(const std::string& position_id);

    // Closed for good: stop tracking; later claims are refused
    void complete(const std::string& position_id);
    bool is_closed(const std::string& position_id) const;

    // Entry orders in flight. Untracked positions on these symbols may
    // still belong to the plan.
    void begin_pending(const std::string& symbol);
    void end_pending(const std::string& symbol);
    bool has_pending(const std::string& symbol) const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, TrackedPosition> tracked_;
    std::map<std::string, ExitPath> claims_;
    std::set<std::string> closed_;
    std::map<std::string, int> pending_;
};

// Marks a symbol pending for the lifetime of one entry attempt
class PendingEntry {
public:
    PendingEntry(PositionBook& book, const std::string& symbol)
        : book_(book), symbol_(symbol) {
        book_.begin_pending(symbol_);
    }
    ~PendingEntry() { book_.end_pending(symbol_); }

    PendingEntry(const PendingEntry&) = delete;
    PendingEntry& operator=(const PendingEntry&) = delete;

private:
    PositionBook& book_;
    std::string symbol_;
};

#endif // POSITION_BOOK_HPP
