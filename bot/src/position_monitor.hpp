#ifndef POSITION_MONITOR_HPP
#define POSITION_MONITOR_HPP

#include "api_client.hpp"
#include "clock.hpp"
#include "notifier.hpp"
#include "order_executor.hpp"
#include "position_book.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Period during which a plan entry may legitimately hold a position
struct TradingWindow {
    std::string symbol;   // Empty matches every symbol
    int64_t start = 0;    // epoch seconds, inclusive
    int64_t end = 0;      // epoch seconds, inclusive
    std::string entry_key;
};

struct MonitorSettings {
    double stop_loss_pips = 0.0;      // 0 disables
    double take_profit_pips = 0.0;    // 0 disables
    int64_t check_interval_ms = 5000;
    int64_t sweep_interval_ms = 10 * 60 * 1000;
    // Tracked positions still open this long after their scheduled exit are swept
    int64_t overdue_grace_seconds = 600;

    static MonitorSettings from_config(const Config& config);
};

class PositionMonitor {
public:
    PositionMonitor(SignedApiClient& client, OrderExecutor& executor, PositionBook& book,
                    Notifier& notifier, Clock& clock, const MonitorSettings& settings);
    ~PositionMonitor();

    // Unrealized pips: bid for BUY, ask for SELL, against entry
    static double current_pips(const Position& position, const Quote& quote);

    // STOP_LOSS / TAKE_PROFIT when a configured threshold is breached
    std::optional<ExitPath> evaluate(const Position& position, const Quote& quote) const;

    // One stop-loss/take-profit pass over tracked positions. Returns closes issued.
    int check_once();

    void set_windows(const std::vector<TradingWindow>& windows);
    bool in_window(const std::string& symbol, int64_t at) const;
    // Like in_window, ignoring the windows of `entry_key`
    bool in_other_window(const std::string& symbol, int64_t at, const std::string& entry_key) const;

    // Force-closes untracked positions outside every window, and tracked ones
    // left open past their scheduled exit. Returns closes issued.
    int sweep_once();

    // Polls `symbol` until `deadline`, closing any untracked position it finds.
    // Polls are skipped while an entry on `symbol` is in flight or another
    // entry's window is open. Returns true if one was found.
    bool watch_symbol(const std::string& symbol, int64_t deadline, const std::string& owner_key = "");

    // Runs watch_symbol on a background thread
    void start_watchdog(const std::string& symbol, int64_t deadline, const std::string& owner_key = "");
    void join_watchdogs();
    // Watchdogs still running; finished ones are joined first
    size_t watchdog_count();

    // Worker steps, returning the delay until the next run
    int64_t monitor_step();
    int64_t sweep_step();

    const MonitorSettings& settings() const { return settings_; }

private:
    SignedApiClient& client_;
    OrderExecutor& executor_;
    PositionBook& book_;
    Notifier& notifier_;
    Clock& clock_;
    MonitorSettings settings_;

    mutable std::mutex windows_mutex_;
    std::vector<TradingWindow> windows_;

    struct Watchdog {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Joins watchdogs that have finished. Caller holds watchdog_mutex_.
    void reap_watchdogs();

    std::mutex watchdog_mutex_;
    std::vector<Watchdog> watchdogs_;
};

#endif // POSITION_MONITOR_HPP
