#ifndef TRADE_SCHEDULER_HPP
#define TRADE_SCHEDULER_HPP

#include "api_client.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "notifier.hpp"
#include "order_executor.hpp"
#include "position_book.hpp"
#include "position_monitor.hpp"
#include "result_export.hpp"
#include "trade_journal.hpp"
#include "trade_plan.hpp"
#include <atomic>
#include <string>
#include <vector>

struct SchedulerSettings {
    int64_t jitter_seconds = 3;
    int64_t check_interval_ms = 5000;
    int eod_cutoff_hour = 19;
    int64_t watchdog_grace_seconds = 600;
    std::string results_dir = "daily_results";
    std::string account_currency = "JPY";

    static SchedulerSettings from_config(const Config& config);
};

struct EntryRunResult {
    bool entered = false;
    bool skipped = false;
    bool closed = false;          // Closed by the scheduled exit or an earlier SL/TP
    std::string error;
};

class TradeScheduler {
public:
    TradeScheduler(OrderExecutor& executor, PositionMonitor& monitor, PositionBook& book,
                   TradeJournal& journal, SignedApiClient& client, Notifier& notifier,
                   Clock& clock, const SchedulerSettings& settings);

    // Resolves the plan against the clock and the previous cycle's last exit,
    // then records this cycle's last exit
    std::vector<TradePlanEntry> resolve_day(const std::vector<PlanRow>& rows);

    // Trading windows for the unscheduled-position sweep
    std::vector<TradingWindow> windows_for(const std::vector<TradePlanEntry>& entries) const;

    // Entry at entry_time - U(0, jitter), hold, then exit at exit_time - U(0, jitter)
    EntryRunResult run_entry(const TradePlanEntry& entry);

    // Runs entries in order. Returns the number that were entered.
    int run_day(const std::vector<TradePlanEntry>& entries);

    // Aggregates results closed before the cutoff on `day`'s date, exports and reports them
    DailySummary finalize_day(int64_t day);

    static std::string entry_key(const TradePlanEntry& entry);

    int64_t last_exit_time() const { return last_exit_; }
    void set_last_exit_time(int64_t t) { last_exit_ = t; }

    const SchedulerSettings& settings() const { return settings_; }

private:
    int64_t jitter_ms() const;

    OrderExecutor& executor_;
    PositionMonitor& monitor_;
    PositionBook& book_;
    TradeJournal& journal_;
    SignedApiClient& client_;
    Notifier& notifier_;
    Clock& clock_;
    SchedulerSettings settings_;

    std::atomic<int64_t> last_exit_{0};
};

#endif // TRADE_SCHEDULER_HPP
