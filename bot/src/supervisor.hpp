#ifndef SUPERVISOR_HPP
#define SUPERVISOR_HPP

#include "api_client.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "health.hpp"
#include "notifier.hpp"
#include "order_executor.hpp"
#include "position_book.hpp"
#include "position_monitor.hpp"
#include "trade_journal.hpp"
#include "trade_scheduler.hpp"
#include "volume_ledger.hpp"
#include "worker.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct SupervisorSettings {
    std::string trade_plan_file = "trades.csv";
    std::string kill_switch_file = "KILL_SWITCH";
    int eod_cutoff_hour = 19;
    std::optional<int> auto_restart_hour;
    int64_t health_interval_ms = 6 * 60 * 60 * 1000LL;
    int64_t kill_switch_poll_ms = 5000;
    int64_t idle_plan_delay_ms = 60 * 60 * 1000LL;   // Retry when the plan has no entries
    int64_t plan_lead_seconds = 60;                  // Reload the plan this long before the first entry
    double memory_warning_mb = 100.0;

    // Echoed in the trading-day summary
    double leverage = 10.0;
    bool autolot = true;
    double stop_loss_pips = 0.0;
    double take_profit_pips = 0.0;
    int64_t sweep_interval_minutes = 10;
    int64_t jitter_seconds = 3;
    std::string account_currency = "JPY";

    static SupervisorSettings from_config(const Config& config);
};

// Owns the background workers and the process lifecycle
class Supervisor {
public:
    Supervisor(SignedApiClient& client, OrderExecutor& executor, PositionMonitor& monitor,
               TradeScheduler& scheduler, TradeJournal& journal, DailyVolumeLedger& ledger,
               PositionBook& book, HealthChecker& health, RestartGuard& restart_guard,
               Restarter& restarter, Notifier& notifier, Clock& clock, const SupervisorSettings& settings);
    ~Supervisor();

    // Starts every worker
    void start();

    // Blocks until every worker has stopped
    void wait();

    // Wakes and stops every worker without touching positions
    void stop();

    // Close all positions then stop. Failures to close are reported once.
    void full_stop(const std::string& reason);

    // Close all positions and keep running
    CloseAllResult emergency_close(const std::string& reason);

    // Guarded restart. Returns false when refused or when the restart failed.
    bool auto_restart(const std::string& reason);

    // Worker steps, returning the delay in ms until the next run
    int64_t trading_step();
    int64_t eod_step();
    int64_t volume_reset_step();
    int64_t health_step();
    int64_t daily_restart_step();
    int64_t kill_switch_step();

    std::string status_report() const;
    std::string performance_report() const;
    std::string positions_report();
    std::string health_report();

    bool halted() const { return halted_; }
    int64_t uptime_seconds() const;
    size_t worker_count() const { return workers_.size(); }

private:
    void add_worker(const std::string& name, Worker::Step step);
    void notify_plan_summary(const std::vector<TradePlanEntry>& entries);
    int64_t delay_until(int64_t epoch_seconds) const;

    SignedApiClient& client_;
    OrderExecutor& executor_;
    PositionMonitor& monitor_;
    TradeScheduler& scheduler_;
    TradeJournal& journal_;
    DailyVolumeLedger& ledger_;
    PositionBook& book_;
    HealthChecker& health_;
    RestartGuard& restart_guard_;
    Restarter& restarter_;
    Notifier& notifier_;
    Clock& clock_;
    SupervisorSettings settings_;

    int64_t started_at_;
    std::atomic<bool> halted_{false};
    std::atomic<bool> stopping_{false};
    std::mutex stop_mutex_;

    int64_t next_eod_ = 0;
    int64_t next_volume_reset_ = 0;
    int64_t next_health_ = 0;
    int64_t next_daily_restart_ = 0;

    std::vector<std::unique_ptr<Worker>> workers_;
};

#endif // SUPERVISOR_HPP
