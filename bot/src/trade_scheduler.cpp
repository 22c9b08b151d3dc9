#include "trade_scheduler.hpp"
#include "logger.hpp"
#include "util.hpp"
#include <algorithm>

SchedulerSettings SchedulerSettings::from_config(const Config& config) {
    SchedulerSettings s;
    s.jitter_seconds = config.jitter_seconds;
    s.check_interval_ms = config.position_check_interval * 1000;
    s.eod_cutoff_hour = config.eod_cutoff_hour;
    s.results_dir = config.results_dir;
    s.account_currency = config.account_currency;
    return s;
}

TradeScheduler::TradeScheduler(OrderExecutor& executor, PositionMonitor& monitor, PositionBook& book,
                               TradeJournal& journal, SignedApiClient& client, Notifier& notifier,
                               Clock& clock, const SchedulerSettings& settings)
    : executor_(executor)
    , monitor_(monitor)
    , book_(book)
    , journal_(journal)
    , client_(client)
    , notifier_(notifier)
    , clock_(clock)
    , settings_(settings) {
}

int64_t TradeScheduler::jitter_ms() const {
    return static_cast<int64_t>(util::random_uniform(0.0, static_cast<double>(settings_.jitter_seconds) * 1000.0));
}

std::string TradeScheduler::entry_key(const TradePlanEntry& entry) {
    return util::date_yyyy_mm_dd(entry.entry_time) + "#" + std::to_string(entry.index) + "#" + entry.symbol;
}

std::vector<TradePlanEntry> TradeScheduler::resolve_day(const std::vector<PlanRow>& rows) {
    int64_t now = clock_.now();
    std::vector<TradePlanEntry> entries = resolve_trade_plan(rows, now, last_exit_);

    int64_t latest = last_exit_;
    for (const auto& e : entries) {
        latest = std::max(latest, e.exit_time);
        LOG_INFO("Plan " + std::to_string(e.index) + ": " + e.symbol + " " + side_to_string(e.side) +
                 " entry " + util::epoch_to_iso8601(e.entry_time) +
                 " exit " + util::epoch_to_iso8601(e.exit_time) +
                 (e.lot_size.has_value() ? " lot " + std::to_string(*e.lot_size) : " auto lot"));
    }
    last_exit_ = latest;
    return entries;
}

std::vector<TradingWindow> TradeScheduler::windows_for(const std::vector<TradePlanEntry>& entries) const {
    std::vector<TradingWindow> windows;
    for (const auto& e : entries) {
        TradingWindow w;
        w.symbol = e.symbol;
        w.start = e.entry_time - settings_.jitter_seconds;
        w.end = e.exit_time;
        w.entry_key = entry_key(e);
        windows.push_back(w);
    }
    return windows;
}

EntryRunResult TradeScheduler::run_entry(const TradePlanEntry& entry) {
    EntryRunResult run;
    const std::string tag = "Trade " + std::to_string(entry.index) + " (" + entry.symbol + " " +
                            side_to_string(entry.side) + ")";

    if (clock_.now() > entry.entry_time) {
        run.skipped = true;
        run.error = "entry time " + util::time_hh_mm_ss(entry.entry_time) + " already passed";
        LOG_WARNING(tag + ": " + run.error + ", skipping");
        notifier_.send(tag + ": " + run.error + ", skipping");
        return run;
    }

    int64_t entry_target = entry.entry_time * 1000 - jitter_ms();
    LOG_INFO(tag + ": waiting for entry at " + util::epoch_to_iso8601(entry_target / 1000));
    if (!clock_.sleep_until_ms(entry_target)) {
        run.error = "shutdown before entry";
        return run;
    }

    EntryRequest request;
    request.key = entry_key(entry);
    request.plan_index = entry.index;
    request.symbol = entry.symbol;
    request.side = entry.side;
    request.lot_size = entry.lot_size;
    request.scheduled_exit = entry.exit_time;

    EntryOutcome outcome = executor_.enter(request);
    if (!outcome.success) {
        run.error = outcome.error;
        if (outcome.needs_watchdog) {
            monitor_.start_watchdog(entry.symbol, entry.exit_time + settings_.watchdog_grace_seconds, request.key);
        }
        return run;
    }
    run.entered = true;

    const std::string position_id = outcome.tracked.position.position_id;
    int64_t exit_target = entry.exit_time * 1000 - jitter_ms();
    LOG_INFO(tag + ": holding position " + position_id + " until " + util::epoch_to_iso8601(exit_target / 1000));

    while (clock_.now_ms() < exit_target) {
        if (!book_.is_tracked(position_id)) {
            break;
        }
        int64_t chunk = std::min(settings_.check_interval_ms, exit_target - clock_.now_ms());
        if (!clock_.sleep_ms(chunk)) {
            run.error = "shutdown while holding position " + position_id;
            LOG_WARNING(tag + ": " + run.error);
            return run;
        }
    }

    if (!book_.is_tracked(position_id)) {
        LOG_INFO(tag + ": position " + position_id + " already closed before scheduled exit");
        run.closed = true;
        return run;
    }

    CloseOutcome close = executor_.close(outcome.tracked, ExitPath::SCHEDULED, "scheduled exit");
    if (close.refused) {
        LOG_INFO(tag + ": exit already in progress on another path");
        run.closed = true;
    } else if (close.success) {
        run.closed = true;
    } else {
        run.error = close.error;
    }
    return run;
}

int TradeScheduler::run_day(const std::vector<TradePlanEntry>& entries) {
    LOG_INFO("Processing " + std::to_string(entries.size()) + " plan entries");
    monitor_.set_windows(windows_for(entries));

    int entered = 0;
    for (const auto& entry : entries) {
        if (clock_.stop_requested()) {
            break;
        }
        try {
            EntryRunResult run = run_entry(entry);
            if (run.entered) {
                entered++;
            }
        } catch (const std::exception& e) {
            std::string msg = "Trade " + std::to_string(entry.index) + " failed: " + std::string(e.what());
            LOG_ERROR(msg);
            notifier_.send(msg);
        }
    }

    LOG_INFO("All plan entries processed: " + std::to_string(entered) + "/" +
             std::to_string(entries.size()) + " entered");
    return entered;
}

DailySummary TradeScheduler::finalize_day(int64_t day) {
    int64_t cutoff = util::at_time_of_day(day, settings_.eod_cutoff_hour, 0, 0);
    std::string date = util::date_yyyy_mm_dd(day);

    std::vector<TradeResult> results = journal_.drain_until(cutoff);
    double fee = journal_.take_fees();
    DailySummary summary = summarize_day(date, results, fee);

    BalanceResult balance = client_.get_balance();
    if (balance.success) {
        summary.balance = balance.balance;
        summary.balance_known = true;
    } else {
        LOG_WARNING("Balance unavailable for daily report: " + balance.error);
    }

    if (!results.empty()) {
        std::string path;
        std::string error;
        if (!export_daily_results(settings_.results_dir, date, results, path, error)) {
            notifier_.send("Daily result export failed: " + error);
        }
    }

    std::string report = format_daily_report(summary, settings_.eod_cutoff_hour, settings_.account_currency);
    LOG_INFO(report);
    notifier_.send(report);
    return summary;
}
