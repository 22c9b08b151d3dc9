/**
 * Tests for the per-entry trade lifecycle and end-of-day reporting
 */

#include "test_support.hpp"
#include "../src/trade_scheduler.hpp"

#include <filesystem>

namespace fs = std::filesystem;

static int64_t local_s(int hour, int minute, int second = 0, int day = 5) {
    return util::make_local_time(2026, 1, day, hour, minute, second);
}

struct SchedulerFixture {
    ManualClock clock{local_ms(10, 0)};
    FakeExchange exchange;
    RecordingNotifier notifier;
    SignedApiClient client;
    PositionSizer sizer;
    DailyVolumeLedger ledger{15000000};
    PositionBook book;
    TradeJournal journal;
    OrderExecutor executor;
    PositionMonitor monitor;
    TradeScheduler scheduler;

    static SignedApiClient::Options options() {
        SignedApiClient::Options o;
        o.api_key = "k";
        o.api_secret = "s";
        return o;
    }

    static SchedulerSettings scheduler_settings() {
        SchedulerSettings s;
        s.jitter_seconds = 3;
        s.check_interval_ms = 5000;
        s.eod_cutoff_hour = 19;
        s.results_dir = (fs::temp_directory_path() / "fxbot_test_scheduler").string();
        return s;
    }

    SchedulerFixture()
        : client(options(), exchange, clock)
        , sizer(client, 1.0)
        , executor(client, sizer, ledger, book, journal, notifier, clock, ExecutorSettings())
        , monitor(client, executor, book, notifier, clock, MonitorSettings())
        , scheduler(executor, monitor, book, journal, client, notifier, clock, scheduler_settings()) {
        exchange.set_quote("USD_JPY", 149.995, 150.000);
    }

    static TradePlanEntry entry(int index, int64_t entry_time, int64_t exit_time) {
        TradePlanEntry e;
        e.index = index;
        e.symbol = "USD_JPY";
        e.side = Side::BUY;
        e.entry_time = entry_time;
        e.exit_time = exit_time;
        e.lot_size = 10000;
        return e;
    }
};

TEST(test_entry_key) {
    TradePlanEntry e = SchedulerFixture::entry(2, local_s(10, 1), local_s(10, 6));
    ASSERT_EQ(TradeScheduler::entry_key(e), "2026-01-05#2#USD_JPY");
}

TEST(test_run_entry_full_cycle) {
    SchedulerFixture f;
    TradePlanEntry e = SchedulerFixture::entry(1, local_s(10, 1), local_s(10, 6));

    EntryRunResult run = f.scheduler.run_entry(e);
    ASSERT_TRUE(run.entered);
    ASSERT_TRUE(run.closed);
    ASSERT_FALSE(run.skipped);
    ASSERT_EQ(f.exchange.count("POST", "/v1/order"), 1);
    ASSERT_EQ(f.exchange.count("POST", "/v1/closeOrder"), 1);
    ASSERT_EQ(f.exchange.open_position_count(), 0u);
    ASSERT_EQ(f.journal.pending_count(), 1u);

    // Exit lands within the jitter window before the scheduled time
    int64_t exit_ms = e.exit_time * 1000;
    ASSERT_TRUE(f.clock.now_ms() >= exit_ms - 3000);
    ASSERT_TRUE(f.clock.now_ms() < exit_ms + 5000);

    std::vector<TradeResult> results = f.journal.pending();
    ASSERT_TRUE(results[0].entry_time >= e.entry_time - 3);
    ASSERT_TRUE(results[0].entry_time <= e.entry_time);
    ASSERT_TRUE(f.executor.state(TradeScheduler::entry_key(e)) == ExecutionState::CLOSED);
}

TEST(test_run_entry_skips_past_entry) {
    SchedulerFixture f;
    TradePlanEntry e = SchedulerFixture::entry(1, local_s(9, 59), local_s(10, 30));

    EntryRunResult run = f.scheduler.run_entry(e);
    ASSERT_TRUE(run.skipped);
    ASSERT_FALSE(run.entered);
    ASSERT_EQ(f.exchange.count("POST", "/v1/order"), 0);
    ASSERT_TRUE(f.notifier.contains("already passed"));
}

TEST(test_run_entry_position_closed_early) {
    SchedulerFixture f;
    TradePlanEntry e = SchedulerFixture::entry(1, local_s(10, 1), local_s(10, 30));

    bool fired = false;
    f.clock.on_sleep = [&](int64_t now_ms) {
        if (fired || now_ms < local_ms(10, 5)) return;
        std::vector<TrackedPosition> tracked = f.book.tracked();
        if (tracked.empty()) return;
        fired = true;
        f.executor.close(tracked[0], ExitPath::STOP_LOSS, "test stop");
    };

    EntryRunResult run = f.scheduler.run_entry(e);
    ASSERT_TRUE(fired);
    ASSERT_TRUE(run.entered);
    ASSERT_TRUE(run.closed);
    ASSERT_EQ(f.exchange.count("POST", "/v1/closeOrder"), 1);
    // Hold loop stops at the next check, well before the scheduled exit
    ASSERT_TRUE(f.clock.now_ms() < local_ms(10, 6));
}

TEST(test_run_entry_shutdown_while_holding) {
    SchedulerFixture f;
    TradePlanEntry e = SchedulerFixture::entry(1, local_s(10, 1), local_s(10, 30));
    f.clock.on_sleep = [&](int64_t now_ms) {
        if (now_ms >= local_ms(10, 10)) f.clock.request_stop();
    };

    EntryRunResult run = f.scheduler.run_entry(e);
    ASSERT_TRUE(run.entered);
    ASSERT_FALSE(run.closed);
    ASSERT_TRUE(run.error.find("shutdown") != std::string::npos);
    ASSERT_EQ(f.exchange.count("POST", "/v1/closeOrder"), 0);
}

TEST(test_unresolved_order_starts_watchdog) {
    SchedulerFixture f;
    f.exchange.orders_vanish = true;
    TradePlanEntry e = SchedulerFixture::entry(1, local_s(10, 1), local_s(10, 2));

    EntryRunResult run = f.scheduler.run_entry(e);
    ASSERT_FALSE(run.entered);
    f.monitor.join_watchdogs();
    // The watchdog polls until the exit plus its grace period
    ASSERT_TRUE(f.clock.now() >= e.exit_time + 600);
}

TEST(test_resolve_day_tracks_last_exit) {
    SchedulerFixture f;
    PlanRow a;
    a.index = 1;
    a.symbol = "USD_JPY";
    a.entry_hour = 11;
    a.exit_hour = 12;
    PlanRow b = a;
    b.index = 2;
    b.entry_hour = 23;
    b.entry_minute = 50;
    b.exit_hour = 0;
    b.exit_minute = 10;

    std::vector<TradePlanEntry> entries = f.scheduler.resolve_day({a, b});
    ASSERT_EQ(entries.size(), 2u);
    ASSERT_EQ(f.scheduler.last_exit_time(), local_s(0, 10, 0, 6));

    std::vector<TradingWindow> windows = f.scheduler.windows_for(entries);
    ASSERT_EQ(windows[0].start, local_s(11, 0) - 3);
    ASSERT_EQ(windows[0].end, local_s(12, 0));
    ASSERT_EQ(windows[1].entry_key, TradeScheduler::entry_key(entries[1]));

    // Next cycle, read after the 00:10 exit: 11:00 resolves to the same day
    f.clock.set(local_ms(0, 20, 0, 6));
    entries = f.scheduler.resolve_day({a});
    ASSERT_EQ(entries[0].entry_time, local_s(11, 0, 0, 6));
}

TEST(test_run_day) {
    SchedulerFixture f;
    std::vector<TradePlanEntry> entries = {
        SchedulerFixture::entry(1, local_s(10, 1), local_s(10, 5)),
        SchedulerFixture::entry(2, local_s(10, 10), local_s(10, 15))
    };

    ASSERT_EQ(f.scheduler.run_day(entries), 2);
    ASSERT_EQ(f.journal.pending_count(), 2u);
    ASSERT_TRUE(f.monitor.in_window("USD_JPY", local_s(10, 12)));
    ASSERT_FALSE(f.monitor.in_window("USD_JPY", local_s(10, 7)));
}

TEST(test_finalize_day) {
    SchedulerFixture f;
    fs::remove_all(f.scheduler.settings().results_dir);

    TradeResult early;
    early.symbol = "USD_JPY";
    early.profit_pips = 12.0;
    early.profit_amount = 1200.0;
    early.lot_size = 10000;
    early.entry_time = local_s(10, 0);
    early.exit_time = local_s(10, 30);
    TradeResult late = early;
    late.entry_time = local_s(19, 0);
    late.exit_time = local_s(19, 30);
    f.journal.record(early);
    f.journal.record(late);
    f.journal.add_fee(7.0);

    DailySummary summary = f.scheduler.finalize_day(local_s(19, 0));
    ASSERT_EQ(summary.date, "2026-01-05");
    ASSERT_EQ(summary.trade_count, 1);
    ASSERT_NEAR(summary.total_pips, 12.0, 1e-9);
    ASSERT_NEAR(summary.total_fee, 7.0, 1e-9);
    ASSERT_TRUE(summary.balance_known);
    ASSERT_EQ(f.journal.pending_count(), 1u);
    ASSERT_TRUE(fs::exists(daily_results_path(f.scheduler.settings().results_dir, "2026-01-05")));
    ASSERT_TRUE(f.notifier.contains("Results for 2026-01-05 (until 19:00)"));

    fs::remove_all(f.scheduler.settings().results_dir);
}

int main() {
    std::cout << "TradeScheduler Tests:\n";

    RUN_TEST(test_entry_key);
    RUN_TEST(test_run_entry_full_cycle);
    RUN_TEST(test_run_entry_skips_past_entry);
    RUN_TEST(test_run_entry_position_closed_early);
    RUN_TEST(test_run_entry_shutdown_while_holding);
    RUN_TEST(test_unresolved_order_starts_watchdog);
    RUN_TEST(test_resolve_day_tracks_last_exit);
    RUN_TEST(test_run_day);
    RUN_TEST(test_finalize_day);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
