/**
 * Tests for stop-loss/take-profit monitoring, the orphan sweep and the watchdog
 */

#include "test_support.hpp"
#include "../src/position_monitor.hpp"

#include <chrono>
#include <thread>

struct MonitorFixture {
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

    static SignedApiClient::Options options() {
        SignedApiClient::Options o;
        o.api_key = "k";
        o.api_secret = "s";
        return o;
    }

    static MonitorSettings monitor_settings() {
        MonitorSettings s;
        s.stop_loss_pips = 20.0;
        s.take_profit_pips = 30.0;
        s.check_interval_ms = 5000;
        return s;
    }

    MonitorFixture()
        : client(options(), exchange, clock)
        , sizer(client, 1.0)
        , executor(client, sizer, ledger, book, journal, notifier, clock, ExecutorSettings())
        , monitor(client, executor, book, notifier, clock, monitor_settings()) {
        exchange.set_quote("USD_JPY", 149.995, 150.000);
    }

    TrackedPosition enter(const std::string& key, Side side = Side::BUY) {
        EntryRequest r;
        r.key = key;
        r.plan_index = 1;
        r.symbol = "USD_JPY";
        r.side = side;
        r.lot_size = 10000;
        r.scheduled_exit = clock.now() + 3600;
        EntryOutcome outcome = executor.enter(r);
        assert(outcome.success);
        return outcome.tracked;
    }

    // Lets cached quotes expire
    void move_market(double bid, double ask) {
        exchange.set_quote("USD_JPY", bid, ask);
        clock.advance(10000);
    }
};

TEST(test_current_pips) {
    Position buy;
    buy.symbol = "USD_JPY";
    buy.side = Side::BUY;
    buy.entry_price = 150.000;
    Quote q;
    q.bid = 150.250;
    q.ask = 150.260;
    ASSERT_NEAR(PositionMonitor::current_pips(buy, q), 25.0, 1e-6);

    Position sell = buy;
    sell.side = Side::SELL;
    ASSERT_NEAR(PositionMonitor::current_pips(sell, q), -26.0, 1e-6);

    Position eur;
    eur.symbol = "EUR_USD";
    eur.side = Side::SELL;
    eur.entry_price = 1.10000;
    Quote eq;
    eq.bid = 1.09880;
    eq.ask = 1.09890;
    ASSERT_NEAR(PositionMonitor::current_pips(eur, eq), 11.0, 1e-6);
}

TEST(test_evaluate_thresholds) {
    MonitorFixture f;
    Position p;
    p.symbol = "USD_JPY";
    p.side = Side::BUY;
    p.entry_price = 150.000;

    Quote q;
    q.bid = 149.810;
    q.ask = 149.815;
    ASSERT_FALSE(f.monitor.evaluate(p, q).has_value());

    q.bid = 149.790;
    ASSERT_TRUE(f.monitor.evaluate(p, q) == ExitPath::STOP_LOSS);

    q.bid = 150.310;
    ASSERT_TRUE(f.monitor.evaluate(p, q) == ExitPath::TAKE_PROFIT);
}

TEST(test_check_once_stop_loss) {
    MonitorFixture f;
    TrackedPosition tracked = f.enter("sl");

    f.move_market(149.900, 149.905);
    ASSERT_EQ(f.monitor.check_once(), 0);
    ASSERT_TRUE(f.book.is_tracked(tracked.position.position_id));

    f.move_market(149.750, 149.755);
    ASSERT_EQ(f.monitor.check_once(), 1);
    ASSERT_FALSE(f.book.is_tracked(tracked.position.position_id));
    ASSERT_TRUE(f.notifier.contains("Auto close (STOP_LOSS)"));

    std::vector<TradeResult> results = f.journal.pending();
    ASSERT_EQ(results.size(), 1u);
    ASSERT_NEAR(results[0].profit_pips, -25.0, 1e-6);
}

TEST(test_check_once_take_profit_sell) {
    MonitorFixture f;
    f.exchange.set_quote("USD_JPY", 150.000, 150.005);
    TrackedPosition tracked = f.enter("tp", Side::SELL);

    f.move_market(149.690, 149.695);
    ASSERT_EQ(f.monitor.check_once(), 1);
    ASSERT_TRUE(f.book.is_closed(tracked.position.position_id));
    ASSERT_TRUE(f.notifier.contains("Auto close (TAKE_PROFIT)"));
}

TEST(test_check_once_skips_claimed) {
    MonitorFixture f;
    TrackedPosition tracked = f.enter("claimed");
    ASSERT_TRUE(f.book.claim(tracked.position.position_id, ExitPath::SCHEDULED));

    f.move_market(149.500, 149.505);
    ASSERT_EQ(f.monitor.check_once(), 0);
    ASSERT_EQ(f.exchange.count("POST", "/v1/closeOrder"), 0);
}

TEST(test_sweep_closes_only_orphans) {
    MonitorFixture f;
    f.exchange.set_quote("EUR_USD", 1.10000, 1.10005);
    TrackedPosition tracked = f.enter("tracked");
    std::string orphan = f.exchange.add_position("EUR_USD", "BUY", 1.09900, 1000);
    std::string windowed = f.exchange.add_position("USD_JPY", "SELL", 150.100, 1000);

    int64_t now = f.clock.now();
    f.monitor.set_windows({TradingWindow{"USD_JPY", now - 60, now + 600}});
    ASSERT_TRUE(f.monitor.in_window("USD_JPY", now));
    ASSERT_FALSE(f.monitor.in_window("EUR_USD", now));

    ASSERT_EQ(f.monitor.sweep_once(), 1);
    ASSERT_FALSE(f.exchange.has_position(orphan));
    ASSERT_TRUE(f.exchange.has_position(windowed));
    ASSERT_TRUE(f.exchange.has_position(tracked.position.position_id));
    ASSERT_TRUE(f.notifier.contains("Force-closed 1/1"));

    // Once the window ends the untracked position goes too
    f.clock.advance(3600 * 1000);
    ASSERT_EQ(f.monitor.sweep_once(), 1);
    ASSERT_FALSE(f.exchange.has_position(windowed));
    ASSERT_TRUE(f.exchange.has_position(tracked.position.position_id));
}

TEST(test_watch_symbol_closes_unrecognized) {
    MonitorFixture f;
    int64_t deadline = f.clock.now() + 600;
    std::string late;
    int polls = 0;
    f.clock.on_sleep = [&](int64_t) {
        if (++polls == 3 && late.empty()) {
            late = f.exchange.add_position("USD_JPY", "BUY", 150.000, 5000);
        }
    };

    ASSERT_TRUE(f.monitor.watch_symbol("USD_JPY", deadline));
    ASSERT_FALSE(late.empty());
    ASSERT_FALSE(f.exchange.has_position(late));
    ASSERT_TRUE(f.notifier.contains("unrecognized position detected and closed"));
}

TEST(test_watch_symbol_expires) {
    MonitorFixture f;
    TrackedPosition tracked = f.enter("watched");
    int64_t deadline = f.clock.now() + 60;

    // Tracked positions are not unrecognized
    ASSERT_FALSE(f.monitor.watch_symbol("USD_JPY", deadline));
    ASSERT_TRUE(f.clock.now() >= deadline);
    ASSERT_TRUE(f.exchange.has_position(tracked.position.position_id));
}

TEST(test_watchdog_leaves_pending_entry_alone) {
    MonitorFixture f;
    nlohmann::json no_fills = {{"status", 0}, {"data", {{"list", nlohmann::json::array()}}}};
    f.exchange.script("/v1/executions", FakeExchange::ok_response(no_fills));

    // A watchdog left by an earlier entry polls while this entry resolves its order
    bool watched = false;
    bool found = true;
    f.clock.on_sleep = [&](int64_t) {
        if (watched || f.exchange.count("POST", "/v1/order") == 0) {
            return;
        }
        watched = true;
        found = f.monitor.watch_symbol("USD_JPY", f.clock.now() + 1);
    };

    TrackedPosition tracked = f.enter("resolving");
    ASSERT_TRUE(watched);
    ASSERT_FALSE(found);
    ASSERT_EQ(f.exchange.count("POST", "/v1/closeOrder"), 0);
    ASSERT_TRUE(f.book.is_tracked(tracked.position.position_id));
    ASSERT_FALSE(f.book.has_pending("USD_JPY"));
}

TEST(test_watchdog_waits_for_other_entry_window) {
    MonitorFixture f;
    int64_t now = f.clock.now();
    std::string stray = f.exchange.add_position("USD_JPY", "BUY", 150.000, 5000);
    f.monitor.set_windows({TradingWindow{"USD_JPY", now - 600, now + 600, "2026-01-05#1#USD_JPY"},
                           TradingWindow{"USD_JPY", now - 60, now + 60, "2026-01-05#2#USD_JPY"}});

    ASSERT_TRUE(f.monitor.in_other_window("USD_JPY", now, "2026-01-05#1#USD_JPY"));
    ASSERT_FALSE(f.monitor.in_other_window("USD_JPY", now + 120, "2026-01-05#1#USD_JPY"));

    // Entry 2 may still own the position while its window is open
    ASSERT_FALSE(f.monitor.watch_symbol("USD_JPY", now + 30, "2026-01-05#1#USD_JPY"));
    ASSERT_TRUE(f.exchange.has_position(stray));

    ASSERT_TRUE(f.monitor.watch_symbol("USD_JPY", now + 600, "2026-01-05#1#USD_JPY"));
    ASSERT_FALSE(f.exchange.has_position(stray));
}

TEST(test_sweep_closes_overdue_tracked_position) {
    MonitorFixture f;
    TrackedPosition tracked = f.enter("stuck");
    const std::string id = tracked.position.position_id;
    f.exchange.close_failures = 4;

    CloseOutcome failed = f.executor.close(tracked, ExitPath::SCHEDULED);
    ASSERT_FALSE(failed.success);
    ASSERT_TRUE(f.book.is_tracked(id));

    // Within the grace period the scheduled exit still owns it
    f.clock.set((tracked.scheduled_exit + 60) * 1000);
    ASSERT_EQ(f.monitor.sweep_once(), 0);
    ASSERT_TRUE(f.exchange.has_position(id));

    f.clock.advance(24LL * 3600 * 1000);
    ASSERT_EQ(f.monitor.sweep_once(), 1);
    ASSERT_EQ(f.exchange.open_position_count(), 0u);
    ASSERT_TRUE(f.book.is_closed(id));
}

TEST(test_sweep_skips_pending_symbol) {
    MonitorFixture f;
    std::string stray = f.exchange.add_position("USD_JPY", "SELL", 150.100, 1000);
    {
        PendingEntry pending(f.book, "USD_JPY");
        ASSERT_EQ(f.monitor.sweep_once(), 0);
        ASSERT_TRUE(f.exchange.has_position(stray));
    }
    ASSERT_EQ(f.monitor.sweep_once(), 1);
    ASSERT_FALSE(f.exchange.has_position(stray));
}

TEST(test_watchdog_thread_stops_on_shutdown) {
    MonitorFixture f;
    f.monitor.start_watchdog("USD_JPY", f.clock.now() + 3600);
    f.clock.request_stop();
    f.monitor.join_watchdogs();
    ASSERT_TRUE(f.clock.stop_requested());
}

TEST(test_finished_watchdogs_reaped) {
    MonitorFixture f;
    for (int i = 0; i < 3; i++) {
        f.monitor.start_watchdog("USD_JPY", f.clock.now() - 1);
    }
    for (int i = 0; i < 500 && f.monitor.watchdog_count() > 0; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_EQ(f.monitor.watchdog_count(), 0u);
}

int main() {
    std::cout << "PositionMonitor Tests:\n";

    RUN_TEST(test_current_pips);
    RUN_TEST(test_evaluate_thresholds);
    RUN_TEST(test_check_once_stop_loss);
    RUN_TEST(test_check_once_take_profit_sell);
    RUN_TEST(test_check_once_skips_claimed);
    RUN_TEST(test_sweep_closes_only_orphans);
    RUN_TEST(test_watch_symbol_closes_unrecognized);
    RUN_TEST(test_watch_symbol_expires);
    RUN_TEST(test_watchdog_leaves_pending_entry_alone);
    RUN_TEST(test_watchdog_waits_for_other_entry_window);
    RUN_TEST(test_sweep_closes_overdue_tracked_position);
    RUN_TEST(test_sweep_skips_pending_symbol);
    RUN_TEST(test_watchdog_thread_stops_on_shutdown);
    RUN_TEST(test_finished_watchdogs_reaped);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
