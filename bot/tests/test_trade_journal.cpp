/**
 * Tests for the trade journal, daily volume ledger and result export
 */

#include "test_support.hpp"
#include "../src/trade_journal.hpp"
#include "../src/volume_ledger.hpp"
#include "../src/result_export.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

static TradeResult make_result(const std::string& symbol, double pips, double amount, int64_t exit_time) {
    TradeResult r;
    r.symbol = symbol;
    r.side = Side::BUY;
    r.entry_price = 150.000;
    r.exit_price = 150.000 + pips * pip_size(symbol);
    r.profit_pips = pips;
    r.profit_amount = amount;
    r.lot_size = 10000;
    r.entry_time = exit_time - 600;
    r.exit_time = exit_time;
    return r;
}

TEST(test_max_drawdown) {
    ASSERT_NEAR(max_drawdown({}), 0.0, 1e-12);
    ASSERT_NEAR(max_drawdown({10.0, 5.0, 3.0}), 0.0, 1e-12);
    // Peak 15, trough 15 - 12 = 3, recovers to 10
    ASSERT_NEAR(max_drawdown({10.0, 5.0, -8.0, -4.0, 7.0}), 12.0, 1e-9);
    // Losses from the start count against a zero peak
    ASSERT_NEAR(max_drawdown({-3.0, -2.0, 1.0}), 5.0, 1e-9);
}

TEST(test_metrics) {
    TradeJournal journal;
    int64_t t = local_ms(10, 0) / 1000;
    journal.record(make_result("USD_JPY", 10.0, 1000.0, t));
    journal.record(make_result("USD_JPY", -4.0, -400.0, t + 60));
    journal.record(make_result("USD_JPY", 0.0, 0.0, t + 120));
    journal.record(make_result("USD_JPY", 6.0, 600.0, t + 180));
    journal.add_fee(12.5);

    PerformanceMetrics m = journal.metrics();
    ASSERT_EQ(m.total_trades, 4);
    ASSERT_EQ(m.winning_trades, 2);
    ASSERT_NEAR(m.win_rate, 50.0, 1e-9);
    ASSERT_NEAR(m.total_pips, 12.0, 1e-9);
    ASSERT_NEAR(m.average_pips, 3.0, 1e-9);
    ASSERT_NEAR(m.max_drawdown_pips, 4.0, 1e-9);
    ASSERT_NEAR(m.max_drawdown_amount, 400.0, 1e-9);
    ASSERT_NEAR(m.total_fee, 12.5, 1e-9);
    ASSERT_TRUE(m.report().find("win rate: 50.0%") != std::string::npos);
}

TEST(test_empty_metrics) {
    TradeJournal journal;
    PerformanceMetrics m = journal.metrics();
    ASSERT_EQ(m.total_trades, 0);
    ASSERT_NEAR(m.win_rate, 0.0, 1e-12);
    ASSERT_NEAR(m.average_pips, 0.0, 1e-12);
}

TEST(test_drain_until_carries_late_results) {
    TradeJournal journal;
    int64_t cutoff = local_ms(19, 0) / 1000;
    journal.record(make_result("USD_JPY", 5.0, 500.0, cutoff - 3600));
    journal.record(make_result("EUR_USD", 2.0, 300.0, cutoff));
    journal.record(make_result("GBP_JPY", -1.0, -100.0, cutoff + 60));
    journal.add_fee(3.0);

    std::vector<TradeResult> drained = journal.drain_until(cutoff);
    ASSERT_EQ(drained.size(), 1u);
    ASSERT_EQ(drained[0].symbol, "USD_JPY");
    ASSERT_EQ(journal.pending_count(), 2u);

    ASSERT_NEAR(journal.take_fees(), 3.0, 1e-12);
    ASSERT_NEAR(journal.take_fees(), 0.0, 1e-12);
    ASSERT_NEAR(journal.total_fee(), 3.0, 1e-12);

    // The next day's cutoff picks up the carried results
    std::vector<TradeResult> next = journal.drain_until(cutoff + 86400);
    ASSERT_EQ(next.size(), 2u);
    ASSERT_EQ(journal.pending_count(), 0u);

    // Lifetime metrics still include everything
    ASSERT_EQ(journal.metrics().total_trades, 3);
}

TEST(test_volume_ledger_cap) {
    DailyVolumeLedger ledger(1000);
    ASSERT_TRUE(ledger.reserve("USD_JPY", 600));
    ASSERT_TRUE(ledger.reserve("USD_JPY", 400));
    ASSERT_FALSE(ledger.reserve("USD_JPY", 1));
    ASSERT_EQ(ledger.volume("USD_JPY"), 1000);
    ASSERT_EQ(ledger.remaining("USD_JPY"), 0);

    // Caps are per symbol
    ASSERT_TRUE(ledger.reserve("EUR_USD", 1000));
    ASSERT_FALSE(ledger.reserve("EUR_USD", 0));

    ledger.release("USD_JPY", 400);
    ASSERT_EQ(ledger.volume("USD_JPY"), 600);
    ledger.release("USD_JPY", 5000);
    ASSERT_EQ(ledger.volume("USD_JPY"), 0);

    ledger.reset();
    ASSERT_EQ(ledger.volume("EUR_USD"), 0);
    ASSERT_EQ(ledger.remaining("EUR_USD"), 1000);
}

TEST(test_volume_ledger_concurrent_reserve) {
    DailyVolumeLedger ledger(100);
    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 50; i++) {
                if (ledger.reserve("USD_JPY", 1)) {
                    accepted++;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    ASSERT_EQ(accepted.load(), 100);
    ASSERT_EQ(ledger.volume("USD_JPY"), 100);
}

TEST(test_results_csv_and_report) {
    int64_t t = local_ms(10, 0) / 1000;
    std::vector<TradeResult> results = {
        make_result("USD_JPY", 10.0, 1000.0, t),
        make_result("USD_JPY", -2.5, -250.0, t + 60)
    };

    std::string csv = format_results_csv("2026-01-05", results);
    std::istringstream lines(csv);
    std::string header;
    std::getline(lines, header);
    ASSERT_EQ(header, "date,symbol,side,entry_price,exit_price,lot_size,profit_pips,profit_amount,entry_time,exit_time");
    std::string first;
    std::getline(lines, first);
    ASSERT_EQ(first, "2026-01-05,USD_JPY,BUY,150.000,150.100,10000,10.0,1000,09:50:00,10:00:00");

    DailySummary summary = summarize_day("2026-01-05", results, 4.0);
    ASSERT_EQ(summary.trade_count, 2);
    ASSERT_NEAR(summary.total_pips, 7.5, 1e-9);
    ASSERT_NEAR(summary.total_amount, 750.0, 1e-9);
    summary.balance = 1000750.0;
    summary.balance_known = true;

    std::string report = format_daily_report(summary, 19, "JPY");
    ASSERT_TRUE(report.find("until 19:00") != std::string::npos);
    ASSERT_TRUE(report.find("Total pips: 7.5") != std::string::npos);
    ASSERT_TRUE(report.find("Balance: 1000750 JPY") != std::string::npos);

    DailySummary empty = summarize_day("2026-01-06", {}, 0.0);
    ASSERT_EQ(format_daily_report(empty, 7, "JPY"), "No trades closed before 07:00 on 2026-01-06.");
}

TEST(test_export_daily_results) {
    fs::path dir = fs::temp_directory_path() / "fxbot_test_results";
    fs::remove_all(dir);

    int64_t t = local_ms(10, 0) / 1000;
    std::string path;
    std::string error;
    ASSERT_TRUE(export_daily_results(dir.string(), "2026-01-05", {make_result("USD_JPY", 1.0, 100.0, t)}, path, error));
    ASSERT_EQ(path, daily_results_path(dir.string(), "2026-01-05"));
    ASSERT_TRUE(fs::exists(path));

    std::ifstream in(path);
    std::string header;
    std::getline(in, header);
    ASSERT_EQ(header.substr(0, 11), "date,symbol");

    fs::remove_all(dir);
}

int main() {
    std::cout << "TradeJournal Tests:\n";

    RUN_TEST(test_max_drawdown);
    RUN_TEST(test_metrics);
    RUN_TEST(test_empty_metrics);
    RUN_TEST(test_drain_until_carries_late_results);
    RUN_TEST(test_volume_ledger_cap);
    RUN_TEST(test_volume_ledger_concurrent_reserve);
    RUN_TEST(test_results_csv_and_report);
    RUN_TEST(test_export_daily_results);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
