#ifndef TRADE_JOURNAL_HPP
#define TRADE_JOURNAL_HPP

#include "trade_types.hpp"
#include <vector>
#include <mutex>
#include <cstdint>
#include <string>

struct PerformanceMetrics {
    int total_trades = 0;
    int winning_trades = 0;
    double win_rate = 0.0;          // percent
    double total_pips = 0.0;
    double total_amount = 0.0;
    double average_pips = 0.0;
    double max_drawdown_pips = 0.0;
    double max_drawdown_amount = 0.0;
    int64_t api_calls = 0;
    int64_t api_errors = 0;
    int64_t uptime_seconds = 0;
    double total_fee = 0.0;

    std::string report() const;
};

// Running-peak drawdown over cumulative sums of `values`
double max_drawdown(const std::vector<double>& values);

// Append-only TradeResult history for the trading day plus lifetime totals
class TradeJournal {
public:
    void record(const TradeResult& result);
    void add_fee(double fee);

    // Removes and returns results whose exit is before `cutoff` (epoch seconds).
    // Later results stay for the next day.
    std::vector<TradeResult> drain_until(int64_t cutoff);

    // Fee accumulated since the last drain
    double take_fees();

    std::vector<TradeResult> pending() const;
    size_t pending_count() const;
    double total_fee() const;

    // Metrics over every result recorded in this process
    PerformanceMetrics metrics() const;

private:
    mutable std::mutex mutex_;
    std::vector<TradeResult> pending_;
    std::vector<TradeResult> history_;
    double pending_fee_ = 0.0;
    double total_fee_ = 0.0;
};

#endif // TRADE_JOURNAL_HPP
