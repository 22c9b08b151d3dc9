#ifndef RESULT_EXPORT_HPP
#define RESULT_EXPORT_HPP

#include "trade_types.hpp"
#include <string>
#include <vector>

struct DailySummary {
    std::string date;                 // YYYY-MM-DD
    int trade_count = 0;
    double total_pips = 0.0;
    double total_amount = 0.0;
    double total_fee = 0.0;
    double balance = 0.0;
    bool balance_known = false;
    std::vector<TradeResult> results;
};

DailySummary summarize_day(const std::string& date, const std::vector<TradeResult>& results, double total_fee);

// <results_dir>/daily_results_YYYY-MM-DD.csv
std::string daily_results_path(const std::string& results_dir, const std::string& date);

std::string format_results_csv(const std::string& date, const std::vector<TradeResult>& results);

// Writes the day's CSV, creating the directory if needed. Returns false and
// fills `error` on failure.
bool export_daily_results(const std::string& results_dir, const std::string& date,
                          const std::vector<TradeResult>& results, std::string& path_out, std::string& error);

// Markdown table for the operator channel
std::string format_daily_report(const DailySummary& summary, int cutoff_hour, const std::string& currency);

#endif // RESULT_EXPORT_HPP
