#include "result_export.hpp"
#include "logger.hpp"
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

static std::string format_price(double price, const std::string& symbol) {
    return util::format_fixed(price, symbol.find("JPY") != std::string::npos ? 3 : 5);
}

DailySummary summarize_day(const std::string& date, const std::vector<TradeResult>& results, double total_fee) {
    DailySummary s;
    s.date = date;
    s.results = results;
    s.trade_count = static_cast<int>(results.size());
    s.total_fee = total_fee;
    for (const auto& r : results) {
        s.total_pips += r.profit_pips;
        s.total_amount += r.profit_amount;
    }
    return s;
}

std::string daily_results_path(const std::string& results_dir, const std::string& date) {
    return results_dir + "/daily_results_" + date + ".csv";
}

std::string format_results_csv(const std::string& date, const std::vector<TradeResult>& results) {
    std::ostringstream oss;
    oss << "date,symbol,side,entry_price,exit_price,lot_size,profit_pips,profit_amount,entry_time,exit_time\n";
    for (const auto& r : results) {
        oss << date << ','
            << r.symbol << ','
            << side_to_string(r.side) << ','
            << format_price(r.entry_price, r.symbol) << ','
            << format_price(r.exit_price, r.symbol) << ','
            << r.lot_size << ','
            << util::format_fixed(r.profit_pips, 1) << ','
            << util::format_fixed(r.profit_amount, 0) << ','
            << util::time_hh_mm_ss(r.entry_time) << ','
            << util::time_hh_mm_ss(r.exit_time) << '\n';
    }
    return oss.str();
}

bool export_daily_results(const std::string& results_dir, const std::string& date,
                          const std::vector<TradeResult>& results, std::string& path_out, std::string& error) {
    std::error_code ec;
    std::filesystem::create_directories(results_dir, ec);
    if (ec) {
        error = "Failed to create " + results_dir + ": " + ec.message();
        LOG_ERROR(error);
        return false;
    }

    path_out = daily_results_path(results_dir, date);
    std::ofstream file(path_out, std::ios::trunc);
    if (!file.is_open()) {
        error = "Failed to open " + path_out;
        LOG_ERROR(error);
        return false;
    }

    file << format_results_csv(date, results);
    file.flush();
    if (!file.good()) {
        error = "Failed to write " + path_out;
        LOG_ERROR(error);
        return false;
    }

    LOG_INFO("Daily results written: " + path_out + " (" + std::to_string(results.size()) + " trades)");
    return true;
}

std::string format_daily_report(const DailySummary& summary, int cutoff_hour, const std::string& currency) {
    std::string cutoff = (cutoff_hour < 10 ? "0" : "") + std::to_string(cutoff_hour) + ":00";

    if (summary.results.empty()) {
        return "No trades closed before " + cutoff + " on " + summary.date + ".";
    }

    std::ostringstream oss;
    oss << "**Results for " << summary.date << " (until " << cutoff << ")**\n\n"
        << "| Symbol | Side | Entry | Exit | Lot | Pips | Amount | Time |\n"
        << "|---|---|---|---|---|---|---|---|\n";
    for (const auto& r : summary.results) {
        oss << "| " << r.symbol
            << " | " << side_to_string(r.side)
            << " | " << format_price(r.entry_price, r.symbol)
            << " | " << format_price(r.exit_price, r.symbol)
            << " | " << r.lot_size
            << " | " << util::format_fixed(r.profit_pips, 1)
            << " | " << util::format_fixed(r.profit_amount, 0)
            << " | " << util::time_hh_mm_ss(r.entry_time) << "-" << util::time_hh_mm_ss(r.exit_time)
            << " |\n";
    }
    oss << "\nTrades: " << summary.trade_count
        << "\nTotal pips: " << util::format_fixed(summary.total_pips, 1)
        << "\nTotal amount: " << util::format_fixed(summary.total_amount, 0) << " " << currency
        << "\nFees: " << util::format_fixed(summary.total_fee, 0) << " " << currency;
    if (summary.balance_known) {
        oss << "\nBalance: " << util::format_fixed(summary.balance, 0) << " " << currency;
    }
    return oss.str();
}
