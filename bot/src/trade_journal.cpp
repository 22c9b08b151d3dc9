#include "trade_journal.hpp"
#include "logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

double max_drawdown(const std::vector<double>& values) {
    double cumulative = 0.0;
    double peak = 0.0;
    double worst = 0.0;
    for (double v : values) {
        cumulative += v;
        peak = std::max(peak, cumulative);
        worst = std::max(worst, peak - cumulative);
    }
    return worst;
}

std::string PerformanceMetrics::report() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    oss << "Performance report"
        << "\n  trades: " << total_trades
        << "\n  wins: " << winning_trades
        << "\n  win rate: " << win_rate << "%"
        << "\n  total pips: " << total_pips
        << "\n  average pips: " << average_pips
        << "\n  max drawdown: " << max_drawdown_pips << " pips"
        << std::setprecision(0)
        << "\n  total amount: " << total_amount
        << "\n  max drawdown amount: " << max_drawdown_amount
        << "\n  fees: " << total_fee
        << "\n  api calls: " << api_calls
        << "\n  api errors: " << api_errors
        << "\n  uptime: " << (uptime_seconds / 3600) << "h " << ((uptime_seconds % 3600) / 60) << "m";
    return oss.str();
}

void TradeJournal::record(const TradeResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(result);
    history_.push_back(result);
}

void TradeJournal::add_fee(double fee) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_fee_ += fee;
    total_fee_ += fee;
}

std::vector<TradeResult> TradeJournal::drain_until(int64_t cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TradeResult> drained;
    std::vector<TradeResult> kept;
    for (const auto& r : pending_) {
        if (r.exit_time < cutoff) {
            drained.push_back(r);
        } else {
            kept.push_back(r);
        }
    }
    pending_.swap(kept);
    if (!pending_.empty()) {
        LOG_INFO(std::to_string(pending_.size()) + " result(s) after cutoff carried to the next day");
    }
    return drained;
}

double TradeJournal::take_fees() {
    std::lock_guard<std::mutex> lock(mutex_);
    double fee = pending_fee_;
    pending_fee_ = 0.0;
    return fee;
}

std::vector<TradeResult> TradeJournal::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

size_t TradeJournal::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

double TradeJournal::total_fee() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_fee_;
}

PerformanceMetrics TradeJournal::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PerformanceMetrics m;

    std::vector<double> pips;
    std::vector<double> amounts;
    for (const auto& r : history_) {
        m.total_trades++;
        if (r.profit_pips > 0.0) {
            m.winning_trades++;
        }
        m.total_pips += r.profit_pips;
        m.total_amount += r.profit_amount;
        pips.push_back(r.profit_pips);
        amounts.push_back(r.profit_amount);
    }

    if (m.total_trades > 0) {
        m.win_rate = 100.0 * m.winning_trades / m.total_trades;
        m.average_pips = m.total_pips / m.total_trades;
    }
    m.max_drawdown_pips = max_drawdown(pips);
    m.max_drawdown_amount = max_drawdown(amounts);
    m.total_fee = total_fee_;
    return m;
}
