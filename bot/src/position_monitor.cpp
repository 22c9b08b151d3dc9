#include "position_monitor.hpp"
#include "logger.hpp"
#include "util.hpp"
#include <set>

MonitorSettings MonitorSettings::from_config(const Config& config) {
    MonitorSettings s;
    s.stop_loss_pips = config.stop_loss_pips;
    s.take_profit_pips = config.take_profit_pips;
    s.check_interval_ms = config.position_check_interval * 1000;
    s.sweep_interval_ms = config.position_check_interval_minutes * 60 * 1000;
    return s;
}

PositionMonitor::PositionMonitor(SignedApiClient& client, OrderExecutor& executor, PositionBook& book,
                                 Notifier& notifier, Clock& clock, const MonitorSettings& settings)
    : client_(client)
    , executor_(executor)
    , book_(book)
    , notifier_(notifier)
    , clock_(clock)
    , settings_(settings) {
}

PositionMonitor::~PositionMonitor() {
    join_watchdogs();
}

double PositionMonitor::current_pips(const Position& position, const Quote& quote) {
    return profit_pips(position.side, position.entry_price, quote.exit_rate(position.side), position.symbol);
}

std::optional<ExitPath> PositionMonitor::evaluate(const Position& position, const Quote& quote) const {
    double pips = current_pips(position, quote);
    if (settings_.stop_loss_pips > 0.0 && pips <= -settings_.stop_loss_pips) {
        return ExitPath::STOP_LOSS;
    }
    if (settings_.take_profit_pips > 0.0 && pips >= settings_.take_profit_pips) {
        return ExitPath::TAKE_PROFIT;
    }
    return std::nullopt;
}

int PositionMonitor::check_once() {
    if (settings_.stop_loss_pips <= 0.0 && settings_.take_profit_pips <= 0.0) {
        return 0;
    }

    std::vector<TrackedPosition> tracked = book_.tracked();
    if (tracked.empty()) {
        return 0;
    }

    std::set<std::string> symbol_set;
    for (const auto& t : tracked) {
        symbol_set.insert(t.position.symbol);
    }
    std::vector<std::string> symbols(symbol_set.begin(), symbol_set.end());

    TickerResult tickers = client_.get_tickers(symbols);
    if (!tickers.success) {
        LOG_WARNING("Position monitor: quotes incomplete: " + tickers.error);
    }

    int closed = 0;
    for (const auto& t : tracked) {
        auto it = tickers.quotes.find(t.position.symbol);
        if (it == tickers.quotes.end()) {
            continue;
        }
        if (book_.claim_of(t.position.position_id).has_value()) {
            continue;
        }

        double pips = current_pips(t.position, it->second);
        LOG_DEBUG("Monitor " + t.position.symbol + " " + side_to_string(t.position.side) +
                  " id " + t.position.position_id + ": " + util::format_fixed(pips, 1) + " pips");

        std::optional<ExitPath> trigger = evaluate(t.position, it->second);
        if (!trigger.has_value()) {
            continue;
        }

        std::string reason = (*trigger == ExitPath::STOP_LOSS ? "stop loss " : "take profit ") +
                             util::format_fixed(pips, 1) + " pips";
        LOG_WARNING("Position " + t.position.position_id + " hit " + reason);
        CloseOutcome outcome = executor_.close(t, *trigger, reason);
        if (outcome.success) {
            closed++;
        }
    }
    return closed;
}

void PositionMonitor::set_windows(const std::vector<TradingWindow>& windows) {
    std::lock_guard<std::mutex> lock(windows_mutex_);
    windows_ = windows;
}

bool PositionMonitor::in_window(const std::string& symbol, int64_t at) const {
    std::lock_guard<std::mutex> lock(windows_mutex_);
    for (const auto& w : windows_) {
        if ((w.symbol.empty() || w.symbol == symbol) && at >= w.start && at <= w.end) {
            return true;
        }
    }
    return false;
}

bool PositionMonitor::in_other_window(const std::string& symbol, int64_t at, const std::string& entry_key) const {
    std::lock_guard<std::mutex> lock(windows_mutex_);
    for (const auto& w : windows_) {
        if (!entry_key.empty() && w.entry_key == entry_key) {
            continue;
        }
        if ((w.symbol.empty() || w.symbol == symbol) && at >= w.start && at <= w.end) {
            return true;
        }
    }
    return false;
}

int PositionMonitor::sweep_once() {
    PositionsResult open = client_.get_open_positions();
    if (!open.success) {
        LOG_ERROR("Position sweep: failed to fetch open positions: " + open.error);
        return 0;
    }

    int64_t now = clock_.now();
    std::vector<TrackedPosition> orphans;
    for (const auto& pos : open.positions) {
        std::optional<TrackedPosition> tracked = book_.find(pos.position_id);
        if (tracked.has_value()) {
            // Tracked positions belong to their scheduled exit until it is overdue
            if (tracked->scheduled_exit <= 0 || now <= tracked->scheduled_exit + settings_.overdue_grace_seconds ||
                book_.claim_of(pos.position_id).has_value()) {
                continue;
            }
            LOG_WARNING("Position sweep: " + pos.position_id + " still open after its scheduled exit at " +
                        util::epoch_to_iso8601(tracked->scheduled_exit));
            orphans.push_back(*tracked);
            continue;
        }
        if (book_.has_pending(pos.symbol) || in_window(pos.symbol, now)) {
            continue;
        }
        TrackedPosition target;
        target.position = pos;
        orphans.push_back(target);
    }

    if (orphans.empty()) {
        LOG_DEBUG("Position sweep: no unscheduled positions");
        return 0;
    }

    LOG_WARNING("Position sweep: " + std::to_string(orphans.size()) + " position(s) outside every trading window");

    int closed = 0;
    double total_pips = 0.0;
    double total_amount = 0.0;
    std::string details;
    for (const auto& target : orphans) {
        const Position& pos = target.position;
        CloseOutcome outcome = executor_.close(target, ExitPath::SWEEP, "outside trading schedule");
        if (outcome.success) {
            closed++;
            total_pips += outcome.result.profit_pips;
            total_amount += outcome.result.profit_amount;
            details += "\n" + pos.symbol + " " + side_to_string(pos.side) + " " +
                       util::format_fixed(outcome.result.profit_pips, 1) + " pips (" +
                       util::format_fixed(outcome.result.profit_amount, 0) + ")";
        } else if (!outcome.refused) {
            details += "\n" + pos.symbol + " " + side_to_string(pos.side) + " close failed: " + outcome.error;
        }
    }

    notifier_.send("Force-closed " + std::to_string(closed) + "/" + std::to_string(orphans.size()) +
                   " position(s) outside the trading schedule" + details +
                   "\nTotal: " + util::format_fixed(total_pips, 1) + " pips (" +
                   util::format_fixed(total_amount, 0) + ")");
    return closed;
}

bool PositionMonitor::watch_symbol(const std::string& symbol, int64_t deadline, const std::string& owner_key) {
    LOG_INFO("Watching " + symbol + " for unrecognized positions until " + util::epoch_to_iso8601(deadline));

    while (clock_.now() < deadline && !clock_.stop_requested()) {
        if (book_.has_pending(symbol) || in_other_window(symbol, clock_.now(), owner_key)) {
            LOG_DEBUG("Watchdog for " + symbol + ": another entry is active, skipping check");
            if (!clock_.sleep_ms(settings_.check_interval_ms)) {
                break;
            }
            continue;
        }

        PositionsResult open = client_.get_open_positions(symbol);
        if (open.success) {
            bool found = false;
            for (const auto& pos : open.positions) {
                if (pos.symbol != symbol || book_.is_tracked(pos.position_id) || book_.has_pending(symbol)) {
                    continue;
                }
                found = true;
                LOG_WARNING("Unrecognized position found: " + pos.symbol + " id " + pos.position_id);
                TrackedPosition target;
                target.position = pos;
                CloseOutcome outcome = executor_.close(target, ExitPath::WATCHDOG, "unrecognized position");
                if (outcome.success) {
                    notifier_.send("Warning: unrecognized position detected and closed: " + pos.symbol + " " +
                                   side_to_string(pos.side));
                } else if (!outcome.refused) {
                    LOG_ERROR("Failed to close unrecognized position " + pos.position_id + ": " + outcome.error);
                }
            }
            if (found) {
                return true;
            }
        } else {
            LOG_WARNING("Watchdog position check failed: " + open.error);
        }

        if (!clock_.sleep_ms(settings_.check_interval_ms)) {
            break;
        }
    }
    return false;
}

void PositionMonitor::start_watchdog(const std::string& symbol, int64_t deadline, const std::string& owner_key) {
    std::lock_guard<std::mutex> lock(watchdog_mutex_);
    reap_watchdogs();

    Watchdog w;
    w.done = std::make_shared<std::atomic<bool>>(false);
    std::shared_ptr<std::atomic<bool>> done = w.done;
    w.thread = std::thread([this, symbol, deadline, owner_key, done] {
        try {
            watch_symbol(symbol, deadline, owner_key);
        } catch (const std::exception& e) {
            LOG_ERROR("Watchdog for " + symbol + " failed: " + std::string(e.what()));
        }
        done->store(true);
    });
    watchdogs_.push_back(std::move(w));
}

void PositionMonitor::reap_watchdogs() {
    for (auto it = watchdogs_.begin(); it != watchdogs_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = watchdogs_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t PositionMonitor::watchdog_count() {
    std::lock_guard<std::mutex> lock(watchdog_mutex_);
    reap_watchdogs();
    return watchdogs_.size();
}

void PositionMonitor::join_watchdogs() {
    std::vector<Watchdog> threads;
    {
        std::lock_guard<std::mutex> lock(watchdog_mutex_);
        threads.swap(watchdogs_);
    }
    for (auto& w : threads) {
        if (w.thread.joinable()) {
            w.thread.join();
        }
    }
}

int64_t PositionMonitor::monitor_step() {
    check_once();
    return settings_.check_interval_ms;
}

int64_t PositionMonitor::sweep_step() {
    sweep_once();
    return settings_.sweep_interval_ms;
}
