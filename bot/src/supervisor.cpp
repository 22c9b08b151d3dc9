#include "supervisor.hpp"
#include "logger.hpp"
#include "util.hpp"
#include <algorithm>
#include <sstream>

SupervisorSettings SupervisorSettings::from_config(const Config& config) {
    SupervisorSettings s;
    s.trade_plan_file = config.trade_plan_file;
    s.kill_switch_file = config.kill_switch_file;
    s.eod_cutoff_hour = config.eod_cutoff_hour;
    s.auto_restart_hour = config.auto_restart_hour;
    s.health_interval_ms = config.health_check_interval_hours * 60 * 60 * 1000;
    s.memory_warning_mb = config.memory_warning_mb;
    s.leverage = config.autolot ? config.leverage : config.manual_leverage;
    s.autolot = config.autolot;
    s.stop_loss_pips = config.stop_loss_pips;
    s.take_profit_pips = config.take_profit_pips;
    s.sweep_interval_minutes = config.position_check_interval_minutes;
    s.jitter_seconds = config.jitter_seconds;
    s.account_currency = config.account_currency;
    return s;
}

Supervisor::Supervisor(SignedApiClient& client, OrderExecutor& executor, PositionMonitor& monitor,
                       TradeScheduler& scheduler, TradeJournal& journal, DailyVolumeLedger& ledger,
                       PositionBook& book, HealthChecker& health, RestartGuard& restart_guard,
                       Restarter& restarter, Notifier& notifier, Clock& clock, const SupervisorSettings& settings)
    : client_(client)
    , executor_(executor)
    , monitor_(monitor)
    , scheduler_(scheduler)
    , journal_(journal)
    , ledger_(ledger)
    , book_(book)
    , health_(health)
    , restart_guard_(restart_guard)
    , restarter_(restarter)
    , notifier_(notifier)
    , clock_(clock)
    , settings_(settings)
    , started_at_(clock.now()) {
}

Supervisor::~Supervisor() {
    clock_.request_stop();
    wait();
}

void Supervisor::add_worker(const std::string& name, Worker::Step step) {
    workers_.push_back(std::make_unique<Worker>(name, clock_, std::move(step),
        [this](const std::string& msg) { notifier_.send(msg); }));
}

void Supervisor::start() {
    add_worker("trade-plan", [this]() { return trading_step(); });
    add_worker("position-monitor", [this]() { return monitor_.monitor_step(); });
    add_worker("position-sweep", [this]() { return monitor_.sweep_step(); });
    add_worker("end-of-day", [this]() { return eod_step(); });
    add_worker("volume-reset", [this]() { return volume_reset_step(); });
    add_worker("health-check", [this]() { return health_step(); });
    add_worker("kill-switch", [this]() { return kill_switch_step(); });
    if (settings_.auto_restart_hour.has_value()) {
        add_worker("daily-restart", [this]() { return daily_restart_step(); });
    }

    for (auto& worker : workers_) {
        worker->start();
    }
    LOG_INFO("Supervisor started " + std::to_string(workers_.size()) + " workers");
}

void Supervisor::wait() {
    for (auto& worker : workers_) {
        worker->join();
    }
    monitor_.join_watchdogs();
}

void Supervisor::stop() {
    LOG_INFO("Stop requested");
    clock_.request_stop();
}

int64_t Supervisor::uptime_seconds() const {
    return clock_.now() - started_at_;
}

int64_t Supervisor::delay_until(int64_t epoch_seconds) const {
    return std::max<int64_t>(0, epoch_seconds * 1000 - clock_.now_ms());
}

void Supervisor::full_stop(const std::string& reason) {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (stopping_) {
        LOG_INFO("Full stop already in progress");
        return;
    }
    stopping_ = true;

    LOG_WARNING("Full stop: " + reason);
    notifier_.send("Stopping system: " + reason + ". Closing all positions.");

    CloseAllResult closed = executor_.close_all(ExitPath::KILL, reason);
    if (!closed.success) {
        std::string msg = "Some positions could not be closed during stop";
        if (!closed.error.empty()) {
            msg += ": " + closed.error;
        }
        LOG_ERROR(msg);
        notifier_.send(msg + ". Check the exchange manually.");
    }

    notifier_.send("System stopped");
    clock_.request_stop();
}

CloseAllResult Supervisor::emergency_close(const std::string& reason) {
    LOG_WARNING("Emergency close: " + reason);
    CloseAllResult result = executor_.close_all(ExitPath::KILL, reason);

    int closed = 0;
    int failed = 0;
    double pips = 0.0;
    double amount = 0.0;
    for (const auto& outcome : result.outcomes) {
        if (outcome.success) {
            closed++;
            pips += outcome.result.profit_pips;
            amount += outcome.result.profit_amount;
        } else if (!outcome.refused) {
            failed++;
        }
    }

    std::ostringstream oss;
    oss << "Emergency close complete: " << closed << " closed, " << failed << " failed"
        << ", total " << util::format_fixed(pips, 1) << " pips, "
        << util::format_fixed(amount, 0) << " " << settings_.account_currency;
    if (!result.error.empty()) {
        oss << " (" << result.error << ")";
    }
    notifier_.send(oss.str());
    return result;
}

bool Supervisor::auto_restart(const std::string& reason) {
    RestartGuard::Decision decision = restart_guard_.request();

    if (decision == RestartGuard::Decision::COOLDOWN) {
        notifier_.send("Restart skipped (cooldown active): " + reason);
        return false;
    }
    if (decision == RestartGuard::Decision::HALT) {
        halted_ = true;
        std::string msg = "Maximum restart count (" + std::to_string(restart_guard_.max_restarts()) +
                          ") reached. Manual intervention required.";
        LOG_ERROR(msg);
        notifier_.send(msg);
        full_stop("restart limit reached");
        return false;
    }

    int count = restart_guard_.count();
    notifier_.send("Auto restart (" + std::to_string(count) + "/" +
                   std::to_string(restart_guard_.max_restarts()) + "): " + reason);

    CloseAllResult closed = executor_.close_all(ExitPath::KILL, "restart");
    if (!closed.success) {
        LOG_ERROR("Positions not fully closed before restart: " + closed.error);
    }

    if (!restarter_.restart(count)) {
        notifier_.send("Restart failed, continuing in the current process");
        return false;
    }
    return true;
}

void Supervisor::notify_plan_summary(const std::vector<TradePlanEntry>& entries) {
    std::ostringstream oss;
    oss << "Trading day plan: " << entries.size() << " entr" << (entries.size() == 1 ? "y" : "ies");

    BalanceResult balance = client_.get_balance();
    if (balance.success) {
        oss << "\nBalance: " << util::format_fixed(balance.balance, 0) << " " << settings_.account_currency;
    } else {
        oss << "\nBalance: unavailable (" << balance.error << ")";
    }
    oss << "\nLeverage: " << util::format_fixed(settings_.leverage, 1)
        << "\nAuto lot: " << (settings_.autolot ? "on" : "off")
        << "\nStop loss: " << (settings_.stop_loss_pips > 0 ? util::format_fixed(settings_.stop_loss_pips, 1) + " pips" : "off")
        << "\nTake profit: " << (settings_.take_profit_pips > 0 ? util::format_fixed(settings_.take_profit_pips, 1) + " pips" : "off")
        << "\nPosition sweep: every " << settings_.sweep_interval_minutes << " min";
    for (const auto& e : entries) {
        oss << "\n" << e.index << ". " << e.symbol << " " << side_to_string(e.side)
            << " " << util::time_hh_mm_ss(e.entry_time) << " -> " << util::time_hh_mm_ss(e.exit_time)
            << (e.lot_size.has_value() ? " lot " + std::to_string(*e.lot_size) : " auto lot");
    }
    notifier_.send(oss.str());
}

int64_t Supervisor::trading_step() {
    std::vector<std::string> warnings;
    std::vector<PlanRow> rows = load_trade_plan(settings_.trade_plan_file, &warnings);
    if (!warnings.empty()) {
        std::string msg = "Trade plan: " + std::to_string(warnings.size()) + " row(s) skipped";
        for (const auto& w : warnings) {
            msg += "\n- " + w;
        }
        notifier_.send(msg);
    }

    std::vector<TradePlanEntry> entries = scheduler_.resolve_day(rows);
    if (entries.empty()) {
        LOG_WARNING("No trade plan entries in " + settings_.trade_plan_file);
        notifier_.send("No trade plan entries found in " + settings_.trade_plan_file);
        return settings_.idle_plan_delay_ms;
    }

    double rss = HealthChecker::rss_mb();
    if (rss > settings_.memory_warning_mb) {
        LOG_WARNING("Memory usage " + util::format_fixed(rss, 1) + " MB at trading day start");
    }

    notify_plan_summary(entries);
    scheduler_.run_day(entries);

    if (clock_.stop_requested()) {
        return -1;
    }

    // Sleep until shortly before the next cycle's first entry, then reload the plan
    std::vector<TradePlanEntry> next = resolve_trade_plan(rows, clock_.now(), scheduler_.last_exit_time());
    if (next.empty()) {
        return settings_.idle_plan_delay_ms;
    }
    int64_t wake = next.front().entry_time - settings_.jitter_seconds - settings_.plan_lead_seconds;
    LOG_INFO("Trading day complete, next plan load at " + util::epoch_to_iso8601(wake));
    return delay_until(wake);
}

int64_t Supervisor::eod_step() {
    int64_t now = clock_.now();
    if (next_eod_ != 0 && now >= next_eod_) {
        LOG_INFO("End-of-day aggregation");
        scheduler_.finalize_day(next_eod_);
        next_eod_ = 0;
    }
    if (next_eod_ == 0) {
        next_eod_ = util::next_time_of_day(now, settings_.eod_cutoff_hour, 0, 0);
    }
    return delay_until(next_eod_);
}

int64_t Supervisor::volume_reset_step() {
    int64_t now = clock_.now();
    if (next_volume_reset_ != 0 && now >= next_volume_reset_) {
        ledger_.reset();
        LOG_INFO("Daily volume ledger reset");
        next_volume_reset_ = 0;
    }
    if (next_volume_reset_ == 0) {
        next_volume_reset_ = util::next_time_of_day(now, 0, 0, 0);
    }
    return delay_until(next_volume_reset_);
}

int64_t Supervisor::health_step() {
    int64_t now = clock_.now();
    if (next_health_ != 0 && now >= next_health_) {
        HealthReport report = health_.run();
        if (!report.healthy()) {
            notifier_.send("Health check failed:\n" + report.summary());
            auto_restart("health check failed");
        }
        next_health_ = 0;
    }
    if (next_health_ == 0) {
        next_health_ = now + settings_.health_interval_ms / 1000;
    }
    return delay_until(next_health_);
}

int64_t Supervisor::daily_restart_step() {
    if (!settings_.auto_restart_hour.has_value()) {
        return -1;
    }
    int hour = *settings_.auto_restart_hour % 24;

    int64_t now = clock_.now();
    if (next_daily_restart_ != 0 && now >= next_daily_restart_) {
        next_daily_restart_ = 0;
        LOG_WARNING("Daily restart hour " + std::to_string(hour) + " reached");
        notifier_.send("Daily restart at " + std::to_string(hour) + ":00. Closing positions and restarting.");

        CloseAllResult closed = executor_.close_all(ExitPath::KILL, "daily restart");
        if (!closed.success) {
            LOG_ERROR("Positions not fully closed before daily restart: " + closed.error);
        }
        if (!restarter_.restart(restart_guard_.count())) {
            notifier_.send("Daily restart failed, continuing in the current process");
        }
    }
    if (next_daily_restart_ == 0) {
        next_daily_restart_ = util::next_time_of_day(now, hour, 0, 0);
        LOG_INFO("Next daily restart at " + util::epoch_to_iso8601(next_daily_restart_));
    }
    return delay_until(next_daily_restart_);
}

int64_t Supervisor::kill_switch_step() {
    if (util::file_exists(settings_.kill_switch_file)) {
        LOG_WARNING("Kill switch active: " + settings_.kill_switch_file);
        full_stop("kill switch file " + settings_.kill_switch_file);
        return -1;
    }
    return settings_.kill_switch_poll_ms;
}

std::string Supervisor::status_report() const {
    std::ostringstream oss;
    oss << "Status: " << (halted_ ? "halted" : (clock_.stop_requested() ? "stopping" : "running"))
        << "\nUptime: " << uptime_seconds() / 3600 << "h " << (uptime_seconds() % 3600) / 60 << "m"
        << "\nTracked positions: " << book_.size()
        << "\nPending results: " << journal_.pending_count()
        << "\nRestarts: " << restart_guard_.count() << "/" << restart_guard_.max_restarts()
        << "\nRate limit: " << client_.rate_limiter().current_limit() << "/s"
        << "\nAPI calls: " << client_.api_calls() << " (errors " << client_.api_errors() << ")";
    for (const auto& kv : executor_.states()) {
        oss << "\n" << kv.first << ": " << execution_state_to_string(kv.second);
    }
    return oss.str();
}

std::string Supervisor::performance_report() const {
    PerformanceMetrics metrics = journal_.metrics();
    metrics.api_calls = client_.api_calls();
    metrics.api_errors = client_.api_errors();
    metrics.uptime_seconds = uptime_seconds();
    return metrics.report();
}

std::string Supervisor::positions_report() {
    PositionsResult open = client_.get_open_positions();
    if (!open.success) {
        return "Failed to fetch positions: " + open.error;
    }
    if (open.positions.empty()) {
        return "No open positions";
    }

    std::vector<std::string> symbols;
    for (const auto& p : open.positions) {
        if (std::find(symbols.begin(), symbols.end(), p.symbol) == symbols.end()) {
            symbols.push_back(p.symbol);
        }
    }
    TickerResult ticker = client_.get_tickers(symbols);

    std::ostringstream oss;
    oss << "Open positions: " << open.positions.size();
    for (const auto& p : open.positions) {
        oss << "\n" << p.symbol << " " << side_to_string(p.side)
            << " size " << p.size
            << " entry " << util::format_fixed(p.entry_price, 5)
            << " id " << p.position_id;
        auto it = ticker.quotes.find(p.symbol);
        if (it != ticker.quotes.end()) {
            oss << " pips " << util::format_fixed(PositionMonitor::current_pips(p, it->second), 1);
        }
        oss << (book_.is_tracked(p.position_id) ? " [scheduled]" : " [unscheduled]");
    }
    return oss.str();
}

std::string Supervisor::health_report() {
    return health_.run().summary();
}
