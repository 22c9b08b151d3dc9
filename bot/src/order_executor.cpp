#include "order_executor.hpp"
#include "logger.hpp"
#include "util.hpp"

std::string execution_state_to_string(ExecutionState state) {
    switch (state) {
        case ExecutionState::IDLE:               return "IDLE";
        case ExecutionState::SPREAD_CHECK:       return "SPREAD_CHECK";
        case ExecutionState::PLACING:            return "PLACING";
        case ExecutionState::RESOLVING_POSITION: return "RESOLVING_POSITION";
        case ExecutionState::MONITORING:         return "MONITORING";
        case ExecutionState::CLOSING:            return "CLOSING";
        case ExecutionState::CLOSED:             return "CLOSED";
        case ExecutionState::FAILED:             return "FAILED";
        default:                                 return "UNKNOWN";
    }
}

ExecutorSettings ExecutorSettings::from_config(const Config& config) {
    ExecutorSettings s;
    s.spread_threshold = config.spread_threshold;
    s.entry_retry = RetryPolicy::fixed(config.max_entry_order_attempts, config.entry_order_retry_interval * 1000);
    s.exit_retry = RetryPolicy::fixed(config.max_exit_order_attempts, config.exit_order_retry_interval * 1000);
    s.autolot = config.autolot;
    s.leverage = config.leverage;
    s.manual_leverage = config.manual_leverage;
    s.account_currency = config.account_currency;
    return s;
}

static std::string format_price(double price, const std::string& symbol) {
    return util::format_fixed(price, symbol.find("JPY") != std::string::npos ? 3 : 5);
}

OrderExecutor::OrderExecutor(SignedApiClient& client, PositionSizer& sizer, DailyVolumeLedger& ledger,
                             PositionBook& book, TradeJournal& journal, Notifier& notifier,
                             Clock& clock, const ExecutorSettings& settings)
    : client_(client)
    , sizer_(sizer)
    , ledger_(ledger)
    , book_(book)
    , journal_(journal)
    , notifier_(notifier)
    , clock_(clock)
    , settings_(settings) {
}

bool OrderExecutor::begin(const std::string& key) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = states_.find(key);
    if (it != states_.end() && it->second != ExecutionState::IDLE) {
        return false;
    }
    states_[key] = ExecutionState::SPREAD_CHECK;
    return true;
}

void OrderExecutor::set_state(const std::string& key, ExecutionState state) {
    if (key.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = states_.find(key);
    ExecutionState previous = it == states_.end() ? ExecutionState::IDLE : it->second;
    if (previous != state) {
        LOG_DEBUG("Entry " + key + ": " + execution_state_to_string(previous) + " -> " +
                  execution_state_to_string(state));
    }
    states_[key] = state;
}

ExecutionState OrderExecutor::state(const std::string& key) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = states_.find(key);
    return it == states_.end() ? ExecutionState::IDLE : it->second;
}

std::map<std::string, ExecutionState> OrderExecutor::states() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return states_;
}

bool OrderExecutor::pause(int64_t delay_ms) {
    if (!clock_.sleep_ms(delay_ms)) {
        LOG_WARNING("Shutdown requested during retry wait");
        return false;
    }
    return true;
}

EntryOutcome OrderExecutor::enter(const EntryRequest& request) {
    EntryOutcome outcome;
    const std::string tag = "Trade " + std::to_string(request.plan_index) + " (" + request.symbol + " " +
                            side_to_string(request.side) + ")";

    if (!begin(request.key)) {
        outcome.state = state(request.key);
        outcome.error = "Entry " + request.key + " already attempted";
        LOG_WARNING(outcome.error);
        return outcome;
    }

    PendingEntry pending(book_, request.symbol);

    const RetryPolicy& retry = settings_.entry_retry;
    bool order_unresolved = false;
    int64_t unconfirmed_size = 0;     // Reserved for an order whose outcome is unknown
    bool positions_checked = true;

    for (int attempt = 0; attempt < retry.max_attempts; attempt++) {
        bool last = attempt + 1 >= retry.max_attempts;
        std::string attempt_str = " (attempt " + std::to_string(attempt + 1) + "/" +
                                  std::to_string(retry.max_attempts) + ")";

        if (clock_.stop_requested()) {
            outcome.error = "Shutdown requested";
            break;
        }

        // The previous order may have filled even though no answer came back
        if (unconfirmed_size > 0) {
            std::optional<TrackedPosition> filled = adopt_open_position(request, positions_checked);
            if (filled.has_value()) {
                return adopted_outcome(request, *filled);
            }
            if (!positions_checked) {
                outcome.error = "Order outcome unknown and open positions unavailable";
                LOG_ERROR(tag + ": " + outcome.error + ", not resending");
                break;
            }
            ledger_.release(request.symbol, unconfirmed_size);
            unconfirmed_size = 0;
        }

        // SpreadCheck
        set_state(request.key, ExecutionState::SPREAD_CHECK);
        TickerResult ticker = client_.get_tickers({request.symbol}, true);
        auto quote_it = ticker.quotes.find(request.symbol);
        if (quote_it == ticker.quotes.end()) {
            outcome.error = "No quote for " + request.symbol + ": " + ticker.error;
            LOG_WARNING(tag + ": " + outcome.error + attempt_str);
            if (!last && !pause(retry.delay_for(attempt))) break;
            continue;
        }

        const Quote& quote = quote_it->second;
        double spread = quote.spread();
        double spread_pips = spread / pip_size(request.symbol);
        if (spread > settings_.spread_threshold) {
            outcome.error = "Spread " + util::format_fixed(spread, 5) + " exceeds threshold " +
                            util::format_fixed(settings_.spread_threshold, 5);
            LOG_WARNING(tag + ": " + outcome.error + attempt_str);
            notifier_.send(tag + ": " + outcome.error + attempt_str + ", retrying");
            if (!last && !pause(retry.delay_for(attempt))) break;
            continue;
        }

        // Placing
        set_state(request.key, ExecutionState::PLACING);
        int64_t size = 0;
        if (request.lot_size.has_value()) {
            size = *request.lot_size;
        } else {
            double leverage = settings_.autolot ? settings_.leverage : settings_.manual_leverage;
            BalanceResult balance = client_.get_balance();
            if (!balance.success) {
                outcome.error = "Balance unavailable: " + balance.error;
                LOG_ERROR(tag + ": " + outcome.error + attempt_str);
                notifier_.send(tag + ": entry error" + attempt_str + ": " + outcome.error);
                if (balance.kind == ApiError::AUTH_ERROR) break;
                if (!last && !pause(retry.delay_for(attempt))) break;
                continue;
            }
            SizingResult sizing = sizer_.size(balance.available_amount, request.symbol, request.side, leverage);
            if (!sizing.success) {
                outcome.error = "Sizing failed: " + sizing.error;
                LOG_ERROR(tag + ": " + outcome.error + attempt_str);
                notifier_.send(tag + ": entry error" + attempt_str + ": " + outcome.error);
                if (!last && !pause(retry.delay_for(attempt))) break;
                continue;
            }
            size = sizing.volume;
        }

        if (!ledger_.reserve(request.symbol, size)) {
            outcome.error = "Daily volume cap for " + request.symbol + " would be exceeded (" +
                            std::to_string(ledger_.volume(request.symbol)) + " + " + std::to_string(size) +
                            " > " + std::to_string(ledger_.cap()) + ")";
            LOG_ERROR(tag + ": " + outcome.error);
            notifier_.send(tag + ": entry skipped: " + outcome.error);
            set_state(request.key, ExecutionState::FAILED);
            outcome.state = ExecutionState::FAILED;
            return outcome;
        }

        OrderResult order = client_.place_market_order(request.symbol, request.side, size);
        if (!order.success) {
            if (order.kind == ApiError::TRANSIENT) {
                unconfirmed_size = size;
            } else {
                ledger_.release(request.symbol, size);
            }
            outcome.error = "Order failed: " + order.error;
            LOG_ERROR(tag + ": " + outcome.error + attempt_str);
            notifier_.send(tag + ": entry error" + attempt_str + ": " + outcome.error);
            if (order.kind == ApiError::AUTH_ERROR) break;
            if (!last && !pause(retry.delay_for(attempt))) break;
            continue;
        }

        // ResolvingPosition
        set_state(request.key, ExecutionState::RESOLVING_POSITION);
        std::optional<Position> position = resolve_position(order.order_id, request.symbol);
        if (!position.has_value()) {
            outcome.error = "Position for order " + order.order_id + " could not be resolved";
            LOG_ERROR(tag + ": " + outcome.error);
            notifier_.send(tag + ": " + outcome.error);
            order_unresolved = true;
            break;
        }

        outcome.tracked.position = *position;
        outcome.tracked.entry_key = request.key;
        outcome.tracked.plan_index = request.plan_index;
        outcome.tracked.entry_time = clock_.now();
        outcome.tracked.scheduled_exit = request.scheduled_exit;
        book_.track(outcome.tracked);

        set_state(request.key, ExecutionState::MONITORING);
        outcome.success = true;
        outcome.state = ExecutionState::MONITORING;
        outcome.error.clear();

        std::string lot_info = request.lot_size.has_value() ? "lot=" : "auto lot=";
        std::string msg = "Entered: " + request.symbol + " " + side_to_string(request.side) +
                          ", " + lot_info + std::to_string(position->size) +
                          ", entry price=" + format_price(position->entry_price, request.symbol) +
                          ", bid=" + format_price(quote.bid, request.symbol) +
                          ", ask=" + format_price(quote.ask, request.symbol) +
                          ", spread=" + util::format_fixed(spread_pips, 3) + " pips" +
                          ", entry time=" + util::time_hh_mm_ss(outcome.tracked.entry_time) +
                          ", exit time=" + util::time_hh_mm_ss(request.scheduled_exit);
        LOG_INFO(tag + ": " + msg);
        notifier_.send(msg);
        return outcome;
    }

    // Errors were reported, but the exchange may still have opened a position
    LOG_WARNING(tag + ": entry attempts exhausted, checking open positions");
    std::optional<TrackedPosition> adopted = adopt_open_position(request, positions_checked);
    if (adopted.has_value()) {
        if (unconfirmed_size == 0 && !order_unresolved &&
            !ledger_.reserve(request.symbol, adopted->position.size)) {
            LOG_WARNING(tag + ": adopted position " + adopted->position.position_id +
                        " exceeds the daily volume cap for " + request.symbol);
        }
        return adopted_outcome(request, *adopted);
    }
    if (unconfirmed_size > 0) {
        if (positions_checked) {
            ledger_.release(request.symbol, unconfirmed_size);
        } else {
            order_unresolved = true;
        }
    }

    set_state(request.key, ExecutionState::FAILED);
    outcome.state = ExecutionState::FAILED;
    outcome.needs_watchdog = true;
    if (outcome.error.empty()) {
        outcome.error = "Entry attempts exhausted";
    }
    std::string msg = tag + ": entry skipped after " + std::to_string(retry.max_attempts) +
                      " attempts: " + outcome.error;
    if (order_unresolved) {
        msg += " (order may be open, watching " + request.symbol + ")";
    }
    LOG_ERROR(msg);
    notifier_.send(msg);
    return outcome;
}

EntryOutcome OrderExecutor::adopted_outcome(const EntryRequest& request, const TrackedPosition& tracked) {
    EntryOutcome outcome;
    outcome.tracked = tracked;
    outcome.success = true;
    outcome.adopted = true;
    outcome.state = ExecutionState::MONITORING;
    set_state(request.key, ExecutionState::MONITORING);
    notifier_.send("Warning: position detected after entry errors: " + request.symbol + " " +
                   side_to_string(request.side) + " (id " + tracked.position.position_id + ")");
    return outcome;
}

std::optional<TrackedPosition> OrderExecutor::adopt_open_position(const EntryRequest& request, bool& checked) {
    PositionsResult open = client_.get_open_positions(request.symbol);
    checked = open.success;
    if (!open.success) {
        LOG_ERROR("Open position check failed: " + open.error);
        return std::nullopt;
    }

    for (const auto& pos : open.positions) {
        if (pos.symbol != request.symbol || pos.side != request.side || book_.is_tracked(pos.position_id)) {
            continue;
        }
        TrackedPosition tracked;
        tracked.position = pos;
        tracked.entry_key = request.key;
        tracked.plan_index = request.plan_index;
        tracked.entry_time = clock_.now();
        tracked.scheduled_exit = request.scheduled_exit;
        book_.track(tracked);
        LOG_WARNING("Adopted position " + pos.position_id + " for " + request.symbol + " after entry errors");
        return tracked;
    }
    return std::nullopt;
}

std::optional<Position> OrderExecutor::resolve_position(const std::string& order_id, const std::string& symbol) {
    std::string position_id;
    double fee = 0.0;

    const RetryPolicy& exec_retry = settings_.execution_lookup;
    for (int attempt = 0; attempt < exec_retry.max_attempts && position_id.empty(); attempt++) {
        ExecutionsResult execs = client_.get_executions(order_id);
        if (execs.success) {
            for (const auto& e : execs.executions) {
                fee += e.fee;
                if (position_id.empty() && !e.position_id.empty()) {
                    position_id = e.position_id;
                }
            }
        } else {
            LOG_WARNING("Execution lookup for order " + order_id + " failed: " + execs.error);
        }
        if (position_id.empty()) {
            fee = 0.0;
            if (attempt + 1 < exec_retry.max_attempts && !pause(exec_retry.delay_for(attempt))) {
                break;
            }
        }
    }

    if (position_id.empty()) {
        LOG_ERROR("No positionId in executions for order " + order_id);
        return std::nullopt;
    }

    if (fee != 0.0) {
        journal_.add_fee(fee);
    }

    const RetryPolicy& pos_retry = settings_.position_lookup;
    for (int attempt = 0; attempt < pos_retry.max_attempts; attempt++) {
        PositionsResult open = client_.get_open_positions(symbol);
        if (open.success) {
            for (const auto& pos : open.positions) {
                if (pos.position_id == position_id) {
                    LOG_INFO("Resolved order " + order_id + " to position " + position_id +
                             " at " + std::to_string(pos.entry_price));
                    return pos;
                }
            }
        } else {
            LOG_WARNING("Open position lookup failed: " + open.error);
        }
        if (attempt + 1 < pos_retry.max_attempts && !pause(pos_retry.delay_for(attempt))) {
            break;
        }
    }

    LOG_ERROR("Position " + position_id + " not found after " + std::to_string(pos_retry.max_attempts) + " lookups");
    return std::nullopt;
}

double OrderExecutor::to_account_currency(double amount, const std::string& symbol) {
    std::string quote_ccy = quote_currency(symbol);
    if (quote_ccy.empty() || quote_ccy == settings_.account_currency) {
        return amount;
    }
    std::string cross = quote_ccy + "_" + settings_.account_currency;
    TickerResult ticker = client_.get_tickers({cross});
    auto it = ticker.quotes.find(cross);
    if (it == ticker.quotes.end() || it->second.bid <= 0.0) {
        LOG_ERROR("Cross rate " + cross + " unavailable, reporting amount in " + quote_ccy);
        return amount;
    }
    return amount * it->second.bid;
}

CloseOutcome OrderExecutor::close(const TrackedPosition& tracked, ExitPath path, const std::string& reason) {
    CloseOutcome outcome;
    const Position& pos = tracked.position;

    if (!book_.claim(pos.position_id, path)) {
        outcome.refused = true;
        outcome.error = "Position " + pos.position_id + " already being closed";
        return outcome;
    }

    set_state(tracked.entry_key, ExecutionState::CLOSING);
    Side exit_side = opposite_side(pos.side);
    const std::string tag = pos.symbol + " " + side_to_string(pos.side) + " (id " + pos.position_id + ")";
    LOG_INFO("Closing " + tag + " via " + exit_path_to_string(path) + (reason.empty() ? "" : ": " + reason));

    const RetryPolicy& retry = settings_.exit_retry;
    for (int attempt = 0; attempt < retry.max_attempts; attempt++) {
        OrderResult order = client_.close_position(pos.symbol, exit_side, pos.position_id, pos.size);
        if (order.success) {
            return finish_close(tracked, order.order_id, path);
        }
        outcome.error = order.error;
        std::string msg = "Close error (attempt " + std::to_string(attempt + 1) + "/" +
                          std::to_string(retry.max_attempts) + ") " + tag + ": " + order.error;
        LOG_ERROR(msg);
        notifier_.send(msg);
        if (attempt + 1 < retry.max_attempts) {
            pause(retry.delay_for(attempt));
        }
    }

    notifier_.send("Warning: close attempts exhausted for " + tag + ", trying manual close");
    OrderResult manual = client_.close_position(pos.symbol, exit_side, pos.position_id, pos.size);
    if (manual.success) {
        notifier_.send("Warning: manual close executed for " + tag);
        CloseOutcome done = finish_close(tracked, manual.order_id, path);
        done.manual_fallback = true;
        return done;
    }

    outcome.error = manual.error;
    outcome.manual_fallback = true;
    set_state(tracked.entry_key, ExecutionState::FAILED);
    book_.release_claim(pos.position_id);
    std::string msg = "Manual close also failed for " + tag + ": " + manual.error;
    LOG_ERROR(msg);
    notifier_.send("Warning: " + msg);
    return outcome;
}

CloseOutcome OrderExecutor::finish_close(const TrackedPosition& tracked, const std::string& order_id, ExitPath path) {
    CloseOutcome outcome;
    const Position& pos = tracked.position;

    // Average fill price of the close order
    double exit_price = 0.0;
    const RetryPolicy& lookup = settings_.execution_lookup;
    for (int attempt = 0; attempt < lookup.max_attempts && exit_price <= 0.0; attempt++) {
        ExecutionsResult execs = client_.get_executions(order_id);
        if (execs.success && !execs.executions.empty()) {
            double sum = 0.0;
            double fee = 0.0;
            int count = 0;
            for (const auto& e : execs.executions) {
                if (e.price > 0.0) {
                    sum += e.price;
                    count++;
                }
                fee += e.fee;
            }
            if (count > 0) {
                exit_price = sum / count;
                if (fee != 0.0) {
                    journal_.add_fee(fee);
                }
                break;
            }
        } else if (!execs.success) {
            LOG_WARNING("Fee/price lookup for close order " + order_id + " failed: " + execs.error);
        }
        if (attempt + 1 < lookup.max_attempts) {
            pause(lookup.delay_for(attempt));
        }
    }

    if (exit_price <= 0.0) {
        TickerResult ticker = client_.get_tickers({pos.symbol}, true);
        auto it = ticker.quotes.find(pos.symbol);
        if (it != ticker.quotes.end()) {
            exit_price = it->second.exit_rate(pos.side);
            LOG_WARNING("Close price for order " + order_id + " estimated from quote: " + std::to_string(exit_price));
        } else {
            exit_price = pos.entry_price;
            LOG_ERROR("Close price for order " + order_id + " unavailable, recording at entry price");
        }
    }

    TradeResult result;
    result.symbol = pos.symbol;
    result.side = pos.side;
    result.entry_price = pos.entry_price;
    result.exit_price = exit_price;
    result.profit_pips = profit_pips(pos.side, pos.entry_price, exit_price, pos.symbol);
    result.profit_amount = to_account_currency(
        profit_in_quote(pos.side, pos.entry_price, exit_price, pos.symbol, pos.size), pos.symbol);
    result.lot_size = pos.size;
    result.entry_time = tracked.entry_time > 0 ? tracked.entry_time : clock_.now();
    result.exit_time = clock_.now();

    journal_.record(result);
    book_.complete(pos.position_id);
    set_state(tracked.entry_key, ExecutionState::CLOSED);

    std::string close_type = path == ExitPath::SCHEDULED ? "Scheduled close" : "Auto close (" + exit_path_to_string(path) + ")";
    std::string msg = close_type + ": " + pos.symbol + " " + side_to_string(pos.side) +
                      ", entry=" + format_price(pos.entry_price, pos.symbol) +
                      ", exit=" + format_price(exit_price, pos.symbol) +
                      ", pips=" + util::format_fixed(result.profit_pips, 1) +
                      " (" + util::format_fixed(result.profit_amount, 0) + " " + settings_.account_currency + ")" +
                      ", lot=" + std::to_string(pos.size) +
                      " (close time " + util::time_hh_mm_ss(result.exit_time) + ")";

    BalanceResult balance = client_.get_balance();
    if (balance.success) {
        msg += "\nBalance: " + util::format_fixed(balance.balance, 0) + " " + settings_.account_currency;
    }

    LOG_INFO(msg);
    notifier_.send(msg);

    outcome.success = true;
    outcome.result = result;
    return outcome;
}

CloseAllResult OrderExecutor::close_all(ExitPath path, const std::string& reason) {
    CloseAllResult all;

    PositionsResult open = client_.get_open_positions();
    if (!open.success) {
        all.error = "Failed to fetch open positions: " + open.error;
        LOG_ERROR(all.error);
        notifier_.send("Close-all (" + reason + ") failed: " + all.error);
        return all;
    }

    LOG_WARNING("Closing all " + std::to_string(open.positions.size()) + " open position(s): " + reason);

    all.success = true;
    for (const auto& pos : open.positions) {
        std::optional<TrackedPosition> tracked = book_.find(pos.position_id);
        TrackedPosition target;
        if (tracked.has_value()) {
            target = *tracked;
        } else {
            target.position = pos;
        }
        CloseOutcome outcome = close(target, path, reason);
        if (!outcome.success && !outcome.refused) {
            all.success = false;
        }
        all.outcomes.push_back(outcome);
    }
    return all;
}
