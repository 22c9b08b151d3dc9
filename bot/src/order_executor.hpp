#ifndef ORDER_EXECUTOR_HPP
#define ORDER_EXECUTOR_HPP

#include "api_client.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "notifier.hpp"
#include "position_book.hpp"
#include "position_sizer.hpp"
#include "retry_policy.hpp"
#include "trade_journal.hpp"
#include "trade_types.hpp"
#include "volume_ledger.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class ExecutionState {
    IDLE,
    SPREAD_CHECK,
    PLACING,
    RESOLVING_POSITION,
    MONITORING,
    CLOSING,
    CLOSED,
    FAILED
};

std::string execution_state_to_string(ExecutionState state);

struct ExecutorSettings {
    double spread_threshold = 0.01;
    RetryPolicy entry_retry = RetryPolicy::fixed(3, 5000);
    RetryPolicy exit_retry = RetryPolicy::fixed(3, 10000);
    RetryPolicy execution_lookup = RetryPolicy::fixed(3, 1000);
    RetryPolicy position_lookup = RetryPolicy::fixed(5, 3000);
    bool autolot = true;
    double leverage = 10.0;
    double manual_leverage = 18.0;
    std::string account_currency = "JPY";

    static ExecutorSettings from_config(const Config& config);
};

struct EntryRequest {
    std::string key;                  // Unique per plan entry and trading day
    int plan_index = 0;
    std::string symbol;
    Side side = Side::BUY;
    std::optional<int64_t> lot_size;  // Empty: size from account equity
    int64_t scheduled_exit = 0;       // epoch seconds
};

struct EntryOutcome {
    bool success = false;
    bool adopted = false;             // Found by the final position check after errors
    bool needs_watchdog = false;      // An order may exist that was never resolved
    ExecutionState state = ExecutionState::IDLE;
    std::string error;
    TrackedPosition tracked;
};

struct CloseOutcome {
    bool success = false;
    bool refused = false;             // Another exit path owns the position
    bool manual_fallback = false;
    std::string error;
    TradeResult result;
};

struct CloseAllResult {
    bool success = false;
    std::string error;
    std::vector<CloseOutcome> outcomes;
};

class OrderExecutor {
public:
    OrderExecutor(SignedApiClient& client, PositionSizer& sizer, DailyVolumeLedger& ledger,
                  PositionBook& book, TradeJournal& journal, Notifier& notifier,
                  Clock& clock, const ExecutorSettings& settings);

    // Idle -> SpreadCheck -> Placing -> ResolvingPosition -> Monitoring.
    // A key that was already attempted is refused.
    EntryOutcome enter(const EntryRequest& request);

    // Monitoring -> Closing -> Closed | Failed. Bounded retries followed by a
    // single manual close attempt.
    CloseOutcome close(const TrackedPosition& tracked, ExitPath path, const std::string& reason = "");

    // Closes every exchange-reported open position
    CloseAllResult close_all(ExitPath path, const std::string& reason);

    // Order id -> open position, via execution history then open positions
    std::optional<Position> resolve_position(const std::string& order_id, const std::string& symbol);

    // Converts a quote-currency amount to the account currency
    double to_account_currency(double amount, const std::string& symbol);

    ExecutionState state(const std::string& key) const;
    std::map<std::string, ExecutionState> states() const;

    const ExecutorSettings& settings() const { return settings_; }

private:
    bool begin(const std::string& key);
    void set_state(const std::string& key, ExecutionState state);
    bool pause(int64_t delay_ms);

    // Average close price and P/L bookkeeping once a close order is accepted
    CloseOutcome finish_close(const TrackedPosition& tracked, const std::string& order_id, ExitPath path);

    EntryOutcome adopted_outcome(const EntryRequest& request, const TrackedPosition& tracked);

    // Tracks an untracked open position matching the request's symbol and side.
    // `checked` is false when the open positions could not be read.
    std::optional<TrackedPosition> adopt_open_position(const EntryRequest& request, bool& checked);

    SignedApiClient& client_;
    PositionSizer& sizer_;
    DailyVolumeLedger& ledger_;
    PositionBook& book_;
    TradeJournal& journal_;
    Notifier& notifier_;
    Clock& clock_;
    ExecutorSettings settings_;

    mutable std::mutex state_mutex_;
    std::map<std::string, ExecutionState> states_;
};

#endif // ORDER_EXECUTOR_HPP
