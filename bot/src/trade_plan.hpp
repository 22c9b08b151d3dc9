#ifndef TRADE_PLAN_HPP
#define TRADE_PLAN_HPP

#include "trade_types.hpp"
#include <istream>
#include <optional>
#include <string>
#include <vector>

// One validated row of the plan file, times still wall-clock only
struct PlanRow {
    int index = 0;
    Side side = Side::BUY;
    std::string symbol;
    int entry_hour = 0;
    int entry_minute = 0;
    int entry_second = 0;
    int exit_hour = 0;
    int exit_minute = 0;
    int exit_second = 0;
    std::optional<int64_t> lot_size;
};

// A plan row resolved to absolute instants
struct TradePlanEntry {
    int index = 0;
    std::string symbol;
    Side side = Side::BUY;
    int64_t entry_time = 0;   // epoch seconds
    int64_t exit_time = 0;    // epoch seconds, always after entry_time
    std::optional<int64_t> lot_size;
};

// "USDJPY", "usd/jpy" and "USD_JPY" all become "USD_JPY"
std::string normalize_symbol(const std::string& raw);

// Parses CSV rows: index, side, symbol, entry HH:MM:SS, exit HH:MM:SS, lot.
// The first line is a header. Malformed rows are skipped with a warning that
// is also appended to `warnings` when given.
std::vector<PlanRow> parse_trade_plan(std::istream& in, std::vector<std::string>* warnings = nullptr);

// Throws std::runtime_error if the file cannot be opened
std::vector<PlanRow> load_trade_plan(const std::string& path, std::vector<std::string>* warnings = nullptr);

// Resolves rows against `now`. An entry moves to the next day when it is not
// in the future or precedes `last_exit`. Exit is anchored on the entry's date
// and moves one day forward when not after entry. Sorted by entry time.
std::vector<TradePlanEntry> resolve_trade_plan(const std::vector<PlanRow>& rows, int64_t now, int64_t last_exit);

#endif // TRADE_PLAN_HPP
