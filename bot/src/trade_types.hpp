#ifndef TRADE_TYPES_HPP
#define TRADE_TYPES_HPP

#include <string>
#include <cstdint>

enum class Side {
    BUY,
    SELL
};

std::string side_to_string(Side side);
bool string_to_side(const std::string& str, Side& out);
Side opposite_side(Side side);

struct Quote {
    std::string symbol;
    double bid = 0.0;
    double ask = 0.0;
    int64_t expiry_ms = 0;   // Served from cache only while now < expiry_ms

    double spread() const { return ask - bid; }
    // Price an order on `side` would fill at
    double entry_rate(Side side) const { return side == Side::BUY ? ask : bid; }
    // Price an open position on `side` would close at
    double exit_rate(Side side) const { return side == Side::BUY ? bid : ask; }
};

struct Position {
    std::string position_id;
    std::string symbol;
    Side side = Side::BUY;
    double entry_price = 0.0;
    int64_t size = 0;
    std::string open_time;   // As reported by the exchange
};

struct TradeResult {
    std::string symbol;
    Side side = Side::BUY;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double profit_pips = 0.0;
    double profit_amount = 0.0;
    int64_t lot_size = 0;
    int64_t entry_time = 0;  // epoch seconds
    int64_t exit_time = 0;   // epoch seconds
};

// 0.01 for JPY-quoted pairs, 0.0001 otherwise
double pip_size(const std::string& symbol);

// "EUR_USD" -> "USD"; empty when the symbol has no '_' separator
std::string quote_currency(const std::string& symbol);

// Positive when price moved in the position's favour
double profit_pips(Side side, double entry_price, double exit_price, const std::string& symbol);

// Profit in quote currency: pips * size * pip
double profit_in_quote(Side side, double entry_price, double exit_price,
                       const std::string& symbol, int64_t size);

#endif // TRADE_TYPES_HPP
