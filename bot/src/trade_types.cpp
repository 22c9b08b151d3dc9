#include "trade_types.hpp"
#include "util.hpp"

std::string side_to_string(Side side) {
    switch (side) {
        case Side::BUY:  return "BUY";
        case Side::SELL: return "SELL";
        default:         return "UNKNOWN";
    }
}

bool string_to_side(const std::string& str, Side& out) {
    std::string s = util::to_lower(util::trim(str));
    if (s == "buy" || s == "long" || s == "l" || s == "\xE8\xB2\xB7") {   // 買
        out = Side::BUY;
        return true;
    }
    if (s == "sell" || s == "short" || s == "s" || s == "\xE5\xA3\xB2") { // 売
        out = Side::SELL;
        return true;
    }
    return false;
}

Side opposite_side(Side side) {
    return side == Side::BUY ? Side::SELL : Side::BUY;
}

double pip_size(const std::string& symbol) {
    return symbol.find("JPY") != std::string::npos ? 0.01 : 0.0001;
}

std::string quote_currency(const std::string& symbol) {
    size_t pos = symbol.find('_');
    if (pos == std::string::npos) {
        return "";
    }
    return symbol.substr(pos + 1);
}

double profit_pips(Side side, double entry_price, double exit_price, const std::string& symbol) {
    double diff = side == Side::BUY ? exit_price - entry_price : entry_price - exit_price;
    return diff / pip_size(symbol);
}

double profit_in_quote(Side side, double entry_price, double exit_price,
                       const std::string& symbol, int64_t size) {
    return profit_pips(side, entry_price, exit_price, symbol) * static_cast<double>(size) * pip_size(symbol);
}
