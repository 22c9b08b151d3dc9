#include "position_sizer.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cmath>

PositionSizer::PositionSizer(SignedApiClient& client, double risk_ratio, const std::string& account_currency)
    : client_(client)
    , risk_ratio_(risk_ratio)
    , account_currency_(account_currency) {
}

int64_t PositionSizer::compute_volume(double available, double leverage, double rate, double cross_rate) {
    if (rate <= 0.0 || cross_rate <= 0.0 || available <= 0.0 || leverage <= 0.0) {
        return MIN_VOLUME;
    }
    double raw = std::floor(available * leverage / (rate * cross_rate));
    if (raw >= static_cast<double>(MAX_VOLUME)) {
        return MAX_VOLUME;
    }
    return std::max(MIN_VOLUME, static_cast<int64_t>(raw));
}

SizingResult PositionSizer::size(double balance, const std::string& symbol, Side side, double leverage) {
    SizingResult result;

    if (!(balance > 0.0) || !(leverage > 0.0) || symbol.empty()) {
        result.kind = SizingError::INVALID_INPUT;
        result.error = "Invalid sizing input: balance=" + std::to_string(balance) +
                       ", leverage=" + std::to_string(leverage) + ", symbol=" + symbol;
        LOG_ERROR(result.error);
        return result;
    }

    result.available = balance * risk_ratio_ * SAFETY_MARGIN;

    std::string quote_ccy = quote_currency(symbol);
    bool needs_cross = !quote_ccy.empty() && quote_ccy != account_currency_;
    std::string cross_symbol = quote_ccy + "_" + account_currency_;

    std::vector<std::string> symbols = {symbol};
    if (needs_cross) {
        symbols.push_back(cross_symbol);
    }

    TickerResult tickers = client_.get_tickers(symbols, true);
    auto it = tickers.quotes.find(symbol);
    if (it == tickers.quotes.end()) {
        result.kind = SizingError::QUOTE_UNAVAILABLE;
        result.error = "No quote for " + symbol + (tickers.error.empty() ? "" : ": " + tickers.error);
        LOG_ERROR(result.error);
        return result;
    }

    result.rate = it->second.entry_rate(side);
    if (result.rate <= 0.0) {
        result.kind = SizingError::QUOTE_UNAVAILABLE;
        result.error = "Invalid rate for " + symbol;
        LOG_ERROR(result.error);
        return result;
    }

    double cross = 1.0;
    if (needs_cross) {
        auto cross_it = tickers.quotes.find(cross_symbol);
        if (cross_it != tickers.quotes.end() && cross_it->second.bid > 0.0) {
            cross = cross_it->second.bid;
            result.cross_rate = cross;
        } else {
            LOG_WARNING("Cross rate " + cross_symbol + " unavailable, sizing " + symbol +
                        " without currency conversion");
        }
    }

    result.volume = compute_volume(result.available, leverage, result.rate, cross);
    result.success = true;

    LOG_INFO("Auto lot " + symbol + " " + side_to_string(side) +
             ": balance=" + std::to_string(balance) +
             ", available=" + std::to_string(result.available) +
             ", leverage=" + std::to_string(leverage) +
             ", rate=" + std::to_string(result.rate) +
             (result.cross_rate > 0.0 ? ", cross=" + std::to_string(result.cross_rate) : "") +
             ", volume=" + std::to_string(result.volume));
    return result;
}
