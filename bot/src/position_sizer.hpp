#ifndef POSITION_SIZER_HPP
#define POSITION_SIZER_HPP

#include "api_client.hpp"
#include "trade_types.hpp"
#include <string>
#include <cstdint>

enum class SizingError {
    NONE,
    INVALID_INPUT,
    QUOTE_UNAVAILABLE
};

struct SizingResult {
    bool success = false;
    SizingError kind = SizingError::NONE;
    std::string error;
    int64_t volume = 0;
    double available = 0.0;     // balance * risk_ratio * safety margin
    double rate = 0.0;          // ask for BUY, bid for SELL
    double cross_rate = 0.0;    // quote currency -> account currency, 0 when unused
};

class PositionSizer {
public:
    static constexpr int64_t MIN_VOLUME = 1;
    static constexpr int64_t MAX_VOLUME = 500000;
    static constexpr double SAFETY_MARGIN = 0.95;

    PositionSizer(SignedApiClient& client, double risk_ratio, const std::string& account_currency = "JPY");

    // Sizes an order from live quotes, bypassing the quote cache
    SizingResult size(double balance, const std::string& symbol, Side side, double leverage);

    // floor(available * leverage / (rate * cross_rate)) clamped to [MIN_VOLUME, MAX_VOLUME]
    static int64_t compute_volume(double available, double leverage, double rate, double cross_rate = 1.0);

    double risk_ratio() const { return risk_ratio_; }

private:
    SignedApiClient& client_;
    double risk_ratio_;
    std::string account_currency_;
};

#endif // POSITION_SIZER_HPP
