#ifndef API_CLIENT_HPP
#define API_CLIENT_HPP

#include "clock.hpp"
#include "http_transport.hpp"
#include "rate_limiter.hpp"
#include "retry_policy.hpp"
#include "trade_types.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

enum class ApiError {
    NONE,
    TRANSIENT,      // network, timeout, 5xx, exhausted throttling retries
    RATE_LIMITED,   // exchange throttling code
    AUTH_ERROR,     // bad or missing credentials
    MALFORMED,      // unparseable body or missing required field
    REJECTED        // exchange refused the request (e.g. insufficient margin)
};

std::string api_error_to_string(ApiError kind);

// Maps an exchange message_code to the error taxonomy
ApiError classify_error_code(const std::string& code);

// Result types for API responses
struct ApiResponse {
    bool success = false;
    ApiError kind = ApiError::NONE;
    std::string error;
    nlohmann::json data;
};

struct BalanceResult {
    bool success = false;
    ApiError kind = ApiError::NONE;
    std::string error;
    double balance = 0.0;
    double available_amount = 0.0;
};

struct TickerResult {
    bool success = false;
    ApiError kind = ApiError::NONE;
    std::string error;
    std::map<std::string, Quote> quotes;
};

struct OrderResult {
    bool success = false;
    ApiError kind = ApiError::NONE;
    std::string error;
    std::string order_id;
};

struct Execution {
    std::string order_id;
    std::string position_id;
    std::string symbol;
    double price = 0.0;
    double size = 0.0;
    double fee = 0.0;
    std::string timestamp;
};

struct ExecutionsResult {
    bool success = false;
    ApiError kind = ApiError::NONE;
    std::string error;
    std::vector<Execution> executions;
};

struct PositionsResult {
    bool success = false;
    ApiError kind = ApiError::NONE;
    std::string error;
    std::vector<Position> positions;
};

// Response shape normalizers. The exchange returns `data` either as a single
// object, a list, or an object wrapping `list`.
nlohmann::json first_object(const nlohmann::json& data);
nlohmann::json list_of(const nlohmann::json& data);

// Numbers arrive as strings or numbers depending on the endpoint
double json_number(const nlohmann::json& obj, const std::string& key, double fallback = 0.0);
std::string json_string(const nlohmann::json& obj, const std::string& key);

class SignedApiClient {
public:
    struct Options {
        std::string private_base = "https://forex-api.coin.z.com/private";
        std::string public_base = "https://forex-api.coin.z.com/public";
        std::string api_key;
        std::string api_secret;
        int64_t quote_ttl_ms = 5000;
        RetryPolicy retry = RetryPolicy::exponential_backoff(3, 1000, 60000, 1000);
    };

    SignedApiClient(const Options& options, HttpTransport& transport, Clock& clock);

    // Signed private call. `query` is appended to the URL but not signed.
    ApiResponse call_private(const std::string& method, const std::string& path,
                             const std::string& query = "",
                             const nlohmann::json& body = nlohmann::json());

    // Unsigned public call
    ApiResponse call_public(const std::string& path, const std::string& query = "");

    BalanceResult get_balance();

    // Quotes for `symbols`, served from the TTL cache unless `fresh`
    TickerResult get_tickers(const std::vector<std::string>& symbols, bool fresh = false);

    OrderResult place_market_order(const std::string& symbol, Side side, int64_t size);

    // `side` is the closing side (opposite of the position's side)
    OrderResult close_position(const std::string& symbol, Side side,
                               const std::string& position_id, int64_t size);

    ExecutionsResult get_executions(const std::string& order_id);

    // All open positions, or only those for `symbol` when non-empty
    PositionsResult get_open_positions(const std::string& symbol = "");

    // Builds the API-SIGN header value
    std::string sign(const std::string& timestamp, const std::string& method,
                     const std::string& path, const std::string& body) const;

    bool has_credentials() const { return !options_.api_key.empty() && !options_.api_secret.empty(); }

    int64_t api_calls() const { return api_calls_; }
    int64_t api_errors() const { return api_errors_; }
    RateLimiter& rate_limiter() { return rate_limiter_; }
    const RateLimiter& rate_limiter() const { return rate_limiter_; }
    Clock& clock() { return clock_; }

    void clear_quote_cache();

private:
    ApiResponse execute(const std::string& method, const std::string& base,
                        const std::string& path, const std::string& query,
                        const std::string& body, bool signed_request);

    static Position parse_position(const nlohmann::json& p);

    Options options_;
    HttpTransport& transport_;
    Clock& clock_;
    RateLimiter rate_limiter_;

    std::atomic<int64_t> api_calls_{0};
    std::atomic<int64_t> api_errors_{0};

    std::mutex cache_mutex_;
    std::map<std::string, Quote> quote_cache_;
};

#endif // API_CLIENT_HPP
