#include "api_client.hpp"
#include "logger.hpp"
#include "util.hpp"
#include <cctype>
#include <set>

using json = nlohmann::json;

std::string api_error_to_string(ApiError kind) {
    switch (kind) {
        case ApiError::NONE:         return "NONE";
        case ApiError::TRANSIENT:    return "TRANSIENT";
        case ApiError::RATE_LIMITED: return "RATE_LIMITED";
        case ApiError::AUTH_ERROR:   return "AUTH_ERROR";
        case ApiError::MALFORMED:    return "MALFORMED";
        case ApiError::REJECTED:     return "REJECTED";
        default:                     return "UNKNOWN";
    }
}

ApiError classify_error_code(const std::string& code) {
    if (code == "ERR-5003") return ApiError::RATE_LIMITED;
    if (code == "ERR-5010" || code == "ERR-5011" || code == "ERR-5012" || code == "ERR-5014") {
        return ApiError::AUTH_ERROR;
    }
    return ApiError::REJECTED;
}

json first_object(const json& data) {
    if (data.is_array()) {
        if (!data.empty() && data[0].is_object()) {
            return data[0];
        }
        return json();
    }
    if (data.is_object()) {
        if (data.contains("list") && data["list"].is_array()) {
            return first_object(data["list"]);
        }
        return data;
    }
    return json();
}

json list_of(const json& data) {
    if (data.is_array()) {
        return data;
    }
    if (data.is_object()) {
        if (data.contains("list")) {
            return data["list"].is_array() ? data["list"] : json::array();
        }
        if (data.empty()) {
            return json::array();
        }
        return json::array({data});
    }
    return json::array();
}

double json_number(const json& obj, const std::string& key, double fallback) {
    if (!obj.is_object() || !obj.contains(key)) {
        return fallback;
    }
    const json& v = obj[key];
    if (v.is_number()) {
        return v.get<double>();
    }
    if (v.is_string()) {
        try {
            return std::stod(v.get<std::string>());
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

std::string json_string(const json& obj, const std::string& key) {
    if (!obj.is_object() || !obj.contains(key)) {
        return "";
    }
    const json& v = obj[key];
    if (v.is_string()) {
        return v.get<std::string>();
    }
    if (v.is_null()) {
        return "";
    }
    return v.dump();
}

static json position_id_value(const std::string& position_id) {
    if (position_id.empty()) {
        return position_id;
    }
    for (char c : position_id) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return position_id;
        }
    }
    return std::stoll(position_id);
}

SignedApiClient::SignedApiClient(const Options& options, HttpTransport& transport, Clock& clock)
    : options_(options)
    , transport_(transport)
    , clock_(clock)
    , rate_limiter_(clock) {
    if (!has_credentials()) {
        LOG_WARNING("API key or secret not set, private endpoints will not be available");
    }
}

std::string SignedApiClient::sign(const std::string& timestamp, const std::string& method,
                                  const std::string& path, const std::string& body) const {
    return util::hmac_sha256_hex(options_.api_secret, timestamp + method + path + body);
}

ApiResponse SignedApiClient::call_private(const std::string& method, const std::string& path,
                                          const std::string& query, const json& body) {
    std::string body_str = body.is_null() ? "" : body.dump();
    return execute(method, options_.private_base, path, query, body_str, true);
}

ApiResponse SignedApiClient::call_public(const std::string& path, const std::string& query) {
    return execute("GET", options_.public_base, path, query, "", false);
}

ApiResponse SignedApiClient::execute(const std::string& method, const std::string& base,
                                     const std::string& path, const std::string& query,
                                     const std::string& body, bool signed_request) {
    ApiResponse result;

    if (signed_request && !has_credentials()) {
        result.kind = ApiError::AUTH_ERROR;
        result.error = "API credentials not configured";
        return result;
    }

    std::string url = base + path;
    if (!query.empty()) {
        url += "?" + query;
    }

    const RetryPolicy& retry = options_.retry;
    std::string last_error;

    for (int attempt = 0; attempt < retry.max_attempts; attempt++) {
        if (!rate_limiter_.acquire(method)) {
            result.kind = ApiError::TRANSIENT;
            result.error = "Interrupted by shutdown";
            return result;
        }

        api_calls_++;

        HttpHeaders headers;
        if (signed_request) {
            // Timestamp must be generated right before sending, per attempt
            std::string timestamp = std::to_string(clock_.now_ms());
            headers["API-KEY"] = options_.api_key;
            headers["API-TIMESTAMP"] = timestamp;
            headers["API-SIGN"] = sign(timestamp, method, path, body);
        }

        LOG_DEBUG(method + " " + url + (body.empty() ? "" : " " + body));

        HttpResponse http = method == "POST" ? transport_.post(url, body, headers)
                                             : transport_.get(url, headers);

        ApiError attempt_kind = ApiError::TRANSIENT;

        if (!http.ok) {
            last_error = http.error.empty() ? "Transport failure" : http.error;
        } else if (http.status_code == 401 || http.status_code == 403) {
            api_errors_++;
            result.kind = ApiError::AUTH_ERROR;
            result.error = "HTTP " + std::to_string(http.status_code) + " on " + path;
            LOG_ERROR("API auth error: " + result.error);
            return result;
        } else if (http.status_code == 429) {
            attempt_kind = ApiError::RATE_LIMITED;
            last_error = "HTTP 429 on " + path;
            rate_limiter_.on_throttle();
        } else if (http.status_code >= 500) {
            last_error = "HTTP " + std::to_string(http.status_code) + " on " + path;
        } else {
            json j;
            try {
                j = json::parse(http.body);
            } catch (const json::exception& e) {
                api_errors_++;
                result.kind = http.status_code == 200 ? ApiError::MALFORMED : ApiError::REJECTED;
                result.error = "HTTP " + std::to_string(http.status_code) + " on " + path +
                               ": JSON parse error: " + std::string(e.what());
                LOG_ERROR(result.error);
                return result;
            }

            if (!j.is_object() || !j.contains("status") || !j["status"].is_number()) {
                api_errors_++;
                result.kind = ApiError::MALFORMED;
                result.error = "Missing status in response from " + path;
                LOG_ERROR(result.error);
                return result;
            }

            if (j["status"].get<int>() != 0) {
                std::string code;
                std::string message;
                if (j.contains("messages") && j["messages"].is_array() && !j["messages"].empty()) {
                    code = json_string(j["messages"][0], "message_code");
                    message = json_string(j["messages"][0], "message_string");
                }
                api_errors_++;
                ApiError kind = classify_error_code(code);
                last_error = code + (message.empty() ? "" : " " + message);

                if (kind == ApiError::RATE_LIMITED) {
                    attempt_kind = ApiError::RATE_LIMITED;
                    rate_limiter_.on_throttle();
                    LOG_WARNING("Exchange throttled " + method + " " + path + " (attempt " +
                                std::to_string(attempt + 1) + "/" + std::to_string(retry.max_attempts) + ")");
                    if (attempt + 1 < retry.max_attempts && !clock_.sleep_ms(retry.delay_for(attempt))) {
                        break;
                    }
                    continue;
                }

                rate_limiter_.on_success();
                result.kind = kind;
                result.error = "API error on " + path + ": " + last_error;
                LOG_ERROR(result.error);
                return result;
            }

            rate_limiter_.on_success();

            if (!j.contains("data")) {
                api_errors_++;
                result.kind = ApiError::MALFORMED;
                result.error = "No data in response from " + path;
                LOG_ERROR(result.error);
                return result;
            }

            result.success = true;
            result.data = j["data"];
            return result;
        }

        // Transport failure, 429 or 5xx
        api_errors_++;

        // An order POST may have executed even though no answer came back.
        // Only an exchange-confirmed throttle is safe to send again.
        if (method == "POST" && attempt_kind != ApiError::RATE_LIMITED) {
            result.kind = ApiError::TRANSIENT;
            result.error = "Outcome unknown on " + path + ", not resent: " + last_error;
            LOG_ERROR(result.error);
            return result;
        }

        LOG_WARNING("Request " + method + " " + path + " failed (" + api_error_to_string(attempt_kind) +
                    ", attempt " + std::to_string(attempt + 1) + "/" + std::to_string(retry.max_attempts) +
                    "): " + last_error);
        if (attempt + 1 < retry.max_attempts) {
            int64_t delay = retry.delay_for(attempt);
            if (!clock_.sleep_ms(delay)) {
                break;
            }
        }
    }

    result.kind = ApiError::TRANSIENT;
    result.error = "Max retries exceeded on " + path + (last_error.empty() ? "" : ": " + last_error);
    LOG_ERROR(result.error);
    return result;
}

BalanceResult SignedApiClient::get_balance() {
    BalanceResult result;

    ApiResponse resp = call_private("GET", "/v1/account/assets");
    if (!resp.success) {
        result.kind = resp.kind;
        result.error = resp.error;
        return result;
    }

    json assets = first_object(resp.data);
    if (!assets.is_object() || !assets.contains("availableAmount")) {
        result.kind = ApiError::MALFORMED;
        result.error = "No availableAmount in assets response";
        LOG_ERROR(result.error + ": " + resp.data.dump());
        return result;
    }

    result.balance = json_number(assets, "balance");
    result.available_amount = json_number(assets, "availableAmount");
    result.success = true;
    LOG_DEBUG("Balance: " + std::to_string(result.balance) +
              ", available: " + std::to_string(result.available_amount));
    return result;
}

TickerResult SignedApiClient::get_tickers(const std::vector<std::string>& symbols, bool fresh) {
    TickerResult result;

    std::vector<std::string> missing;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        int64_t now = clock_.now_ms();
        for (const auto& symbol : symbols) {
            auto it = quote_cache_.find(symbol);
            if (fresh || it == quote_cache_.end() || it->second.expiry_ms <= now) {
                missing.push_back(symbol);
            }
        }
    }

    std::set<std::string> fetched;
    if (!missing.empty()) {
        std::string joined;
        for (const auto& s : missing) {
            if (!joined.empty()) joined += ",";
            joined += s;
        }

        ApiResponse resp = call_public("/v1/ticker", "symbol=" + joined);
        if (resp.success) {
            int64_t expiry = clock_.now_ms() + options_.quote_ttl_ms;
            std::lock_guard<std::mutex> lock(cache_mutex_);
            for (const auto& item : list_of(resp.data)) {
                Quote q;
                q.symbol = json_string(item, "symbol");
                q.bid = json_number(item, "bid");
                q.ask = json_number(item, "ask");
                q.expiry_ms = expiry;
                if (q.symbol.empty() || q.bid <= 0.0 || q.ask <= 0.0) {
                    continue;
                }
                quote_cache_[q.symbol] = q;
                fetched.insert(q.symbol);
            }
        } else {
            result.kind = resp.kind;
            result.error = resp.error;
        }
    }

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        int64_t now = clock_.now_ms();
        for (const auto& symbol : symbols) {
            if (fresh && fetched.count(symbol) == 0) {
                continue;
            }
            auto it = quote_cache_.find(symbol);
            if (it != quote_cache_.end() && it->second.expiry_ms > now) {
                result.quotes[symbol] = it->second;
            }
        }
    }

    result.success = result.quotes.size() == symbols.size();
    if (!result.success && result.error.empty()) {
        for (const auto& symbol : symbols) {
            if (result.quotes.count(symbol) == 0) {
                result.error += (result.error.empty() ? "No quote for " : ", ") + symbol;
            }
        }
        result.kind = ApiError::MALFORMED;
    }
    return result;
}

void SignedApiClient::clear_quote_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    quote_cache_.clear();
}

OrderResult SignedApiClient::place_market_order(const std::string& symbol, Side side, int64_t size) {
    OrderResult result;

    json body = json::object();
    body["symbol"] = symbol;
    body["side"] = side_to_string(side);
    body["size"] = std::to_string(size);
    body["executionType"] = "MARKET";

    LOG_INFO("Placing market " + side_to_string(side) + " order: " + std::to_string(size) + " " + symbol);

    ApiResponse resp = call_private("POST", "/v1/order", "", body);
    if (!resp.success) {
        result.kind = resp.kind;
        result.error = resp.error;
        return result;
    }

    result.order_id = json_string(first_object(resp.data), "orderId");
    if (result.order_id.empty()) {
        result.kind = ApiError::MALFORMED;
        result.error = "No orderId in order response: " + resp.data.dump();
        LOG_ERROR(result.error);
        return result;
    }

    result.success = true;
    LOG_INFO("Order placed successfully, orderId: " + result.order_id);
    return result;
}

OrderResult SignedApiClient::close_position(const std::string& symbol, Side side,
                                            const std::string& position_id, int64_t size) {
    OrderResult result;

    json settle = json::object();
    settle["positionId"] = position_id_value(position_id);
    settle["size"] = std::to_string(size);

    json body = json::object();
    body["symbol"] = symbol;
    body["side"] = side_to_string(side);
    body["executionType"] = "MARKET";
    body["settlePosition"] = json::array();
    body["settlePosition"].push_back(settle);

    LOG_INFO("Closing position " + position_id + ": " + side_to_string(side) + " " +
             std::to_string(size) + " " + symbol);

    ApiResponse resp = call_private("POST", "/v1/closeOrder", "", body);
    if (!resp.success) {
        result.kind = resp.kind;
        result.error = resp.error;
        return result;
    }

    result.order_id = json_string(first_object(resp.data), "orderId");
    if (result.order_id.empty()) {
        result.kind = ApiError::MALFORMED;
        result.error = "No orderId in close response: " + resp.data.dump();
        LOG_ERROR(result.error);
        return result;
    }

    result.success = true;
    LOG_INFO("Close order placed, orderId: " + result.order_id);
    return result;
}

ExecutionsResult SignedApiClient::get_executions(const std::string& order_id) {
    ExecutionsResult result;

    ApiResponse resp = call_private("GET", "/v1/executions", "orderId=" + order_id);
    if (!resp.success) {
        result.kind = resp.kind;
        result.error = resp.error;
        return result;
    }

    for (const auto& item : list_of(resp.data)) {
        Execution e;
        e.order_id = json_string(item, "orderId");
        e.position_id = json_string(item, "positionId");
        e.symbol = json_string(item, "symbol");
        e.price = json_number(item, "price");
        e.size = json_number(item, "size");
        e.fee = json_number(item, "fee");
        e.timestamp = json_string(item, "timestamp");
        result.executions.push_back(e);
    }

    result.success = true;
    return result;
}

Position SignedApiClient::parse_position(const json& p) {
    Position pos;
    pos.position_id = json_string(p, "positionId");
    pos.symbol = json_string(p, "symbol");
    Side side = Side::BUY;
    if (string_to_side(json_string(p, "side"), side)) {
        pos.side = side;
    }
    pos.entry_price = json_number(p, "price");
    pos.size = static_cast<int64_t>(json_number(p, "size"));
    pos.open_time = json_string(p, "openTime");
    return pos;
}

PositionsResult SignedApiClient::get_open_positions(const std::string& symbol) {
    PositionsResult result;

    ApiResponse resp = call_private("GET", "/v1/openPositions", symbol.empty() ? "" : "symbol=" + symbol);
    if (!resp.success) {
        result.kind = resp.kind;
        result.error = resp.error;
        return result;
    }

    for (const auto& item : list_of(resp.data)) {
        Position pos = parse_position(item);
        if (pos.position_id.empty() || pos.symbol.empty()) {
            LOG_WARNING("Skipping malformed position entry: " + item.dump());
            continue;
        }
        result.positions.push_back(pos);
    }

    result.success = true;
    return result;
}
