/**
 * Tests for SignedApiClient: signing, error taxonomy, retries and the quote cache
 */

#include "test_support.hpp"
#include "../src/api_client.hpp"

using json = nlohmann::json;

static SignedApiClient::Options options() {
    SignedApiClient::Options o;
    o.api_key = "test-key";
    o.api_secret = "test-secret";
    return o;
}

TEST(test_signed_headers) {
    ManualClock clock(local_ms(10, 0));
    FakeExchange exchange;
    SignedApiClient client(options(), exchange, clock);

    BalanceResult balance = client.get_balance();
    ASSERT_TRUE(balance.success);
    ASSERT_NEAR(balance.available_amount, 1000000.0, 1e-6);

    std::vector<FakeExchange::Request> reqs = exchange.requests();
    ASSERT_EQ(reqs.size(), 1u);
    const HttpHeaders& h = reqs[0].headers;
    ASSERT_EQ(h.at("API-KEY"), "test-key");
    std::string ts = h.at("API-TIMESTAMP");
    ASSERT_EQ(ts, std::to_string(clock.now_ms()));
    ASSERT_EQ(h.at("API-SIGN"), util::hmac_sha256_hex("test-secret", ts + "GET" + "/v1/account/assets"));
    ASSERT_EQ(h.at("API-SIGN"), client.sign(ts, "GET", "/v1/account/assets", ""));
}

TEST(test_post_signature_covers_body) {
    ManualClock clock(local_ms(10, 0));
    FakeExchange exchange;
    exchange.set_quote("USD_JPY", 150.000, 150.005);
    SignedApiClient client(options(), exchange, clock);

    OrderResult order = client.place_market_order("USD_JPY", Side::BUY, 10000);
    ASSERT_TRUE(order.success);
    ASSERT_FALSE(order.order_id.empty());

    FakeExchange::Request req = exchange.requests().back();
    ASSERT_EQ(req.path, "/v1/order");
    json body = json::parse(req.body);
    ASSERT_EQ(body["symbol"].get<std::string>(), "USD_JPY");
    ASSERT_EQ(body["side"].get<std::string>(), "BUY");
    ASSERT_EQ(body["size"].get<std::string>(), "10000");
    ASSERT_EQ(body["executionType"].get<std::string>(), "MARKET");
    std::string ts = req.headers.at("API-TIMESTAMP");
    ASSERT_EQ(req.headers.at("API-SIGN"), util::hmac_sha256_hex("test-secret", ts + "POST" + "/v1/order" + req.body));
}

TEST(test_missing_credentials_fail_without_request) {
    ManualClock clock(local_ms(10, 0));
    FakeExchange exchange;
    SignedApiClient client(SignedApiClient::Options(), exchange, clock);

    BalanceResult balance = client.get_balance();
    ASSERT_FALSE(balance.success);
    ASSERT_TRUE(balance.kind == ApiError::AUTH_ERROR);
    ASSERT_TRUE(exchange.requests().empty());
}

TEST(test_throttle_retries_then_transient) {
    ManualClock clock(local_ms(10, 0));
    FakeExchange exchange;
    for (int i = 0; i < 3; i++) {
        exchange.script("/v1/account/assets", FakeExchange::error_response("ERR-5003", "Requests are too many"));
    }
    SignedApiClient client(options(), exchange, clock);

    int64_t start = clock.now_ms();
    BalanceResult balance = client.get_balance();
    ASSERT_FALSE(balance.success);
    ASSERT_TRUE(balance.kind == ApiError::TRANSIENT);
    ASSERT_EQ(exchange.count("GET", "/v1/account/assets"), 3);

    // Backoff of at least 1 s then 2 s between attempts
    ASSERT_TRUE(clock.now_ms() - start >= 3000);

    // Three throttles lowered the shared ceiling
    ASSERT_EQ(client.rate_limiter().current_limit(), 15);
}

TEST(test_throttle_then_success) {
    ManualClock clock(local_ms(10, 0));
    FakeExchange exchange;
    exchange.script("/v1/account/assets", FakeExchange::error_response("ERR-5003"));
    SignedApiClient client(options(), exchange, clock);

    BalanceResult balance = client.get_balance();
    ASSERT_TRUE(balance.success);
    ASSERT_EQ(exchange.count("GET", "/v1/account/assets"), 2);
    ASSERT_EQ(client.rate_limiter().consecutive_throttle_errors(), 0);
}

TEST(test_auth_errors_not_retried) {
    ManualClock clock(local_ms(10, 0));
    FakeExchange exchange;
    exchange.script("/v1/account/assets", FakeExchange::http_status(401));
    exchange.script("/v1/openPositions", FakeExchange::error_response("ERR-5010", "signature invalid"));
    SignedApiClient client(options(), exchange, clock);

    BalanceResult balance = client.get_balance();
    ASSERT_TRUE(balance.kind == ApiError::AUTH_ERROR);
    ASSERT_EQ(exchange.count("GET", "/v1/account/assets"), 1);

    PositionsResult positions = client.get_open_positions();
    ASSERT_TRUE(positions.kind == ApiError::AUTH_ERROR);
    ASSERT_EQ(exchange.count("GET", "/v1/openPositions"), 1);
}

TEST(test_transport_failure_retried) {
    ManualClock clock(local_ms(10, 0));
    FakeExchange exchange;
    exchange.script("/v1/account/assets", FakeExchange::transport_failure());
    exchange.script("/v1/account/assets", FakeExchange::http_status(503));
    SignedApiClient client(options(), exchange, clock);

    BalanceResult balance = client.get_balance();
    ASSERT_TRUE(balance.success);
    ASSERT_EQ(exchange.count("GET", "/v1/account/assets"), 3);
    ASSERT_EQ(client.api_calls(), 3);
    ASSERT_EQ(client.api_errors(), 2);
}

TEST(test_order_post_not_resent_after_lost_response) {
    ManualClock clock(local_ms(10, 0));
    FakeExchange exchange;
    exchange.script("/v1/order", FakeExchange::transport_failure());
    exchange.script("/v1/closeOrder", FakeExchange::http_status(502));
    SignedApiClient client(options(), exchange, clock);

    OrderResult order = client.place_market_order("USD_JPY", Side::BUY, 1000);
    ASSERT_FALSE(order.success);
    ASSERT_TRUE(order.kind == ApiError::TRANSIENT);
    ASSERT_EQ(exchange.count("POST", "/v1/order"), 1);

    OrderResult close = client.close_position("USD_JPY", Side::SELL, "1000", 1000);
    ASSERT_FALSE(close.success);
    ASSERT_EQ(exchange.count("POST", "/v1/closeOrder"), 1);

    // A confirmed throttle is still sent again
    exchange.set_quote("USD_JPY", 150.000, 150.005);
    exchange.script("/v1/order", FakeExchange::error_response("ERR-5003"));
    OrderResult throttled = client.place_market_order("USD_JPY", Side::BUY, 1000);
    ASSERT_TRUE(throttled.success);
    ASSERT_EQ(exchange.count("POST", "/v1/order"), 3);
}

TEST(test_malformed_and_rejected) {
    ManualClock clock(local_ms(10, 0));
    FakeExchange exchange;
    HttpResponse garbage;
    garbage.ok = true;
    garbage.status_code = 200;
    garbage.body = "<html>maintenance</html>";
    exchange.script("/v1/account/assets", garbage);
    exchange.order_failures = 1;
    SignedApiClient client(options(), exchange, clock);

    BalanceResult balance = client.get_balance();
    ASSERT_TRUE(balance.kind == ApiError::MALFORMED);

    OrderResult order = client.place_market_order("USD_JPY", Side::BUY, 1000);
    ASSERT_FALSE(order.success);
    ASSERT_TRUE(order.kind == ApiError::REJECTED);
    ASSERT_EQ(exchange.count("POST", "/v1/order"), 1);
}

TEST(test_error_code_classification) {
    ASSERT_TRUE(classify_error_code("ERR-5003") == ApiError::RATE_LIMITED);
    ASSERT_TRUE(classify_error_code("ERR-5010") == ApiError::AUTH_ERROR);
    ASSERT_TRUE(classify_error_code("ERR-5012") == ApiError::AUTH_ERROR);
    ASSERT_TRUE(classify_error_code("ERR-201") == ApiError::REJECTED);
    ASSERT_EQ(api_error_to_string(ApiError::TRANSIENT), "TRANSIENT");
}

TEST(test_quote_cache_ttl) {
    ManualClock clock(local_ms(10, 0));
    FakeExchange exchange;
    exchange.set_quote("USD_JPY", 150.000, 150.005);
    exchange.set_quote("EUR_USD", 1.10000, 1.10010);
    SignedApiClient client(options(), exchange, clock);

    TickerResult first = client.get_tickers({"USD_JPY", "EUR_USD"});
    ASSERT_TRUE(first.success);
    ASSERT_EQ(first.quotes.size(), 2u);
    ASSERT_EQ(exchange.count("GET", "/v1/ticker"), 1);
    ASSERT_EQ(exchange.requests().back().query, "symbol=USD_JPY,EUR_USD");

    // Served from cache within the TTL
    TickerResult cached = client.get_tickers({"USD_JPY"});
    ASSERT_TRUE(cached.success);
    ASSERT_EQ(exchange.count("GET", "/v1/ticker"), 1);

    // Fresh reads bypass the cache
    exchange.set_quote("USD_JPY", 151.000, 151.005);
    TickerResult fresh = client.get_tickers({"USD_JPY"}, true);
    ASSERT_EQ(exchange.count("GET", "/v1/ticker"), 2);
    ASSERT_NEAR(fresh.quotes.at("USD_JPY").bid, 151.000, 1e-9);

    // Expired entries are never served
    clock.advance(6000);
    exchange.remove_quote("EUR_USD");
    TickerResult expired = client.get_tickers({"EUR_USD"});
    ASSERT_FALSE(expired.success);
    ASSERT_TRUE(expired.quotes.empty());
}

TEST(test_response_normalizers) {
    json single = json::parse(R"({"orderId": "1"})");
    json listed = json::parse(R"([{"orderId": "2"}])");
    json wrapped = json::parse(R"({"list": [{"orderId": "3"}, {"orderId": "4"}]})");
    json empty_wrapped = json::parse(R"({"list": []})");

    ASSERT_EQ(json_string(first_object(single), "orderId"), "1");
    ASSERT_EQ(json_string(first_object(listed), "orderId"), "2");
    ASSERT_EQ(json_string(first_object(wrapped), "orderId"), "3");
    ASSERT_TRUE(first_object(empty_wrapped).is_null());

    ASSERT_EQ(list_of(single).size(), 1u);
    ASSERT_EQ(list_of(listed).size(), 1u);
    ASSERT_EQ(list_of(wrapped).size(), 2u);
    ASSERT_EQ(list_of(empty_wrapped).size(), 0u);
    ASSERT_EQ(list_of(json::object()).size(), 0u);

    json mixed = json::parse(R"({"a": "1.5", "b": 2, "c": "x", "d": 42})");
    ASSERT_NEAR(json_number(mixed, "a"), 1.5, 1e-12);
    ASSERT_NEAR(json_number(mixed, "b"), 2.0, 1e-12);
    ASSERT_NEAR(json_number(mixed, "c", -1.0), -1.0, 1e-12);
    ASSERT_EQ(json_string(mixed, "d"), "42");
}

TEST(test_close_position_request) {
    ManualClock clock(local_ms(10, 0));
    FakeExchange exchange;
    exchange.set_quote("USD_JPY", 150.000, 150.005);
    std::string id = exchange.add_position("USD_JPY", "BUY", 150.005, 10000);
    SignedApiClient client(options(), exchange, clock);

    PositionsResult open = client.get_open_positions("USD_JPY");
    ASSERT_TRUE(open.success);
    ASSERT_EQ(open.positions.size(), 1u);
    ASSERT_EQ(open.positions[0].position_id, id);
    ASSERT_TRUE(open.positions[0].side == Side::BUY);
    ASSERT_EQ(open.positions[0].size, 10000);
    ASSERT_NEAR(open.positions[0].entry_price, 150.005, 1e-9);

    OrderResult close = client.close_position("USD_JPY", Side::SELL, id, 10000);
    ASSERT_TRUE(close.success);
    json body = json::parse(exchange.requests().back().body);
    ASSERT_EQ(body["side"].get<std::string>(), "SELL");
    ASSERT_TRUE(body["settlePosition"][0]["positionId"].is_number_integer());
    ASSERT_EQ(body["settlePosition"][0]["size"].get<std::string>(), "10000");
    ASSERT_EQ(exchange.open_position_count(), 0u);

    ExecutionsResult execs = client.get_executions(close.order_id);
    ASSERT_TRUE(execs.success);
    ASSERT_EQ(execs.executions.size(), 1u);
    ASSERT_NEAR(execs.executions[0].price, 150.000, 1e-9);
}

int main() {
    std::cout << "SignedApiClient Tests:\n";

    RUN_TEST(test_signed_headers);
    RUN_TEST(test_post_signature_covers_body);
    RUN_TEST(test_missing_credentials_fail_without_request);
    RUN_TEST(test_throttle_retries_then_transient);
    RUN_TEST(test_throttle_then_success);
    RUN_TEST(test_auth_errors_not_retried);
    RUN_TEST(test_transport_failure_retried);
    RUN_TEST(test_order_post_not_resent_after_lost_response);
    RUN_TEST(test_malformed_and_rejected);
    RUN_TEST(test_error_code_classification);
    RUN_TEST(test_quote_cache_ttl);
    RUN_TEST(test_response_normalizers);
    RUN_TEST(test_close_position_request);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
