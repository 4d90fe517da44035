#include "doctest.h"
#include "../../../exchanges/gateway_factory.hpp"
#include "../../../exchanges/resilient_gateway.hpp"
#include "../../../exchanges/binance/http/binance_gateway.hpp"
#include "../../../exchanges/coinbase/http/coinbase_gateway.hpp"
#include "../../../utils/error_handling.hpp"
#include "../../../utils/metrics/metrics_collector.hpp"
#include "../../mocks/mock_exchange_gateway.hpp"
#include "../../mocks/mock_http_handler.hpp"
#include <memory>

using namespace exchanges;

namespace {

std::shared_ptr<resilience::CircuitBreaker> make_breaker(int failure_threshold = 3) {
    auto config = ResilientGateway::default_breaker_config();
    config.name = ResilientGateway::breaker_name("mockex");
    config.failure_threshold = failure_threshold;
    config.timeout = std::chrono::milliseconds(0);
    return std::make_shared<resilience::CircuitBreaker>(config);
}

} // namespace

TEST_CASE("GatewayFactory - Supported venues") {
    auto http = std::make_shared<MockHttpHandler>();
    ExchangeCredentials credentials{"key", "secret", std::nullopt, false};

    CHECK(GatewayFactory::get_supported_exchanges() == std::vector<std::string>{"binance", "coinbase"});
    CHECK(GatewayFactory::is_supported("Binance.com"));
    CHECK(GatewayFactory::is_supported("coinbase_advanced"));
    CHECK_FALSE(GatewayFactory::is_supported("kraken"));
    CHECK(GatewayFactory::normalize_exchange_name("COINBASE_PRO") == "coinbase");

    auto binance_gateway = GatewayFactory::create("binance", credentials, http);
    CHECK(binance_gateway->id() == "binance");
    CHECK(binance_gateway->name() == "Binance");
    CHECK(std::dynamic_pointer_cast<binance::BinanceGateway>(binance_gateway) != nullptr);

    VenueSettings settings;
    settings.base_url = "http://localhost:8080";
    auto coinbase_gateway = GatewayFactory::create("Coinbase", credentials, http, settings);
    auto coinbase_impl = std::dynamic_pointer_cast<coinbase::CoinbaseGateway>(coinbase_gateway);
    REQUIRE(coinbase_impl != nullptr);
    CHECK(coinbase_impl->base_url() == "http://localhost:8080");

    CHECK_THROWS_AS(GatewayFactory::create("kraken", credentials, http), error_handling::ConnectionError);
}

TEST_CASE("ResilientGateway - Delegates and charges the call budget") {
    auto inner = std::make_shared<MockExchangeGateway>();
    inner->set_ticker("BTC/USDT", 50000.0);
    ratelimit::RateLimiter limiter;
    ResilientGateway gateway("alice", inner, limiter, make_breaker());

    CHECK(gateway.id() == "mockex");
    CHECK(gateway.name() == "MockEx");
    CHECK(gateway.get_ticker("BTC/USDT").price == doctest::Approx(50000.0));
    CHECK(gateway.test_connection());
    CHECK(limiter.get_exchange_usage("alice", "mockex") == 2);
    CHECK(limiter.get_exchange_usage("bob", "mockex") == 0);

    SUBCASE("Lifecycle calls are free") {
        gateway.connect();
        CHECK(gateway.is_connected());
        gateway.disconnect();
        CHECK_FALSE(gateway.is_connected());
        CHECK(limiter.get_exchange_usage("alice", "mockex") == 2);
    }

    SUBCASE("Spent budget refuses before reaching the venue") {
        limiter.set_exchange_limit("mockex", 2);
        const auto rate_limited = METRICS_COUNTER(metrics::names::RATE_LIMITED).get();
        try {
            gateway.get_balances();
            FAIL("expected RateLimitExceededError");
        } catch (const error_handling::RateLimitExceededError& e) {
            CHECK(e.category() == "exchange:mockex");
            CHECK(e.retry_after_seconds() >= 1);
        }
        CHECK(inner->calls("get_balances") == 0);
        CHECK(METRICS_COUNTER(metrics::names::RATE_LIMITED).get() == rate_limited + 1);
    }
}

TEST_CASE("ResilientGateway - Venue faults open the breaker") {
    auto inner = std::make_shared<MockExchangeGateway>();
    inner->set_ticker("BTC/USDT", 50000.0);
    ratelimit::RateLimiter limiter;
    auto breaker = make_breaker(2);
    ResilientGateway gateway("alice", inner, limiter, breaker);

    const auto errors_before = METRICS_COUNTER(metrics::names::EXCHANGE_ERRORS).get();
    inner->fail_next(2);
    CHECK_THROWS_AS(gateway.get_ticker("BTC/USDT"), error_handling::ExchangeError);
    CHECK_THROWS_AS(gateway.get_ticker("BTC/USDT"), error_handling::ExchangeError);
    CHECK(breaker->get_state() == resilience::CircuitState::OPEN);
    CHECK(METRICS_COUNTER(metrics::names::EXCHANGE_ERRORS).get() == errors_before + 2);

    const auto rejections_before = METRICS_COUNTER(metrics::names::BREAKER_REJECTIONS).get();
    CHECK_THROWS_AS(gateway.get_ticker("BTC/USDT"), resilience::CircuitBreakerError);
    CHECK(inner->calls("get_ticker") == 2);
    CHECK(METRICS_COUNTER(metrics::names::BREAKER_REJECTIONS).get() == rejections_before + 1);
}

TEST_CASE("ResilientGateway - User errors do not count against the breaker") {
    auto config = ResilientGateway::default_breaker_config();
    CHECK(config.failure_threshold == 5);
    CHECK(config.success_threshold == 2);
    CHECK(config.reset_timeout == std::chrono::milliseconds(60000));

    CHECK(config.is_failure(error_handling::ExchangeError("mockex", "down", 503)));
    CHECK(config.is_failure(std::runtime_error("unexpected")));
    CHECK_FALSE(config.is_failure(error_handling::InvalidRequestError("bad symbol")));
    CHECK_FALSE(config.is_failure(error_handling::InsufficientBalanceError("USDT", 10.0, 5.0)));

    auto http = std::make_shared<MockHttpHandler>();
    auto inner = GatewayFactory::create("binance", ExchangeCredentials{"key", "secret", std::nullopt, false}, http);
    ratelimit::RateLimiter limiter;
    auto breaker = make_breaker(1);
    ResilientGateway gateway("alice", inner, limiter, breaker);

    OrderRequest request;
    request.symbol = "BTC/USDT";
    request.type = OrderType::LIMIT;
    request.quantity = 1.0;
    CHECK_THROWS_AS(gateway.create_order(request), error_handling::InvalidRequestError);
    request.quantity = 0.0;
    CHECK_THROWS_AS(gateway.create_order(request), error_handling::InvalidRequestError);
    CHECK(breaker->get_state() == resilience::CircuitState::CLOSED);
    CHECK(http->request_count() == 0);
    CHECK(ResilientGateway::breaker_name("binance") == "exchange:binance");

    CHECK_THROWS_AS(ResilientGateway("alice", nullptr, limiter, breaker), std::invalid_argument);
}
