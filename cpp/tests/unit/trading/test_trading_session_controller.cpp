#include "doctest.h"
#include "../../../trading/trading_session_controller.hpp"
#include "../../../exchanges/resilient_gateway.hpp"
#include "../../../utils/error_handling.hpp"
#include "../../mocks/mock_exchange_gateway.hpp"
#include "../../mocks/mock_http_handler.hpp"
#include <memory>
#include <vector>

using namespace trading;
using exchanges::OrderRequest;
using exchanges::OrderSide;
using exchanges::OrderStatus;
using exchanges::OrderType;

namespace {

StoredConnection connection(const std::string& id, const std::string& user, const std::string& exchange = "mockex") {
    StoredConnection record;
    record.id = id;
    record.user_id = user;
    record.exchange = exchange;
    record.encrypted_api_key = "key-" + id;
    record.encrypted_api_secret = "secret-" + id;
    return record;
}

// Hands out a fresh MockExchangeGateway per connect and remembers the credentials it saw
struct SessionFixture {
    std::shared_ptr<InMemoryCredentialStore> store = std::make_shared<InMemoryCredentialStore>();
    std::vector<std::shared_ptr<MockExchangeGateway>> built;
    std::vector<exchanges::ExchangeCredentials> seen_credentials;
    bool next_credentials_valid = true;

    TradingSessionController controller{
        store, std::make_shared<PlaintextDecryptor>(),
        [this](const std::string&, const std::string& exchange, const exchanges::ExchangeCredentials& credentials)
            -> std::shared_ptr<exchanges::IExchangeGateway> {
            if (exchange != "mockex") {
                throw error_handling::ConnectionError("Unsupported exchange: " + exchange);
            }
            auto gateway = std::make_shared<MockExchangeGateway>();
            gateway->set_ticker("BTC/USDT", 50000.0);
            gateway->credentials_valid = next_credentials_valid;
            built.push_back(gateway);
            seen_credentials.push_back(credentials);
            return gateway;
        }};

    SessionFixture() {
        store->add(connection("conn-a", "alice"));
        store->add(connection("conn-b", "bob"));
        store->add(connection("conn-x", "alice", "kraken"));
    }
};

OrderRequest market_buy(double quantity) {
    OrderRequest request;
    request.symbol = "BTC/USDT";
    request.side = OrderSide::BUY;
    request.type = OrderType::MARKET;
    request.quantity = quantity;
    return request;
}

} // namespace

TEST_CASE("TradingSessionController - Trading modes") {
    CHECK(to_string(TradingMode::PAPER) == "paper");
    CHECK(to_string(TradingMode::LIVE) == "live");
    CHECK(parse_trading_mode("LIVE") == TradingMode::LIVE);
    CHECK(parse_trading_mode("paper") == TradingMode::PAPER);
    CHECK_THROWS_AS(parse_trading_mode("demo"), error_handling::InvalidRequestError);
    CHECK_THROWS_AS(parse_trading_mode("L\xC3\x8FVE"), error_handling::InvalidRequestError);
}

TEST_CASE("TradingSessionController - Connect starts in paper mode") {
    SessionFixture f;

    auto initial = f.controller.get_state("alice");
    CHECK_FALSE(initial.is_connected);
    CHECK_FALSE(initial.can_trade);
    CHECK_FALSE(initial.exchange_id.has_value());

    auto state = f.controller.connect_exchange("alice", "conn-a");
    CHECK(state.is_connected);
    CHECK(state.can_trade);
    CHECK(state.mode == TradingMode::PAPER);
    REQUIRE(state.exchange_id.has_value());
    CHECK(*state.exchange_id == "mockex");
    CHECK(*state.exchange_name == "MockEx");

    REQUIRE(f.built.size() == 1);
    CHECK(f.built[0]->connect_calls == 1);
    CHECK(f.built[0]->calls("test_connection") == 1);
    CHECK(f.seen_credentials[0].api_key == "key-conn-a");
    CHECK(f.seen_credentials[0].api_secret == "secret-conn-a");
    CHECK(f.controller.session_count() == 1);

    auto paper = f.controller.get_paper_engine("alice");
    REQUIRE(paper != nullptr);
    CHECK(paper->real() == f.built[0]);
    CHECK(f.controller.get_active_gateway("alice") == paper);
}

TEST_CASE("TradingSessionController - Connection failures") {
    SessionFixture f;

    SUBCASE("Unknown and foreign records look the same") {
        CHECK_THROWS_WITH_AS(f.controller.connect_exchange("alice", "missing"),
                             "Exchange connection not found", error_handling::ConnectionError);
        CHECK_THROWS_WITH_AS(f.controller.connect_exchange("alice", "conn-b"),
                             "Exchange connection not found", error_handling::ConnectionError);
        CHECK(f.built.empty());
    }

    SUBCASE("Unsupported venue") {
        CHECK_THROWS_AS(f.controller.connect_exchange("alice", "conn-x"), error_handling::ConnectionError);
    }

    SUBCASE("Rejected credentials leave no session") {
        f.next_credentials_valid = false;
        CHECK_THROWS_WITH_AS(f.controller.connect_exchange("alice", "conn-a"),
                             "Invalid API credentials for MockEx", error_handling::ConnectionError);
        REQUIRE(f.built.size() == 1);
        CHECK(f.built[0]->disconnect_calls == 1);
        CHECK_FALSE(f.controller.get_state("alice").is_connected);
        CHECK(f.controller.session_count() == 0);
    }

    SUBCASE("An open circuit during the connection test still disconnects the venue") {
        std::shared_ptr<MockExchangeGateway> tripped;
        TradingSessionController controller{
            f.store, std::make_shared<PlaintextDecryptor>(),
            [&tripped](const std::string&, const std::string&, const exchanges::ExchangeCredentials&)
                -> std::shared_ptr<exchanges::IExchangeGateway> {
                tripped = std::make_shared<MockExchangeGateway>();
                tripped->breaker_open = true;
                tripped->fail_disconnect = true;
                return tripped;
            }};

        CHECK_THROWS_AS(controller.connect_exchange("alice", "conn-a"), resilience::CircuitBreakerError);
        REQUIRE(tripped != nullptr);
        CHECK(tripped->disconnect_calls == 1);
        CHECK_FALSE(tripped->is_connected());
        CHECK(controller.session_count() == 0);
    }

    CHECK_THROWS_AS(TradingSessionController(f.store, nullptr, nullptr), std::invalid_argument);
}

TEST_CASE("TradingSessionController - Reconnect replaces the session") {
    SessionFixture f;
    f.controller.connect_exchange("alice", "conn-a");
    f.controller.switch_mode("alice", TradingMode::LIVE, true);

    f.built[0]->fail_disconnect = true;
    auto state = f.controller.connect_exchange("alice", "conn-a");
    CHECK(state.mode == TradingMode::PAPER);
    REQUIRE(f.built.size() == 2);
    CHECK(f.built[0]->disconnect_calls == 1);
    CHECK(f.controller.session_count() == 1);
    CHECK(f.controller.get_paper_engine("alice")->real() == f.built[1]);
}

TEST_CASE("TradingSessionController - Mode switching") {
    SessionFixture f;

    CHECK_THROWS_AS(f.controller.switch_mode("alice", TradingMode::LIVE, true), error_handling::NoSessionError);

    f.controller.connect_exchange("alice", "conn-a");
    CHECK_THROWS_AS(f.controller.switch_mode("alice", TradingMode::LIVE), error_handling::AcknowledgmentRequiredError);
    CHECK(f.controller.get_state("alice").mode == TradingMode::PAPER);

    f.controller.switch_mode("alice", TradingMode::LIVE, true);
    CHECK(f.controller.get_state("alice").mode == TradingMode::LIVE);
    CHECK(f.controller.get_active_gateway("alice") == f.built[0]);

    f.controller.switch_mode("alice", TradingMode::PAPER);
    CHECK(f.controller.get_state("alice").mode == TradingMode::PAPER);
}

TEST_CASE("TradingSessionController - Orders route by mode") {
    SessionFixture f;
    f.controller.connect_exchange("alice", "conn-a");

    auto paper_order = f.controller.create_order("alice", market_buy(0.1));
    CHECK(paper_order.id.rfind("paper_", 0) == 0);
    CHECK(f.built[0]->calls("create_order") == 0);
    CHECK(f.controller.get_balance("alice", "BTC")->available == doctest::Approx(0.1));

    f.controller.switch_mode("alice", TradingMode::LIVE, true);
    auto live_order = f.controller.create_order("alice", market_buy(0.2));
    CHECK(live_order.id == "live_1");
    CHECK(f.built[0]->calls("create_order") == 1);

    SUBCASE("Paper ledger survives a trip to live mode") {
        f.controller.switch_mode("alice", TradingMode::PAPER);
        auto history = f.controller.get_order_history("alice");
        REQUIRE(history.size() == 1);
        CHECK(history[0].id == paper_order.id);
    }
}

TEST_CASE("TradingSessionController - Users are isolated") {
    SessionFixture f;
    f.controller.connect_exchange("alice", "conn-a");
    f.controller.connect_exchange("bob", "conn-b");

    f.controller.create_order("alice", market_buy(0.5));
    CHECK(f.controller.get_balance("alice", "BTC").has_value());
    CHECK_FALSE(f.controller.get_balance("bob", "BTC").has_value());

    f.controller.switch_mode("alice", TradingMode::LIVE, true);
    CHECK(f.controller.get_state("bob").mode == TradingMode::PAPER);
}

TEST_CASE("TradingSessionController - Delegated operations require a session") {
    SessionFixture f;
    CHECK_THROWS_AS(f.controller.get_ticker("alice", "BTC/USDT"), error_handling::NoSessionError);
    CHECK_THROWS_AS(f.controller.get_balances("alice"), error_handling::NoSessionError);
    CHECK_THROWS_AS(f.controller.create_order("alice", market_buy(1.0)), error_handling::NoSessionError);
    CHECK_THROWS_AS(f.controller.get_positions("alice"), error_handling::NoSessionError);
    CHECK_THROWS_AS(f.controller.reset_paper_account("alice"), error_handling::NoSessionError);
    CHECK_THROWS_WITH(f.controller.get_trades("alice"), "Connect an exchange first before trading");
}

TEST_CASE("TradingSessionController - Portfolio value and paper reset") {
    SessionFixture f;
    f.controller.connect_exchange("alice", "conn-a");

    // USD and USDT seed balances of 100000 each
    CHECK(f.controller.get_portfolio_value("alice") == doctest::Approx(200000.0));

    f.controller.create_order("alice", market_buy(1.0));
    f.built[0]->set_ticker("BTC/USDT", 60000.0);
    // 200000 - 50000 - 50 fee + 1 BTC at 60000
    CHECK(f.controller.get_portfolio_value("alice") == doctest::Approx(209950.0));

    f.controller.reset_paper_account("alice");
    CHECK(f.controller.get_portfolio_value("alice") == doctest::Approx(200000.0));
    CHECK(f.controller.get_trades("alice").empty());
}

TEST_CASE("TradingSessionController - Disconnect") {
    SessionFixture f;
    f.controller.connect_exchange("alice", "conn-a");
    f.controller.connect_exchange("bob", "conn-b");

    f.built[0]->fail_disconnect = true;
    CHECK_NOTHROW(f.controller.disconnect_exchange("alice"));
    CHECK_FALSE(f.controller.get_state("alice").is_connected);
    CHECK_NOTHROW(f.controller.disconnect_exchange("alice"));

    f.controller.disconnect_all();
    CHECK(f.controller.session_count() == 0);
    CHECK(f.built[1]->disconnect_calls == 1);
}

TEST_CASE("TradingSessionController - Resilient builder wraps venue gateways") {
    auto http = std::make_shared<MockHttpHandler>();
    http->add_response("/api/v3/account", 200, R"({"balances": []})");
    ratelimit::RateLimiter limiter;

    auto builder = TradingSessionController::make_resilient_builder(http, limiter);
    exchanges::ExchangeCredentials credentials{"key", "secret", std::nullopt, false};
    auto gateway = builder("alice", "Binance", credentials);

    auto resilient = std::dynamic_pointer_cast<exchanges::ResilientGateway>(gateway);
    REQUIRE(resilient != nullptr);
    CHECK(resilient->id() == "binance");
    CHECK(resilient->breaker()->name() == "exchange:binance");
    CHECK(resilient->breaker() == resilience::CircuitBreakerRegistry::get_instance().get("exchange:binance"));

    CHECK(gateway->test_connection());
    CHECK(limiter.get_exchange_usage("alice", "binance") == 1);

    CHECK_THROWS_AS(builder("alice", "kraken", credentials), error_handling::ConnectionError);
}
