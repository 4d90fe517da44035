#include "doctest.h"
#include "../../../trading/paper_execution_engine.hpp"
#include "../../../utils/error_handling.hpp"
#include "../../mocks/mock_exchange_gateway.hpp"
#include "proto/trading_events.pb.h"
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace trading;
using exchanges::OrderRequest;
using exchanges::OrderSide;
using exchanges::OrderStatus;
using exchanges::OrderType;

namespace {

OrderRequest market(const std::string& symbol, OrderSide side, double quantity,
                    std::optional<double> price = std::nullopt) {
    OrderRequest request;
    request.symbol = symbol;
    request.side = side;
    request.type = OrderType::MARKET;
    request.quantity = quantity;
    request.price = price;
    return request;
}

struct PaperFixture {
    std::shared_ptr<MockExchangeGateway> venue = std::make_shared<MockExchangeGateway>();
    PaperExecutionEngine engine{venue};

    PaperFixture() {
        venue->set_ticker("BTC/USDT", 50000.0);
        venue->set_ticker("ETH/USDT", 0.0);
    }

    double balance(const std::string& asset) {
        auto b = engine.get_balance(asset);
        return b ? b->available : 0.0;
    }
};

} // namespace

TEST_CASE("PaperExecutionEngine - Seeded account") {
    PaperFixture f;
    CHECK(f.engine.id() == "mockex_paper");
    CHECK(f.engine.name() == "MockEx (Paper)");

    auto balances = f.engine.get_balances();
    REQUIRE(balances.size() == 2);
    CHECK(balances[0].asset == "USD");
    CHECK(balances[0].available == doctest::Approx(100000.0));
    CHECK(balances[1].asset == "USDT");
    CHECK(f.engine.get_positions().empty());
    CHECK(f.engine.get_order_history(std::nullopt, 50).empty());
    CHECK_FALSE(f.engine.get_balance("BTC").has_value());

    PaperConfig config;
    config.initial_balance = 500.0;
    config.quote_assets = {"EUR"};
    PaperExecutionEngine custom(f.venue, config);
    REQUIRE(custom.get_balances().size() == 1);
    CHECK(custom.get_balances()[0].asset == "EUR");
    CHECK(custom.get_balances()[0].available == doctest::Approx(500.0));

    CHECK_THROWS_AS(PaperExecutionEngine(nullptr), std::invalid_argument);
}

TEST_CASE("PaperExecutionEngine - Market data passes through") {
    PaperFixture f;
    CHECK(f.engine.get_ticker("BTC/USDT").price == doctest::Approx(50000.0));
    CHECK(f.engine.get_order_book("BTC/USDT", 10).symbol == "BTC/USDT");
    CHECK(f.venue->calls("get_ticker") == 1);
    CHECK(f.venue->calls("get_order_book") == 1);
}

TEST_CASE("PaperExecutionEngine - Market buy and sell") {
    PaperFixture f;

    auto buy = f.engine.create_order(market("BTC/USDT", OrderSide::BUY, 0.1));
    CHECK(buy.status == OrderStatus::FILLED);
    CHECK(buy.filled_quantity == doctest::Approx(0.1));
    CHECK(buy.average_price == doctest::Approx(50000.0));
    CHECK(buy.fee == doctest::Approx(5.0));
    CHECK(buy.fee_currency == "USDT");
    CHECK(buy.id.rfind("paper_", 0) == 0);
    CHECK(buy.client_order_id == buy.id);
    CHECK(f.balance("USDT") == doctest::Approx(94995.0));
    CHECK(f.balance("BTC") == doctest::Approx(0.1));

    auto sell = f.engine.create_order(market("BTC/USDT", OrderSide::SELL, 0.05, 60000.0));
    CHECK(sell.status == OrderStatus::FILLED);
    CHECK(sell.average_price == doctest::Approx(60000.0));
    CHECK(sell.fee == doctest::Approx(3.0));
    CHECK(f.balance("USDT") == doctest::Approx(97992.0));
    CHECK(f.balance("BTC") == doctest::Approx(0.05));

    f.venue->set_ticker("BTC/USDT", 55000.0);
    auto positions = f.engine.get_positions();
    REQUIRE(positions.size() == 1);
    CHECK(positions[0].symbol == "BTC/USDT");
    CHECK(positions[0].side == exchanges::PositionSide::LONG);
    CHECK(positions[0].quantity == doctest::Approx(0.05));
    CHECK(positions[0].entry_price == doctest::Approx(50000.0));
    CHECK(positions[0].unrealized_pnl == doctest::Approx(250.0));
    CHECK(positions[0].unrealized_pnl_percent == doctest::Approx(10.0));

    auto trades = f.engine.get_trades(std::nullopt, 50);
    REQUIRE(trades.size() == 2);
    CHECK(trades[0].order_id == sell.id);
    CHECK(trades[0].side == OrderSide::SELL);
    CHECK(trades[1].order_id == buy.id);
    CHECK(trades[1].fee_currency == "USDT");

    SUBCASE("Selling the rest closes the position") {
        f.engine.create_order(market("BTC/USDT", OrderSide::SELL, 0.05));
        CHECK(f.engine.get_positions().empty());
        CHECK_FALSE(f.engine.get_balances().empty());
    }
}

TEST_CASE("PaperExecutionEngine - Insufficient balance") {
    PaperFixture f;

    try {
        f.engine.create_order(market("BTC/USDT", OrderSide::BUY, 3.0));
        FAIL("expected InsufficientBalanceError");
    } catch (const error_handling::InsufficientBalanceError& e) {
        CHECK(e.asset() == "USDT");
        CHECK(e.required() == doctest::Approx(150150.0));
        CHECK(e.available() == doctest::Approx(100000.0));
    }
    CHECK(f.balance("USDT") == doctest::Approx(100000.0));

    CHECK_THROWS_AS(f.engine.create_order(market("BTC/USDT", OrderSide::SELL, 1.0)),
                    error_handling::InsufficientBalanceError);

    auto history = f.engine.get_order_history(std::nullopt, 50);
    REQUIRE(history.size() == 2);
    CHECK(history[0].status == OrderStatus::REJECTED);
    CHECK(history[1].status == OrderStatus::REJECTED);
    CHECK(f.engine.get_trades(std::nullopt, 50).empty());
}

TEST_CASE("PaperExecutionEngine - Invalid requests") {
    PaperFixture f;
    CHECK_THROWS_AS(f.engine.create_order(market("BTC/USDT", OrderSide::BUY, 0.0)),
                    error_handling::InvalidRequestError);
    CHECK_THROWS_AS(f.engine.create_order(market("BTCUSDT", OrderSide::BUY, 1.0)),
                    error_handling::InvalidRequestError);
    CHECK_THROWS_AS(f.engine.create_order(market("ETH/USDT", OrderSide::BUY, 1.0)),
                    error_handling::InvalidRequestError);
    CHECK_THROWS_AS(f.engine.create_order(market("DOGE/USDT", OrderSide::BUY, 1.0)),
                    error_handling::ExchangeError);
    CHECK(f.engine.get_order_history(std::nullopt, 50).empty());
}

TEST_CASE("PaperExecutionEngine - Resting orders") {
    PaperFixture f;

    OrderRequest limit;
    limit.symbol = "BTC/USDT";
    limit.side = OrderSide::BUY;
    limit.type = OrderType::LIMIT;
    limit.quantity = 0.5;
    limit.price = 45000.0;
    limit.client_order_id = "my-limit";

    auto order = f.engine.create_order(limit);
    CHECK(order.status == OrderStatus::OPEN);
    CHECK(order.client_order_id == "my-limit");
    REQUIRE(order.price.has_value());
    CHECK(*order.price == doctest::Approx(45000.0));
    CHECK(f.balance("USDT") == doctest::Approx(100000.0));

    auto open = f.engine.get_open_orders(std::string("BTC/USDT"));
    REQUIRE(open.size() == 1);
    CHECK(open[0].id == order.id);
    CHECK(f.engine.get_open_orders(std::string("ETH/USDT")).empty());

    CHECK(f.engine.cancel_order(order.id, std::nullopt));
    CHECK_FALSE(f.engine.cancel_order(order.id, std::nullopt));
    CHECK_FALSE(f.engine.cancel_order("unknown", std::nullopt));
    CHECK(f.engine.get_open_orders(std::nullopt).empty());

    auto fetched = f.engine.get_order(order.id, std::nullopt);
    REQUIRE(fetched.has_value());
    CHECK(fetched->status == OrderStatus::CANCELLED);
    CHECK_FALSE(f.engine.get_order("unknown", std::nullopt).has_value());

    auto filled = f.engine.create_order(market("BTC/USDT", OrderSide::BUY, 0.01));
    CHECK_FALSE(f.engine.cancel_order(filled.id, std::nullopt));
}

TEST_CASE("PaperExecutionEngine - History is newest first and limited") {
    PaperFixture f;
    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(f.engine.create_order(market("BTC/USDT", OrderSide::BUY, 0.01)).id);
    }

    auto history = f.engine.get_order_history(std::string("BTC/USDT"), 3);
    REQUIRE(history.size() == 3);
    CHECK(history[0].id == ids[4]);
    CHECK(history[2].id == ids[2]);
    CHECK(f.engine.get_trades(std::string("BTC/USDT"), 0).size() == 5);
    CHECK(f.engine.get_trades(std::string("ETH/USDT"), 10).empty());
}

TEST_CASE("PaperExecutionEngine - Reset restores the seed balances") {
    PaperFixture f;
    f.engine.create_order(market("BTC/USDT", OrderSide::BUY, 0.5));
    f.engine.reset();

    CHECK(f.balance("USDT") == doctest::Approx(100000.0));
    CHECK_FALSE(f.engine.get_balance("BTC").has_value());
    CHECK(f.engine.get_positions().empty());
    CHECK(f.engine.get_order_history(std::nullopt, 50).empty());
    CHECK(f.engine.get_trades(std::nullopt, 50).empty());
}

TEST_CASE("PaperExecutionEngine - Snapshot and restore") {
    PaperFixture f;
    auto buy = f.engine.create_order(market("BTC/USDT", OrderSide::BUY, 0.2));

    auto snapshot = f.engine.snapshot();
    CHECK(snapshot.exchange_id() == "mockex");
    CHECK(snapshot.balances_size() == 3);
    CHECK(snapshot.orders_size() == 1);
    CHECK(snapshot.trades_size() == 1);

    PaperExecutionEngine restored(f.venue);
    restored.restore(snapshot);
    CHECK(restored.get_balance("BTC")->available == doctest::Approx(0.2));
    CHECK(restored.get_balance("USDT")->available == doctest::Approx(f.balance("USDT")));
    auto order = restored.get_order(buy.id, std::nullopt);
    REQUIRE(order.has_value());
    CHECK(order->status == OrderStatus::FILLED);
    CHECK(order->fee == doctest::Approx(buy.fee));
    REQUIRE(restored.get_positions().size() == 1);
    CHECK(restored.get_positions()[0].entry_price == doctest::Approx(50000.0));

    auto next = restored.create_order(market("BTC/USDT", OrderSide::BUY, 0.01));
    CHECK(next.id != buy.id);

    SUBCASE("Snapshots from another venue are refused") {
        auto foreign = snapshot;
        foreign.set_exchange_id("othervenue");
        CHECK_THROWS_AS(restored.restore(foreign), error_handling::InvalidRequestError);
    }

    SUBCASE("A bad snapshot leaves the ledger unchanged") {
        auto broken = snapshot;
        broken.mutable_balances(0)->set_available(-1.0);
        CHECK_THROWS_AS(restored.restore(broken), error_handling::InvalidRequestError);
        CHECK(restored.get_order_history(std::nullopt, 50).size() == 2);
    }
}

TEST_CASE("PaperExecutionEngine - Concurrent orders cannot overdraw") {
    auto venue = std::make_shared<MockExchangeGateway>();
    venue->set_ticker("BTC/USDT", 1000.0);
    PaperExecutionEngine engine(venue);

    std::atomic<int> filled{0};
    std::atomic<int> refused{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 10; ++t) {
        workers.emplace_back([&]() {
            for (int i = 0; i < 20; ++i) {
                try {
                    engine.create_order(market("BTC/USDT", OrderSide::BUY, 1.0));
                    filled++;
                } catch (const error_handling::InsufficientBalanceError&) {
                    refused++;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    CHECK(filled == 99);
    CHECK(refused == 101);
    auto usdt = engine.get_balance("USDT");
    REQUIRE(usdt.has_value());
    CHECK(usdt->available >= 0.0);
    CHECK(usdt->available == doctest::Approx(100000.0 - 99 * 1001.0));
}
