#pragma once
#include "i_exchange_gateway.hpp"
#include "../utils/ratelimit/rate_limiter.hpp"
#include "../utils/resilience/resilience.hpp"
#include <memory>
#include <string>

namespace exchanges {

/**
 * Gateway decorator that charges every call to the user's per-exchange call budget and
 * routes it through the exchange's named circuit breaker ("exchange:<id>").
 *
 * Budget denial throws RateLimitExceededError before the breaker is consulted; an open
 * breaker throws resilience::CircuitBreakerError without reaching the venue.
 */
class ResilientGateway : public IExchangeGateway {
public:
    ResilientGateway(std::string user_id, std::shared_ptr<IExchangeGateway> inner,
                     ratelimit::RateLimiter& limiter, std::shared_ptr<resilience::CircuitBreaker> breaker);

    // Breaker config that only counts venue faults; user errors such as a bad symbol
    // or a missing price must not open a breaker shared by every user of the venue
    static resilience::CircuitBreakerConfig default_breaker_config();
    static std::string breaker_name(const std::string& exchange_id) { return "exchange:" + exchange_id; }

    std::string id() const override { return inner_->id(); }
    std::string name() const override { return inner_->name(); }

    void connect() override;
    void disconnect() override;
    bool is_connected() const override { return inner_->is_connected(); }
    bool test_connection() override;

    Ticker get_ticker(const std::string& symbol) override;
    std::vector<Ticker> get_tickers(const std::vector<std::string>& symbols) override;
    OrderBook get_order_book(const std::string& symbol, int depth) override;
    std::vector<TradingPair> get_trading_pairs() override;

    std::vector<Balance> get_balances() override;
    std::optional<Balance> get_balance(const std::string& asset) override;

    Order create_order(const OrderRequest& request) override;
    bool cancel_order(const std::string& order_id, const std::optional<std::string>& symbol) override;
    std::optional<Order> get_order(const std::string& order_id, const std::optional<std::string>& symbol) override;
    std::vector<Order> get_open_orders(const std::optional<std::string>& symbol) override;
    std::vector<Order> get_order_history(const std::optional<std::string>& symbol, int limit) override;

    std::vector<Position> get_positions() override;
    std::vector<Trade> get_trades(const std::optional<std::string>& symbol, int limit) override;

    const std::shared_ptr<IExchangeGateway>& inner() const { return inner_; }
    const std::shared_ptr<resilience::CircuitBreaker>& breaker() const { return breaker_; }

private:
    template<typename Func>
    auto guarded(const char* operation, Func func) -> std::invoke_result_t<Func>;

    void charge_budget(const char* operation);

    std::string user_id_;
    std::shared_ptr<IExchangeGateway> inner_;
    ratelimit::RateLimiter& limiter_;
    std::shared_ptr<resilience::CircuitBreaker> breaker_;
};

} // namespace exchanges
