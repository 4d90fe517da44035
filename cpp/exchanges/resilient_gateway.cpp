#include "resilient_gateway.hpp"
#include "../utils/constants.hpp"
#include "../utils/error_handling.hpp"
#include "../utils/logging/log_helper.hpp"
#include "../utils/metrics/metrics_collector.hpp"
#include <stdexcept>

namespace exchanges {

ResilientGateway::ResilientGateway(std::string user_id, std::shared_ptr<IExchangeGateway> inner,
                                   ratelimit::RateLimiter& limiter,
                                   std::shared_ptr<resilience::CircuitBreaker> breaker)
    : user_id_(std::move(user_id)),
      inner_(std::move(inner)),
      limiter_(limiter),
      breaker_(std::move(breaker)) {
    if (!inner_ || !breaker_) {
        throw std::invalid_argument("ResilientGateway requires a gateway and a circuit breaker");
    }
}

resilience::CircuitBreakerConfig ResilientGateway::default_breaker_config() {
    resilience::CircuitBreakerConfig config;
    config.failure_threshold = constants::breaker::FAILURE_THRESHOLD;
    config.success_threshold = constants::breaker::SUCCESS_THRESHOLD;
    config.timeout = std::chrono::milliseconds(constants::breaker::TIMEOUT_MS);
    config.reset_timeout = std::chrono::milliseconds(constants::breaker::RESET_TIMEOUT_MS);
    config.is_failure = [](const std::exception& e) {
        if (dynamic_cast<const error_handling::ExchangeError*>(&e)) {
            return true;
        }
        return dynamic_cast<const error_handling::TradingError*>(&e) == nullptr;
    };
    return config;
}

void ResilientGateway::charge_budget(const char* operation) {
    auto verdict = limiter_.try_exchange_call(user_id_, inner_->id());
    if (!verdict.allowed) {
        METRICS_COUNTER(metrics::names::RATE_LIMITED).increment();
        LOG_DEBUG_COMP("GATEWAY", std::string(operation) + " refused by call budget for " + user_id_);
        throw error_handling::RateLimitExceededError("exchange:" + inner_->id(),
                                                     verdict.retry_after_seconds.value_or(
                                                         constants::ratelimit::EXCHANGE_WINDOW_SECONDS));
    }
}

template<typename Func>
auto ResilientGateway::guarded(const char* operation, Func func) -> std::invoke_result_t<Func> {
    charge_budget(operation);

    metrics::Timer::ScopedTimer timing(METRICS_TIMER(metrics::names::EXCHANGE_CALL_MS));
    try {
        return breaker_->execute(std::move(func));
    } catch (const resilience::CircuitBreakerError&) {
        METRICS_COUNTER(metrics::names::BREAKER_REJECTIONS).increment();
        throw;
    } catch (const error_handling::ExchangeError& e) {
        METRICS_COUNTER(metrics::names::EXCHANGE_ERRORS).increment();
        LOG_WARN_COMP("GATEWAY", std::string(operation) + " failed on " + inner_->id() + ": " + e.raw_message());
        throw;
    } catch (const resilience::TimeoutError& e) {
        METRICS_COUNTER(metrics::names::EXCHANGE_ERRORS).increment();
        LOG_WARN_COMP("GATEWAY", std::string(operation) + " timed out on " + inner_->id());
        throw;
    }
}

// Lifecycle calls do not touch the venue and bypass budget and breaker
void ResilientGateway::connect() {
    inner_->connect();
}

void ResilientGateway::disconnect() {
    inner_->disconnect();
}

bool ResilientGateway::test_connection() {
    auto inner = inner_;
    return guarded("test_connection", [inner]() { return inner->test_connection(); });
}

Ticker ResilientGateway::get_ticker(const std::string& symbol) {
    auto inner = inner_;
    return guarded("get_ticker", [inner, symbol]() { return inner->get_ticker(symbol); });
}

std::vector<Ticker> ResilientGateway::get_tickers(const std::vector<std::string>& symbols) {
    auto inner = inner_;
    return guarded("get_tickers", [inner, symbols]() { return inner->get_tickers(symbols); });
}

OrderBook ResilientGateway::get_order_book(const std::string& symbol, int depth) {
    auto inner = inner_;
    return guarded("get_order_book", [inner, symbol, depth]() { return inner->get_order_book(symbol, depth); });
}

std::vector<TradingPair> ResilientGateway::get_trading_pairs() {
    auto inner = inner_;
    return guarded("get_trading_pairs", [inner]() { return inner->get_trading_pairs(); });
}

std::vector<Balance> ResilientGateway::get_balances() {
    auto inner = inner_;
    return guarded("get_balances", [inner]() { return inner->get_balances(); });
}

std::optional<Balance> ResilientGateway::get_balance(const std::string& asset) {
    auto inner = inner_;
    return guarded("get_balance", [inner, asset]() { return inner->get_balance(asset); });
}

Order ResilientGateway::create_order(const OrderRequest& request) {
    auto inner = inner_;
    return guarded("create_order", [inner, request]() { return inner->create_order(request); });
}

bool ResilientGateway::cancel_order(const std::string& order_id, const std::optional<std::string>& symbol) {
    auto inner = inner_;
    return guarded("cancel_order", [inner, order_id, symbol]() { return inner->cancel_order(order_id, symbol); });
}

std::optional<Order> ResilientGateway::get_order(const std::string& order_id, const std::optional<std::string>& symbol) {
    auto inner = inner_;
    return guarded("get_order", [inner, order_id, symbol]() { return inner->get_order(order_id, symbol); });
}

std::vector<Order> ResilientGateway::get_open_orders(const std::optional<std::string>& symbol) {
    auto inner = inner_;
    return guarded("get_open_orders", [inner, symbol]() { return inner->get_open_orders(symbol); });
}

std::vector<Order> ResilientGateway::get_order_history(const std::optional<std::string>& symbol, int limit) {
    auto inner = inner_;
    return guarded("get_order_history", [inner, symbol, limit]() { return inner->get_order_history(symbol, limit); });
}

std::vector<Position> ResilientGateway::get_positions() {
    auto inner = inner_;
    return guarded("get_positions", [inner]() { return inner->get_positions(); });
}

std::vector<Trade> ResilientGateway::get_trades(const std::optional<std::string>& symbol, int limit) {
    auto inner = inner_;
    return guarded("get_trades", [inner, symbol, limit]() { return inner->get_trades(symbol, limit); });
}

} // namespace exchanges
