#include "execution_service.hpp"
#include "../utils/constants.hpp"
#include "../utils/error_handling.hpp"
#include "../utils/logging/log_helper.hpp"
#include "../utils/metrics/metrics_collector.hpp"
#include <algorithm>
#include <chrono>

namespace trading {

ExecutionService::ExecutionService(TradingSessionController& sessions, ratelimit::RateLimiter& limiter,
                                   std::shared_ptr<IEventSink> events, RiskSettings risk_settings,
                                   resilience::CircuitBreakerRegistry& breakers,
                                   std::shared_ptr<const ratelimit::ITierLookup> tier_lookup)
    : sessions_(sessions),
      limiter_(limiter),
      events_(events ? std::move(events) : std::make_shared<NullEventSink>()),
      risk_settings_(std::move(risk_settings)),
      breakers_(breakers),
      tier_lookup_(std::move(tier_lookup)) {
    auto sink = events_;
    breakers_.set_state_listener([sink](const std::string& name, resilience::CircuitState from,
                                        resilience::CircuitState to) {
        sink->publish_breaker_event(make_breaker_event(name, from, to));
    });
}

ExecutionService::~ExecutionService() {
    breakers_.set_state_listener(nullptr);
}

SessionState ExecutionService::connect(const std::string& user_id, const std::string& connection_id) {
    return sessions_.connect_exchange(user_id, connection_id);
}

void ExecutionService::switch_mode(const std::string& user_id, TradingMode mode, bool acknowledged) {
    if (mode == TradingMode::LIVE) {
        auto tier = tier_of(user_id);
        if (!ratelimit::RateLimiter::get_limits_for_tier(tier).live_trading) {
            throw error_handling::TierRestrictedError("Live trading is not available on the " +
                                                      ratelimit::to_string(tier) + " tier");
        }
    }
    sessions_.switch_mode(user_id, mode, acknowledged);
}

SessionState ExecutionService::get_state(const std::string& user_id) const {
    return sessions_.get_state(user_id);
}

void ExecutionService::disconnect(const std::string& user_id) {
    sessions_.disconnect_exchange(user_id);
}

OrderPlacement ExecutionService::place_order(const std::string& user_id, const exchanges::OrderRequest& request,
                                             const RiskPlan& plan) {
    auto state = sessions_.get_state(user_id);
    if (!state.can_trade) {
        throw error_handling::NoSessionError();
    }

    auto tier = tier_of(user_id);
    auto tier_limits = ratelimit::RateLimiter::get_limits_for_tier(tier);

    auto budget = limiter_.check_limit(user_id, constants::ratelimit::ORDERS_CATEGORY,
                                       tier_limits.orders_per_minute, constants::ratelimit::ORDER_WINDOW_SECONDS);
    if (!budget.allowed) {
        METRICS_COUNTER(metrics::names::RATE_LIMITED).increment();
        reject(user_id, state, request, "order rate limit exceeded");
        throw error_handling::RateLimitExceededError(constants::ratelimit::ORDERS_CATEGORY,
                                                     budget.retry_after_seconds.value_or(budget.reset_seconds));
    }

    if (state.mode == TradingMode::LIVE && !tier_limits.live_trading) {
        reject(user_id, state, request, "live trading not available");
        throw error_handling::TierRestrictedError("Live trading is not available on the " +
                                                  ratelimit::to_string(tier) + " tier");
    }

    OrderPlacement placement;
    exchanges::OrderRequest effective = request;
    double stop_loss = 0.0;
    double take_profit = 0.0;

    // Spot sells only reduce exposure; buys go through the pre-trade check
    if (request.side == exchanges::OrderSide::BUY && request.quantity > 0.0) {
        double entry = request.price ? *request.price : sessions_.get_ticker(user_id, request.symbol).price;
        if (entry > 0.0) {
            auto& engine = risk_engine(user_id);
            stop_loss = plan.stop_loss.value_or(
                engine.calculate_stop_loss(entry, risk::Direction::LONG, constants::risk::DEFAULT_STOP_PERCENT));
            take_profit = plan.take_profit.value_or(
                engine.calculate_take_profit(entry, stop_loss, risk::Direction::LONG,
                                             constants::risk::DEFAULT_RISK_REWARD));

            auto verdict = engine.check_trade_risk(request.symbol, risk::Direction::LONG, request.quantity,
                                                   entry, stop_loss, take_profit);
            if (!verdict.allowed) {
                METRICS_COUNTER(metrics::names::ORDERS_REJECTED).increment();
                reject(user_id, state, request, verdict.reason);
                throw error_handling::RiskRejectedError(verdict.reason, verdict.warnings);
            }
            placement.warnings = verdict.warnings;
            if (verdict.adjusted_size) {
                effective.quantity = *verdict.adjusted_size;
                placement.adjusted_quantity = verdict.adjusted_size;
            }
        }
    }

    auto started = std::chrono::steady_clock::now();
    try {
        placement.order = sessions_.create_order(user_id, effective);
    } catch (const error_handling::TradingError& e) {
        METRICS_COUNTER(metrics::names::ORDERS_REJECTED).increment();
        reject(user_id, state, effective, e.what());
        throw;
    }
    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started);
    METRICS_HISTOGRAM(metrics::names::ORDER_LATENCY_MS).record(elapsed.count());
    METRICS_COUNTER(metrics::names::ORDERS_PLACED).increment();

    const auto& order = placement.order;
    LOG_INFO_COMP("EXECUTION", "Order " + order.id + " " + exchanges::to_string(order.side) + " " +
                  order.symbol + " " + exchanges::to_string(order.status) + " (" + to_string(state.mode) + ")");
    events_->publish_order_event(make_order_event(user_id, state.exchange_id.value_or(""), to_string(state.mode),
                                                  order, "placed"));

    if (order.filled_quantity > 0.0) {
        record_fill(user_id, order, stop_loss, take_profit);
    }
    return placement;
}

bool ExecutionService::cancel_order(const std::string& user_id, const std::string& order_id,
                                    const std::optional<std::string>& symbol) {
    auto state = sessions_.get_state(user_id);
    bool cancelled = sessions_.cancel_order(user_id, order_id, symbol);
    if (cancelled) {
        exchanges::Order order;
        order.id = order_id;
        order.symbol = symbol.value_or("");
        order.status = exchanges::OrderStatus::CANCELLED;
        events_->publish_order_event(make_order_event(user_id, state.exchange_id.value_or(""),
                                                      to_string(state.mode), order, "cancelled"));
    }
    return cancelled;
}

std::optional<exchanges::Order> ExecutionService::get_order(const std::string& user_id, const std::string& order_id,
                                                            const std::optional<std::string>& symbol) {
    return sessions_.get_order(user_id, order_id, symbol);
}

std::vector<exchanges::Order> ExecutionService::get_open_orders(const std::string& user_id,
                                                                const std::optional<std::string>& symbol) {
    return sessions_.get_open_orders(user_id, symbol);
}

std::vector<exchanges::Order> ExecutionService::get_order_history(const std::string& user_id,
                                                                  const std::optional<std::string>& symbol, int limit) {
    return sessions_.get_order_history(user_id, symbol, limit);
}

std::vector<exchanges::Balance> ExecutionService::get_balances(const std::string& user_id) {
    return sessions_.get_balances(user_id);
}

std::vector<exchanges::Position> ExecutionService::get_positions(const std::string& user_id) {
    return sessions_.get_positions(user_id);
}

std::vector<exchanges::Trade> ExecutionService::get_trades(const std::string& user_id,
                                                           const std::optional<std::string>& symbol, int limit) {
    return sessions_.get_trades(user_id, symbol, limit);
}

risk::RiskLimits ExecutionService::get_risk_limits(const std::string& user_id) {
    return risk_engine(user_id).get_limits();
}

void ExecutionService::update_risk_limits(const std::string& user_id, const risk::RiskLimitsUpdate& update) {
    risk_engine(user_id).update_limits(update);
}

risk::TradeRiskCheck ExecutionService::check_trade_risk(const std::string& user_id, const std::string& symbol,
                                                        risk::Direction direction, double size, double entry_price,
                                                        double stop_loss, double take_profit) {
    return risk_engine(user_id).check_trade_risk(symbol, direction, size, entry_price, stop_loss, take_profit);
}

risk::PositionSizeResult ExecutionService::calculate_position_size(const std::string& user_id,
                                                                   risk::PositionSizingMethod method,
                                                                   double risk_percentage, double fixed_amount,
                                                                   double volatility, double avg_volatility) {
    return risk_engine(user_id).calculate_position(method, risk_percentage, fixed_amount, volatility, avg_volatility);
}

risk::RiskMetrics ExecutionService::get_risk_metrics(const std::string& user_id) {
    return risk_engine(user_id).get_metrics();
}

std::vector<double> ExecutionService::get_equity_curve(const std::string& user_id) {
    return risk_engine(user_id).get_equity_curve();
}

risk::RiskEngine& ExecutionService::risk_engine(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(risk_mutex_);
    auto it = risk_engines_.find(user_id);
    if (it == risk_engines_.end()) {
        it = risk_engines_.emplace(user_id, std::make_unique<risk::RiskEngine>(
                 risk_settings_.initial_equity, risk_settings_.limits,
                 risk_settings_.risk_free_rate, risk_settings_.periods_per_year)).first;
    }
    return *it->second;
}

RateLimitStatus ExecutionService::get_rate_limit_status(const std::string& user_id) const {
    RateLimitStatus status;
    status.tier = tier_of(user_id);
    status.limits = ratelimit::RateLimiter::get_limits_for_tier(status.tier);
    status.buckets = limiter_.get_status(user_id);
    status.daily_usage = limiter_.get_daily_usage(user_id);

    auto state = sessions_.get_state(user_id);
    if (state.exchange_id) {
        status.exchange = limiter_.get_exchange_status(user_id, *state.exchange_id);
    }
    return status;
}

std::map<std::string, resilience::CircuitBreakerStats> ExecutionService::get_breaker_stats() const {
    return breakers_.get_all_stats();
}

void ExecutionService::publish_metrics() {
    events_->publish_metrics(make_metrics_snapshot(metrics::MetricsCollector::instance().snapshot()));
}

void ExecutionService::reject(const std::string& user_id, const SessionState& state,
                              const exchanges::OrderRequest& request, const std::string& reason) {
    LOG_WARN_COMP("EXECUTION", "Order rejected for " + user_id + " " + exchanges::to_string(request.side) + " " +
                  request.symbol + ": " + reason);
    events_->publish_order_event(make_rejected_order_event(user_id, state.exchange_id.value_or(""),
                                                           to_string(state.mode), request, reason));
}

ratelimit::UserTier ExecutionService::tier_of(const std::string& user_id) const {
    return tier_lookup_ ? tier_lookup_->get_user_tier(user_id) : limiter_.get_user_tier(user_id);
}

void ExecutionService::record_fill(const std::string& user_id, const exchanges::Order& order,
                                   double stop_loss, double take_profit) {
    auto& engine = risk_engine(user_id);
    const double price = order.average_price > 0.0 ? order.average_price : order.price.value_or(0.0);
    if (price <= 0.0) {
        return;
    }

    if (order.side == exchanges::OrderSide::BUY) {
        engine.open_position(order.symbol, risk::Direction::LONG, order.filled_quantity, price, stop_loss, take_profit);
        return;
    }

    // Sells reduce tracked longs oldest first; longs the sale does not reach are marked
    auto positions = engine.get_positions();
    std::sort(positions.begin(), positions.end(), [](const risk::TrackedPosition& a, const risk::TrackedPosition& b) {
        return a.opened_at < b.opened_at;
    });

    double remaining = order.filled_quantity;
    for (const auto& position : positions) {
        if (position.symbol != order.symbol || position.direction != risk::Direction::LONG) {
            continue;
        }
        if (remaining <= constants::order::FILLED_QTY_EPSILON) {
            engine.update_position(position.id, price);
            continue;
        }
        const double quantity = std::min(remaining, position.size);
        engine.reduce_position(position.id, quantity, price);
        remaining -= quantity;
    }
}

} // namespace trading
