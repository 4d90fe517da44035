#pragma once
#include "event_sink.hpp"
#include "trading_session_controller.hpp"
#include "../risk/risk_engine.hpp"
#include "../utils/ratelimit/rate_limiter.hpp"
#include "../utils/resilience/resilience.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace trading {

struct RiskSettings {
    double initial_equity = 100000.0;
    risk::RiskLimits limits;
    double risk_free_rate = 0.02;
    int periods_per_year = 252;
};

// Protective levels for an order; missing levels default to a 2% stop at 2R
struct RiskPlan {
    std::optional<double> stop_loss;
    std::optional<double> take_profit;
};

struct OrderPlacement {
    exchanges::Order order;
    std::vector<std::string> warnings;
    std::optional<double> adjusted_quantity;    // set when the risk check clamped the size
};

struct RateLimitStatus {
    ratelimit::UserTier tier = ratelimit::UserTier::FREE;
    ratelimit::TierLimits limits{};
    std::map<std::string, ratelimit::BucketStatus> buckets;
    std::optional<ratelimit::ExchangeStatus> exchange;     // set while a session exists
    std::map<std::string, int> daily_usage;
};

/**
 * Trading, risk and status operations keyed by user.
 *
 * Order path: session required -> tier orders/minute budget -> live-trading entitlement ->
 * pre-trade risk check on buys (size clamped, hard rejects raise RiskRejectedError) -> the
 * session's active gateway. Every outcome is counted in MetricsCollector and published as
 * an OrderEvent. Filled orders update the user's risk book.
 *
 * Tiers come from `tier_lookup` when given (a subscription service), else from the limiter.
 */
class ExecutionService {
public:
    ExecutionService(TradingSessionController& sessions, ratelimit::RateLimiter& limiter,
                     std::shared_ptr<IEventSink> events = nullptr, RiskSettings risk_settings = {},
                     resilience::CircuitBreakerRegistry& breakers = resilience::CircuitBreakerRegistry::get_instance(),
                     std::shared_ptr<const ratelimit::ITierLookup> tier_lookup = nullptr);
    ~ExecutionService();

    ExecutionService(const ExecutionService&) = delete;
    ExecutionService& operator=(const ExecutionService&) = delete;

    // Session
    SessionState connect(const std::string& user_id, const std::string& connection_id);
    // Throws TierRestrictedError when switching to live without the live_trading entitlement
    void switch_mode(const std::string& user_id, TradingMode mode, bool acknowledged = false);
    SessionState get_state(const std::string& user_id) const;
    void disconnect(const std::string& user_id);

    // Trading
    OrderPlacement place_order(const std::string& user_id, const exchanges::OrderRequest& request,
                               const RiskPlan& plan = {});
    bool cancel_order(const std::string& user_id, const std::string& order_id,
                      const std::optional<std::string>& symbol = std::nullopt);
    std::optional<exchanges::Order> get_order(const std::string& user_id, const std::string& order_id,
                                              const std::optional<std::string>& symbol = std::nullopt);
    std::vector<exchanges::Order> get_open_orders(const std::string& user_id,
                                                  const std::optional<std::string>& symbol = std::nullopt);
    std::vector<exchanges::Order> get_order_history(const std::string& user_id,
                                                    const std::optional<std::string>& symbol = std::nullopt,
                                                    int limit = 50);
    std::vector<exchanges::Balance> get_balances(const std::string& user_id);
    std::vector<exchanges::Position> get_positions(const std::string& user_id);
    std::vector<exchanges::Trade> get_trades(const std::string& user_id,
                                             const std::optional<std::string>& symbol = std::nullopt,
                                             int limit = 50);

    // Risk
    risk::RiskLimits get_risk_limits(const std::string& user_id);
    void update_risk_limits(const std::string& user_id, const risk::RiskLimitsUpdate& update);
    risk::TradeRiskCheck check_trade_risk(const std::string& user_id, const std::string& symbol,
                                          risk::Direction direction, double size, double entry_price,
                                          double stop_loss, double take_profit);
    risk::PositionSizeResult calculate_position_size(const std::string& user_id, risk::PositionSizingMethod method,
                                                     double risk_percentage = 0.02, double fixed_amount = 0.0,
                                                     double volatility = 0.0, double avg_volatility = 1.0);
    risk::RiskMetrics get_risk_metrics(const std::string& user_id);
    std::vector<double> get_equity_curve(const std::string& user_id);
    risk::RiskEngine& risk_engine(const std::string& user_id);

    // Status
    RateLimitStatus get_rate_limit_status(const std::string& user_id) const;
    std::map<std::string, resilience::CircuitBreakerStats> get_breaker_stats() const;
    resilience::CircuitBreakerRegistry& breakers() const { return breakers_; }
    // Sends the current MetricsCollector snapshot to the event sink
    void publish_metrics();

private:
    void reject(const std::string& user_id, const SessionState& state, const exchanges::OrderRequest& request,
                const std::string& reason);
    void record_fill(const std::string& user_id, const exchanges::Order& order, double stop_loss, double take_profit);
    ratelimit::UserTier tier_of(const std::string& user_id) const;

    TradingSessionController& sessions_;
    ratelimit::RateLimiter& limiter_;
    std::shared_ptr<IEventSink> events_;
    RiskSettings risk_settings_;
    resilience::CircuitBreakerRegistry& breakers_;
    std::shared_ptr<const ratelimit::ITierLookup> tier_lookup_;

    std::mutex risk_mutex_;
    std::map<std::string, std::unique_ptr<risk::RiskEngine>> risk_engines_;
};

} // namespace trading
