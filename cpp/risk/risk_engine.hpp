#pragma once
#include "risk_calculations.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace risk {

struct RiskLimits {
    double max_position_size = 0.1;       // fraction of equity per position
    double max_daily_loss = 0.05;         // fraction of initial equity
    double max_drawdown = 0.2;
    int max_open_positions = 10;
    int max_correlated_positions = 3;
    double min_risk_reward_ratio = 1.5;
};

// Partial update; unset fields keep their current value
struct RiskLimitsUpdate {
    std::optional<double> max_position_size;
    std::optional<double> max_daily_loss;
    std::optional<double> max_drawdown;
    std::optional<int> max_open_positions;
    std::optional<int> max_correlated_positions;
    std::optional<double> min_risk_reward_ratio;
};

struct TrackedPosition {
    std::string id;
    std::string symbol;
    Direction direction = Direction::LONG;
    double entry_price = 0.0;
    double current_price = 0.0;
    double size = 0.0;
    double stop_loss = 0.0;
    double take_profit = 0.0;
    std::chrono::system_clock::time_point opened_at;
    double unrealized_pnl = 0.0;
};

struct ClosedTrade {
    std::string id;
    std::string symbol;
    Direction direction = Direction::LONG;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double size = 0.0;
    double pnl = 0.0;
    double pnl_percent = 0.0;
    std::chrono::system_clock::time_point opened_at;
    std::chrono::system_clock::time_point closed_at;
};

struct TradeRiskCheck {
    bool allowed = false;
    std::string reason;                   // set when !allowed
    std::vector<std::string> warnings;
    std::optional<double> adjusted_size;  // set when the size was clamped
};

struct RiskMetrics {
    double total_equity = 0.0;
    double available_capital = 0.0;
    double used_margin = 0.0;
    double margin_usage_percent = 0.0;
    double unrealized_pnl = 0.0;
    double realized_pnl = 0.0;
    double daily_pnl = 0.0;
    double daily_pnl_percent = 0.0;
    int open_positions = 0;
    DrawdownResult drawdown;
    double var_95 = 0.0;
    double cvar_95 = 0.0;
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    TradeStats trade_stats;
};

/**
 * Per-user risk book: limits, tracked positions, closed trades and the equity curve.
 *
 * Independent of any exchange. Pre-trade checks return a TradeRiskCheck verdict rather
 * than throwing. All methods are thread-safe.
 */
class RiskEngine {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit RiskEngine(double initial_equity, RiskLimits limits = RiskLimits{},
                        double risk_free_rate = 0.02, int periods_per_year = 252,
                        Clock clock = nullptr);

    PositionSizeResult calculate_position(PositionSizingMethod method, double risk_percentage = 0.02,
                                          double fixed_amount = 0.0, double volatility = 0.0,
                                          double avg_volatility = 1.0) const;

    TradeRiskCheck check_trade_risk(const std::string& symbol, Direction direction, double size,
                                    double entry_price, double stop_loss, double take_profit) const;

    TrackedPosition open_position(const std::string& symbol, Direction direction, double size,
                                  double entry_price, double stop_loss, double take_profit);
    std::optional<TrackedPosition> update_position(const std::string& id, double current_price);
    std::optional<ClosedTrade> close_position(const std::string& id, double exit_price);
    // Books a trade for `quantity` of the position and shrinks it; closes it when nothing is left
    std::optional<ClosedTrade> reduce_position(const std::string& id, double quantity, double exit_price);

    std::vector<TrackedPosition> get_positions() const;
    std::optional<TrackedPosition> get_position(const std::string& id) const;
    std::vector<ClosedTrade> get_trades() const;

    double calculate_stop_loss(double entry_price, Direction direction, double risk_percent = 0.02,
                               double atr = 0.0) const;
    double calculate_take_profit(double entry_price, double stop_loss, Direction direction,
                                 double risk_reward_ratio = 2.0) const;

    RiskMetrics get_metrics() const;

    RiskLimits get_limits() const;
    void update_limits(const RiskLimitsUpdate& update);

    // End-of-day hook: appends the return of the last equity step (0 without history)
    void record_daily_return();
    std::vector<double> get_daily_returns() const;

    std::vector<double> get_equity_curve() const;
    double current_equity() const;
    double initial_equity() const { return initial_equity_; }

private:
    std::chrono::system_clock::time_point now() const;
    double daily_pnl_locked() const;
    double daily_pnl_percent_locked() const;
    std::string next_id(const char* prefix);
    ClosedTrade book_trade_locked(const TrackedPosition& position, double quantity, double exit_price);

    const double initial_equity_;
    const double risk_free_rate_;
    const int periods_per_year_;
    Clock clock_;

    mutable std::mutex mutex_;
    RiskLimits limits_;
    double current_equity_;
    std::map<std::string, TrackedPosition> positions_;
    std::vector<ClosedTrade> trades_;
    std::vector<double> equity_curve_;
    std::vector<double> daily_returns_;
    std::atomic<uint64_t> sequence_{0};
};

} // namespace risk
