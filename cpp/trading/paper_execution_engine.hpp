#pragma once
#include "../exchanges/i_exchange_gateway.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace proto {
class PaperLedgerSnapshot;
}

namespace trading {

struct PaperConfig {
    double initial_balance{100000.0};
    std::vector<std::string> quote_assets{"USD", "USDT"};
    double fee_rate{0.001};
};

/**
 * Simulated account on top of a real venue.
 *
 * Market data and trading-pair metadata come from the wrapped gateway; balances, orders,
 * trades and positions are local. Market orders fill immediately at the supplied price or
 * the current ticker price, paying fee_rate on notional in the quote asset. Limit, stop and
 * take-profit orders rest as open and are never matched.
 *
 * Every ledger mutation runs under one mutex, so concurrent orders cannot overdraw.
 */
class PaperExecutionEngine : public exchanges::IExchangeGateway {
public:
    PaperExecutionEngine(std::shared_ptr<exchanges::IExchangeGateway> real, PaperConfig config = {});

    std::string id() const override { return real_->id() + "_paper"; }
    std::string name() const override { return real_->name() + " (Paper)"; }

    void connect() override { real_->connect(); }
    void disconnect() override { real_->disconnect(); }
    bool is_connected() const override { return real_->is_connected(); }
    bool test_connection() override { return real_->test_connection(); }

    exchanges::Ticker get_ticker(const std::string& symbol) override;
    std::vector<exchanges::Ticker> get_tickers(const std::vector<std::string>& symbols) override;
    exchanges::OrderBook get_order_book(const std::string& symbol, int depth) override;
    std::vector<exchanges::TradingPair> get_trading_pairs() override;

    std::vector<exchanges::Balance> get_balances() override;
    std::optional<exchanges::Balance> get_balance(const std::string& asset) override;

    exchanges::Order create_order(const exchanges::OrderRequest& request) override;
    bool cancel_order(const std::string& order_id, const std::optional<std::string>& symbol) override;
    std::optional<exchanges::Order> get_order(const std::string& order_id, const std::optional<std::string>& symbol) override;
    std::vector<exchanges::Order> get_open_orders(const std::optional<std::string>& symbol) override;
    std::vector<exchanges::Order> get_order_history(const std::optional<std::string>& symbol, int limit) override;

    std::vector<exchanges::Position> get_positions() override;
    std::vector<exchanges::Trade> get_trades(const std::optional<std::string>& symbol, int limit) override;

    // Restore the seed balances and clear orders, trades and positions
    void reset();

    proto::PaperLedgerSnapshot snapshot() const;
    // Replaces the whole ledger; throws InvalidRequestError if the snapshot is for another venue
    void restore(const proto::PaperLedgerSnapshot& snapshot);

    const std::shared_ptr<exchanges::IExchangeGateway>& real() const { return real_; }
    const PaperConfig& config() const { return config_; }

private:
    struct LedgerBalance {
        double available = 0.0;
        double locked = 0.0;
    };

    struct LedgerPosition {
        double quantity = 0.0;
        double total_cost = 0.0;
    };

    // Caller holds mutex_
    void reset_locked();
    void fill_market_order(exchanges::Order& order, const std::string& base, const std::string& quote);
    std::string next_id(const char* prefix);

    std::shared_ptr<exchanges::IExchangeGateway> real_;
    PaperConfig config_;

    mutable std::mutex mutex_;
    std::map<std::string, LedgerBalance> balances_;
    std::map<std::string, LedgerPosition> positions_;
    std::vector<exchanges::Order> orders_;      // append-only, oldest first
    std::vector<exchanges::Trade> trades_;      // append-only, oldest first
    uint64_t sequence_{0};
};

} // namespace trading
