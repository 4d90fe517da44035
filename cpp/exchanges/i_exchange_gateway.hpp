#pragma once
#include "exchange_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace exchanges {

/**
 * IExchangeGateway - uniform market-data, account and order operations against one
 * exchange account.
 *
 * Implemented by: BinanceGateway, CoinbaseGateway (live venues), PaperExecutionEngine
 * (local ledger over a wrapped gateway), ResilientGateway (rate-limit and circuit-breaker
 * decorator).
 *
 * Key Design:
 * - Symbols are canonical BASE/QUOTE; each venue maps them to native identifiers
 * - Calls block on network I/O and throw error_handling::ExchangeError with the venue's
 *   raw message on failure
 * - test_connection() is the credential check that must pass before a session exists
 */
class IExchangeGateway {
public:
    virtual ~IExchangeGateway() = default;

    // Identity
    virtual std::string id() const = 0;
    virtual std::string name() const = 0;

    // Connection management
    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;
    virtual bool test_connection() = 0;

    // Market data
    virtual Ticker get_ticker(const std::string& symbol) = 0;
    virtual std::vector<Ticker> get_tickers(const std::vector<std::string>& symbols) = 0;
    virtual OrderBook get_order_book(const std::string& symbol, int depth) = 0;
    virtual std::vector<TradingPair> get_trading_pairs() = 0;

    // Account
    virtual std::vector<Balance> get_balances() = 0;
    virtual std::optional<Balance> get_balance(const std::string& asset) = 0;

    // Trading; venues that key orders by symbol require it on cancel/get
    virtual Order create_order(const OrderRequest& request) = 0;
    virtual bool cancel_order(const std::string& order_id, const std::optional<std::string>& symbol) = 0;
    virtual std::optional<Order> get_order(const std::string& order_id, const std::optional<std::string>& symbol) = 0;
    virtual std::vector<Order> get_open_orders(const std::optional<std::string>& symbol) = 0;
    virtual std::vector<Order> get_order_history(const std::optional<std::string>& symbol, int limit) = 0;

    // Portfolio
    virtual std::vector<Position> get_positions() = 0;
    virtual std::vector<Trade> get_trades(const std::optional<std::string>& symbol, int limit) = 0;
};

} // namespace exchanges
