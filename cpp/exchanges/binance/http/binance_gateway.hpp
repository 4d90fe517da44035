#pragma once
#include "../../i_exchange_gateway.hpp"
#include "../../symbol_map.hpp"
#include "../../../utils/http/i_http_handler.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <json/json.h>

namespace binance {

// Binance spot REST configuration
struct BinanceConfig {
    std::string base_url;         // empty selects mainnet or testnet from credentials.sandbox
    int timeout_ms{10000};
    int recv_window_ms{5000};
};

/**
 * Binance spot account over the REST API.
 *
 * Signed endpoints append timestamp/recvWindow and an HMAC-SHA256 signature of the query
 * string, with the API key in X-MBX-APIKEY. Binance keys orders by symbol, so
 * cancel_order/get_order/get_order_history/get_trades require one.
 */
class BinanceGateway : public exchanges::IExchangeGateway {
public:
    BinanceGateway(exchanges::ExchangeCredentials credentials, BinanceConfig config,
                   std::shared_ptr<IHttpHandler> http);

    std::string id() const override { return "binance"; }
    std::string name() const override { return "Binance"; }

    void connect() override;
    void disconnect() override;
    bool is_connected() const override { return connected_.load(); }
    bool test_connection() override;

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

    const exchanges::SymbolMap& symbols() const { return symbols_; }
    const std::string& base_url() const { return base_url_; }

private:
    using Params = std::vector<std::pair<std::string, std::string>>;

    Json::Value public_get(const std::string& path, const Params& params);
    Json::Value signed_request(const std::string& method, const std::string& path, Params params);
    Json::Value send(const HttpRequest& request);

    std::string create_signature(const std::string& query_string) const;
    static std::string build_query(const Params& params);
    std::string require_symbol(const std::optional<std::string>& symbol, const char* operation) const;

    exchanges::Ticker parse_ticker(const Json::Value& node) const;
    exchanges::Order parse_order(const Json::Value& node) const;
    static exchanges::OrderStatus map_status(const std::string& status);
    static exchanges::OrderType map_type(const std::string& type);
    static std::string format_decimal(double value);

    exchanges::ExchangeCredentials credentials_;
    BinanceConfig config_;
    std::string base_url_;
    std::shared_ptr<IHttpHandler> http_;
    exchanges::SymbolMap symbols_;
    std::atomic<bool> connected_{false};
};

} // namespace binance
