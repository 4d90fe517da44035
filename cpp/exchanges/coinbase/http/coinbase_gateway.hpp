#pragma once
#include "../../i_exchange_gateway.hpp"
#include "../../symbol_map.hpp"
#include "../../../utils/http/i_http_handler.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <json/json.h>

namespace coinbase {

// Coinbase Advanced Trade REST configuration
struct CoinbaseConfig {
    std::string base_url;         // empty selects production or sandbox from credentials.sandbox
    int timeout_ms{10000};
};

/**
 * Coinbase Advanced Trade account over the brokerage REST API.
 *
 * Requests are signed with HMAC-SHA256 over timestamp + method + request path + body and
 * sent with the CB-ACCESS-* headers. Product ids use BASE-QUOTE.
 */
class CoinbaseGateway : public exchanges::IExchangeGateway {
public:
    CoinbaseGateway(exchanges::ExchangeCredentials credentials, CoinbaseConfig config,
                    std::shared_ptr<IHttpHandler> http);

    std::string id() const override { return "coinbase"; }
    std::string name() const override { return "Coinbase"; }

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
    // path is relative to the brokerage prefix; query is appended unsigned
    Json::Value request(const std::string& method, const std::string& path,
                        const std::string& query = "", const Json::Value* body = nullptr);

    std::string create_signature(const std::string& timestamp, const std::string& method,
                                 const std::string& request_path, const std::string& body) const;

    exchanges::Order parse_order(const Json::Value& node) const;
    static exchanges::OrderStatus map_status(const std::string& status);
    static std::string format_decimal(double value);

    exchanges::ExchangeCredentials credentials_;
    CoinbaseConfig config_;
    std::string base_url_;
    std::shared_ptr<IHttpHandler> http_;
    exchanges::SymbolMap symbols_;
    std::atomic<bool> connected_{false};
    std::atomic<uint64_t> client_sequence_{0};
};

} // namespace coinbase
