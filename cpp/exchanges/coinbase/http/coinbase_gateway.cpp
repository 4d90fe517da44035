#include "coinbase_gateway.hpp"
#include "../../gateway_utils.hpp"
#include "../../../utils/constants.hpp"
#include "../../../utils/error_handling.hpp"
#include "../../../utils/logging/log_helper.hpp"
#include <algorithm>
#include <cstdio>

namespace coinbase {

namespace {

const char* EXCHANGE = "coinbase";

exchanges::SymbolMap make_symbol_map() {
    return exchanges::SymbolMap(
        EXCHANGE,
        [](const std::string& base, const std::string& quote) { return base + "-" + quote; },
        [](const std::string& native) -> std::optional<std::pair<std::string, std::string>> {
            auto dash = native.find('-');
            if (dash == std::string::npos || dash == 0 || dash + 1 >= native.size()) {
                return std::nullopt;
            }
            return std::make_pair(native.substr(0, dash), native.substr(dash + 1));
        });
}

exchanges::OrderSide side_from_coinbase(const std::string& side) {
    return side == "SELL" ? exchanges::OrderSide::SELL : exchanges::OrderSide::BUY;
}

std::string query_param(const std::string& key, const std::string& value) {
    return key + "=" + url_encode(value);
}

void append_param(std::string& query, const std::string& key, const std::string& value) {
    if (!query.empty()) {
        query += "&";
    }
    query += query_param(key, value);
}

// Coinbase charges fees in the quote currency
std::string split_quote(const std::string& symbol) {
    return exchanges::split_symbol(symbol).second;
}

} // namespace

CoinbaseGateway::CoinbaseGateway(exchanges::ExchangeCredentials credentials, CoinbaseConfig config,
                                 std::shared_ptr<IHttpHandler> http)
    : credentials_(std::move(credentials)),
      config_(std::move(config)),
      http_(std::move(http)),
      symbols_(make_symbol_map()) {
    if (!http_) {
        throw std::invalid_argument("CoinbaseGateway requires an HTTP handler");
    }

    if (!config_.base_url.empty()) {
        base_url_ = config_.base_url;
    } else {
        base_url_ = credentials_.sandbox ? constants::exchange::coinbase::SANDBOX_HTTP_URL
                                         : constants::exchange::coinbase::DEFAULT_HTTP_URL;
    }
}

void CoinbaseGateway::connect() {
    connected_.store(true);
    LOG_INFO_COMP("COINBASE", "Connected to " + base_url_);
}

void CoinbaseGateway::disconnect() {
    connected_.store(false);
    LOG_INFO_COMP("COINBASE", "Disconnected");
}

bool CoinbaseGateway::test_connection() {
    try {
        request("GET", "/accounts");
        return true;
    } catch (const error_handling::ExchangeError& e) {
        LOG_WARN_COMP("COINBASE", "Connection test failed: " + std::string(e.what()));
        return false;
    }
}

exchanges::Ticker CoinbaseGateway::get_ticker(const std::string& symbol) {
    const std::string product_id = symbols_.to_native(symbol);
    Json::Value product = request("GET", "/products/" + product_id);
    Json::Value book = request("GET", "/products/" + product_id + "/ticker", query_param("limit", "1"));

    exchanges::Ticker ticker;
    ticker.symbol = symbol;
    ticker.price = exchanges::json_double(product, "price");
    ticker.bid = exchanges::json_double(book, "best_bid", ticker.price);
    ticker.ask = exchanges::json_double(book, "best_ask", ticker.price);
    ticker.volume_24h = exchanges::json_double(product, "volume_24h");
    ticker.change_percent_24h = exchanges::json_double(product, "price_percentage_change_24h");

    // Only the percentage is published; recover the absolute change from the implied open
    const double open = ticker.change_percent_24h > -100.0
        ? ticker.price / (1.0 + ticker.change_percent_24h / 100.0)
        : 0.0;
    ticker.change_24h = open > 0.0 ? ticker.price - open : 0.0;

    double high = 0.0;
    double low = 0.0;
    for (const auto& trade : book["trades"]) {
        const double price = exchanges::json_double(trade, "price");
        if (price <= 0.0) continue;
        high = std::max(high, price);
        low = low == 0.0 ? price : std::min(low, price);
    }
    ticker.high_24h = exchanges::json_double(product, "high_24h", high);
    ticker.low_24h = exchanges::json_double(product, "low_24h", low);
    ticker.timestamp = std::chrono::system_clock::now();
    return ticker;
}

std::vector<exchanges::Ticker> CoinbaseGateway::get_tickers(const std::vector<std::string>& symbols) {
    std::vector<std::string> wanted = symbols;
    if (wanted.empty()) {
        for (const auto& pair : symbols_.pairs()) {
            wanted.push_back(pair.symbol);
        }
    }

    std::vector<exchanges::Ticker> tickers;
    tickers.reserve(wanted.size());
    for (const auto& symbol : wanted) {
        tickers.push_back(get_ticker(symbol));
    }
    return tickers;
}

exchanges::OrderBook CoinbaseGateway::get_order_book(const std::string& symbol, int depth) {
    std::string query = query_param("product_id", symbols_.to_native(symbol));
    append_param(query, "limit", std::to_string(depth > 0 ? depth : 50));
    Json::Value response = request("GET", "/product_book", query);

    exchanges::OrderBook book;
    book.symbol = symbol;
    book.timestamp = std::chrono::system_clock::now();

    const Json::Value& pricebook = response["pricebook"];
    for (const auto& level : pricebook["bids"]) {
        book.bids.push_back({exchanges::json_double(level, "price"), exchanges::json_double(level, "size")});
    }
    for (const auto& level : pricebook["asks"]) {
        book.asks.push_back({exchanges::json_double(level, "price"), exchanges::json_double(level, "size")});
    }
    return book;
}

std::vector<exchanges::TradingPair> CoinbaseGateway::get_trading_pairs() {
    Json::Value response = request("GET", "/products");

    std::vector<exchanges::TradingPair> pairs;
    for (const auto& node : response["products"]) {
        if (exchanges::json_string(node, "status") != "online" || node["trading_disabled"].asBool()) {
            continue;
        }

        exchanges::TradingPair pair;
        pair.native_symbol = exchanges::json_string(node, "product_id");
        pair.base = exchanges::json_string(node, "base_currency_id");
        pair.quote = exchanges::json_string(node, "quote_currency_id");
        if (pair.base.empty() || pair.quote.empty()) {
            auto split = pair.native_symbol.find('-');
            if (split == std::string::npos) continue;
            pair.base = pair.native_symbol.substr(0, split);
            pair.quote = pair.native_symbol.substr(split + 1);
        }
        pair.symbol = exchanges::join_symbol(pair.base, pair.quote);
        pair.min_quantity = exchanges::json_double(node, "base_min_size");
        pair.step_size = exchanges::json_double(node, "base_increment");
        pair.tick_size = exchanges::json_double(node, "quote_increment");

        symbols_.register_pair(pair);
        pairs.push_back(std::move(pair));
    }

    LOG_DEBUG_COMP("COINBASE", "Loaded " + std::to_string(pairs.size()) + " products");
    return pairs;
}

std::vector<exchanges::Balance> CoinbaseGateway::get_balances() {
    Json::Value response = request("GET", "/accounts", query_param("limit", "250"));

    std::vector<exchanges::Balance> balances;
    for (const auto& account : response["accounts"]) {
        exchanges::Balance balance;
        balance.asset = exchanges::json_string(account, "currency");
        balance.available = exchanges::json_double(account["available_balance"], "value");
        balance.locked = exchanges::json_double(account["hold"], "value");
        if (balance.total() > 0.0) {
            balances.push_back(std::move(balance));
        }
    }
    return balances;
}

std::optional<exchanges::Balance> CoinbaseGateway::get_balance(const std::string& asset) {
    for (auto& balance : get_balances()) {
        if (balance.asset == asset) {
            return balance;
        }
    }
    return std::nullopt;
}

exchanges::Order CoinbaseGateway::create_order(const exchanges::OrderRequest& order_request) {
    if (order_request.quantity <= 0.0) {
        throw error_handling::InvalidRequestError("Order quantity must be positive");
    }

    const std::string& symbol = order_request.symbol;
    const double quantity = symbols_.round_to_step(symbol, order_request.quantity);

    Json::Value body(Json::objectValue);
    body["client_order_id"] = order_request.client_order_id
        ? *order_request.client_order_id
        : "td-" + std::to_string(exchanges::now_millis()) + "-" + std::to_string(++client_sequence_);
    body["product_id"] = symbols_.to_native(symbol);
    body["side"] = order_request.side == exchanges::OrderSide::BUY ? "BUY" : "SELL";

    Json::Value configuration(Json::objectValue);
    switch (order_request.type) {
        case exchanges::OrderType::MARKET: {
            Json::Value market(Json::objectValue);
            if (order_request.side == exchanges::OrderSide::BUY) {
                // Market buys are sized in quote currency
                const double price = order_request.price ? *order_request.price : get_ticker(symbol).price;
                if (price <= 0.0) {
                    throw error_handling::InvalidRequestError("No price available to size market buy for " + symbol);
                }
                market["quote_size"] = format_decimal(quantity * price);
            } else {
                market["base_size"] = format_decimal(quantity);
            }
            configuration["market_market_ioc"] = market;
            break;
        }
        case exchanges::OrderType::LIMIT: {
            if (!order_request.price) {
                throw error_handling::InvalidRequestError("limit order requires a price");
            }
            Json::Value limit(Json::objectValue);
            limit["base_size"] = format_decimal(quantity);
            limit["limit_price"] = format_decimal(symbols_.round_to_tick(symbol, *order_request.price));
            configuration["limit_limit_gtc"] = limit;
            break;
        }
        case exchanges::OrderType::STOP_LOSS:
        case exchanges::OrderType::TAKE_PROFIT: {
            if (!order_request.price || !order_request.stop_price) {
                throw error_handling::InvalidRequestError(exchanges::to_string(order_request.type) +
                                                          " order requires a price and a stop price");
            }
            const bool sell = order_request.side == exchanges::OrderSide::SELL;
            const bool stop_loss = order_request.type == exchanges::OrderType::STOP_LOSS;
            Json::Value stop(Json::objectValue);
            stop["base_size"] = format_decimal(quantity);
            stop["limit_price"] = format_decimal(symbols_.round_to_tick(symbol, *order_request.price));
            stop["stop_price"] = format_decimal(symbols_.round_to_tick(symbol, *order_request.stop_price));
            // A sell stop-loss and a buy take-profit trigger on a falling price
            stop["stop_direction"] = (sell == stop_loss) ? "STOP_DIRECTION_STOP_DOWN" : "STOP_DIRECTION_STOP_UP";
            configuration["stop_limit_stop_limit_gtc"] = stop;
            break;
        }
    }
    body["order_configuration"] = configuration;

    Json::Value response = request("POST", "/orders", "", &body);
    if (!response["success"].asBool()) {
        const Json::Value& failure = response["error_response"];
        std::string reason = exchanges::json_string(failure, "message");
        if (reason.empty()) reason = exchanges::json_string(response, "failure_reason");
        if (reason.empty()) reason = "Unknown error";
        throw error_handling::ExchangeError(EXCHANGE, "Order failed: " + reason);
    }

    std::string order_id = exchanges::json_string(response["success_response"], "order_id");
    if (order_id.empty()) {
        order_id = exchanges::json_string(response, "order_id");
    }

    auto created = get_order(order_id, symbol);
    if (!created) {
        throw error_handling::ExchangeError(EXCHANGE, "Order " + order_id + " created but could not be retrieved");
    }
    LOG_DEBUG_COMP("COINBASE", "Order " + created->id + " " + exchanges::to_string(created->status));
    return *created;
}

bool CoinbaseGateway::cancel_order(const std::string& order_id, const std::optional<std::string>& /*symbol*/) {
    Json::Value body(Json::objectValue);
    body["order_ids"].append(order_id);

    Json::Value response = request("POST", "/orders/batch_cancel", "", &body);
    for (const auto& result : response["results"]) {
        if (exchanges::json_string(result, "order_id") == order_id) {
            if (!result["success"].asBool()) {
                LOG_DEBUG_COMP("COINBASE", "Cancel of " + order_id + " refused: " +
                               exchanges::json_string(result, "failure_reason"));
            }
            return result["success"].asBool();
        }
    }
    return false;
}

std::optional<exchanges::Order> CoinbaseGateway::get_order(const std::string& order_id,
                                                           const std::optional<std::string>& /*symbol*/) {
    try {
        Json::Value response = request("GET", "/orders/historical/" + url_encode(order_id));
        return parse_order(response["order"]);
    } catch (const error_handling::ExchangeError& e) {
        if (e.http_status() == 404) {
            return std::nullopt;
        }
        throw;
    }
}

std::vector<exchanges::Order> CoinbaseGateway::get_open_orders(const std::optional<std::string>& symbol) {
    std::string query = query_param("order_status", "OPEN");
    if (symbol) {
        append_param(query, "product_id", symbols_.to_native(*symbol));
    }

    std::vector<exchanges::Order> orders;
    for (const auto& node : request("GET", "/orders/historical/batch", query)["orders"]) {
        orders.push_back(parse_order(node));
    }
    return orders;
}

std::vector<exchanges::Order> CoinbaseGateway::get_order_history(const std::optional<std::string>& symbol, int limit) {
    std::string query = query_param("limit", std::to_string(limit > 0 ? limit : 50));
    if (symbol) {
        append_param(query, "product_id", symbols_.to_native(*symbol));
    }

    std::vector<exchanges::Order> orders;
    for (const auto& node : request("GET", "/orders/historical/batch", query)["orders"]) {
        orders.push_back(parse_order(node));
    }
    return orders;
}

std::vector<exchanges::Position> CoinbaseGateway::get_positions() {
    std::vector<exchanges::Position> positions;

    for (const auto& balance : get_balances()) {
        if (balance.asset == "USD" || balance.asset == "USDT" || balance.asset == "USDC") {
            continue;
        }

        exchanges::Position position;
        position.symbol = exchanges::join_symbol(balance.asset, "USD");
        position.side = exchanges::PositionSide::LONG;
        position.quantity = balance.total();
        try {
            position.current_price = get_ticker(position.symbol).price;
        } catch (const error_handling::ExchangeError& e) {
            LOG_DEBUG_COMP("COINBASE", "No USD market for " + balance.asset + ": " + e.raw_message());
            continue;
        }
        position.entry_price = position.current_price;
        positions.push_back(std::move(position));
    }
    return positions;
}

std::vector<exchanges::Trade> CoinbaseGateway::get_trades(const std::optional<std::string>& symbol, int limit) {
    std::string query = query_param("limit", std::to_string(limit > 0 ? limit : 50));
    if (symbol) {
        append_param(query, "product_id", symbols_.to_native(*symbol));
    }

    std::vector<exchanges::Trade> trades;
    for (const auto& fill : request("GET", "/orders/historical/fills", query)["fills"]) {
        exchanges::Trade trade;
        trade.id = exchanges::json_string(fill, "entry_id");
        if (trade.id.empty()) trade.id = exchanges::json_string(fill, "trade_id");
        trade.order_id = exchanges::json_string(fill, "order_id");
        trade.symbol = symbols_.to_canonical(exchanges::json_string(fill, "product_id"));
        trade.side = side_from_coinbase(exchanges::json_string(fill, "side"));
        trade.quantity = exchanges::json_double(fill, "size");
        trade.price = exchanges::json_double(fill, "price");
        trade.fee = exchanges::json_double(fill, "commission");
        trade.fee_currency = split_quote(trade.symbol);
        trade.timestamp = exchanges::parse_iso8601(exchanges::json_string(fill, "trade_time"));
        trades.push_back(std::move(trade));
    }
    return trades;
}

Json::Value CoinbaseGateway::request(const std::string& method, const std::string& path,
                                     const std::string& query, const Json::Value* body) {
    const std::string request_path = std::string(constants::exchange::coinbase::API_PREFIX) + path;
    const std::string timestamp = std::to_string(exchanges::now_millis() / 1000);
    const std::string payload = body ? exchanges::write_json(*body) : "";

    HttpRequest http_request;
    http_request.method = method;
    http_request.url = base_url_ + request_path + (query.empty() ? "" : "?" + query);
    http_request.body = payload;
    http_request.timeout_ms = config_.timeout_ms;
    http_request.headers["Content-Type"] = "application/json";
    http_request.headers["CB-ACCESS-KEY"] = credentials_.api_key;
    http_request.headers["CB-ACCESS-SIGN"] = create_signature(timestamp, method, request_path, payload);
    http_request.headers["CB-ACCESS-TIMESTAMP"] = timestamp;
    if (credentials_.passphrase) {
        http_request.headers["CB-ACCESS-PASSPHRASE"] = *credentials_.passphrase;
    }

    HttpResponse response = http_->make_request(http_request);

    if (!response.error_message.empty() && response.status_code == 0) {
        throw error_handling::ExchangeError(EXCHANGE, response.error_message);
    }

    if (!response.success) {
        std::string message = "HTTP " + std::to_string(response.status_code);
        Json::Value error;
        Json::CharReaderBuilder builder;
        std::string errors;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        if (reader->parse(response.body.data(), response.body.data() + response.body.size(), &error, &errors) &&
            error.isObject() && (error.isMember("message") || error.isMember("error"))) {
            message = exchanges::json_string(error, "message");
            if (message.empty()) message = exchanges::json_string(error, "error");
        } else if (!response.body.empty()) {
            message += ": " + response.body;
        }
        throw error_handling::ExchangeError(EXCHANGE, message, response.status_code);
    }

    return exchanges::parse_json(response.body, EXCHANGE);
}

std::string CoinbaseGateway::create_signature(const std::string& timestamp, const std::string& method,
                                              const std::string& request_path, const std::string& body) const {
    return exchanges::hmac_sha256_hex(credentials_.api_secret, timestamp + method + request_path + body);
}

exchanges::Order CoinbaseGateway::parse_order(const Json::Value& node) const {
    exchanges::Order order;
    order.id = exchanges::json_string(node, "order_id");
    order.client_order_id = exchanges::json_string(node, "client_order_id");
    order.symbol = symbols_.to_canonical(exchanges::json_string(node, "product_id"));
    order.side = side_from_coinbase(exchanges::json_string(node, "side"));
    order.status = map_status(exchanges::json_string(node, "status"));
    order.filled_quantity = exchanges::json_double(node, "filled_size");
    order.average_price = exchanges::json_double(node, "average_filled_price");
    order.fee = exchanges::json_double(node, "total_fees");
    order.fee_currency = split_quote(order.symbol);

    const Json::Value& configuration = node["order_configuration"];
    if (configuration.isMember("limit_limit_gtc")) {
        const Json::Value& limit = configuration["limit_limit_gtc"];
        order.type = exchanges::OrderType::LIMIT;
        order.quantity = exchanges::json_double(limit, "base_size");
        order.price = exchanges::json_double(limit, "limit_price");
    } else if (configuration.isMember("stop_limit_stop_limit_gtc")) {
        const Json::Value& stop = configuration["stop_limit_stop_limit_gtc"];
        const bool stop_down = exchanges::json_string(stop, "stop_direction") == "STOP_DIRECTION_STOP_DOWN";
        const bool sell = order.side == exchanges::OrderSide::SELL;
        order.type = (stop_down == sell) ? exchanges::OrderType::STOP_LOSS : exchanges::OrderType::TAKE_PROFIT;
        order.quantity = exchanges::json_double(stop, "base_size");
        order.price = exchanges::json_double(stop, "limit_price");
        order.stop_price = exchanges::json_double(stop, "stop_price");
    } else {
        const Json::Value& market = configuration["market_market_ioc"];
        order.type = exchanges::OrderType::MARKET;
        order.quantity = exchanges::json_double(market, "base_size");
        if (order.quantity <= 0.0) {
            // Quote-sized market buys report their base quantity only once filled
            const double quote_size = exchanges::json_double(market, "quote_size");
            order.quantity = order.filled_quantity > 0.0
                ? order.filled_quantity
                : (order.average_price > 0.0 ? quote_size / order.average_price : 0.0);
        }
    }

    order.created_at = exchanges::parse_iso8601(exchanges::json_string(node, "created_time"));
    const std::string last_fill = exchanges::json_string(node, "last_fill_time");
    order.updated_at = last_fill.empty() ? order.created_at : exchanges::parse_iso8601(last_fill);
    return order;
}

exchanges::OrderStatus CoinbaseGateway::map_status(const std::string& status) {
    if (status == "OPEN") return exchanges::OrderStatus::OPEN;
    if (status == "FILLED") return exchanges::OrderStatus::FILLED;
    if (status == "CANCELLED" || status == "CANCEL_QUEUED") return exchanges::OrderStatus::CANCELLED;
    if (status == "EXPIRED" || status == "FAILED") return exchanges::OrderStatus::REJECTED;
    return exchanges::OrderStatus::PENDING;
}

std::string CoinbaseGateway::format_decimal(double value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.8f", value);
    std::string text(buffer);
    while (!text.empty() && text.back() == '0') text.pop_back();
    if (!text.empty() && text.back() == '.') text.pop_back();
    return text;
}

} // namespace coinbase
