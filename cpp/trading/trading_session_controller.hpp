#pragma once
#include "credential_store.hpp"
#include "paper_execution_engine.hpp"
#include "../exchanges/gateway_factory.hpp"
#include "../exchanges/i_exchange_gateway.hpp"
#include "../utils/ratelimit/rate_limiter.hpp"
#include "../utils/resilience/resilience.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace trading {

enum class TradingMode {
    PAPER,
    LIVE
};

std::string to_string(TradingMode mode);
// Accepts "paper" and "live"; throws InvalidRequestError otherwise
TradingMode parse_trading_mode(const std::string& value);

struct SessionState {
    TradingMode mode = TradingMode::PAPER;
    std::optional<std::string> exchange_id;
    std::optional<std::string> exchange_name;
    bool is_connected = false;
    bool can_trade = false;     // the single gate callers check before allowing orders
};

/**
 * Per-user trading sessions.
 *
 * disconnected -> connected(paper) <-> connected(live). A session is created only after the
 * venue accepts the credentials (test_connection), always starts in paper mode, and routes
 * every market-data, account and trading call to the live gateway or its paper engine by
 * mode. Different users never share a session; calls for one user may run concurrently and
 * the paper engine serializes its own ledger.
 */
class TradingSessionController {
public:
    // Builds the live gateway for a user from decrypted credentials
    using GatewayBuilder = std::function<std::shared_ptr<exchanges::IExchangeGateway>(
        const std::string& user_id, const std::string& exchange, const exchanges::ExchangeCredentials& credentials)>;

    TradingSessionController(std::shared_ptr<ICredentialStore> credential_store,
                             std::shared_ptr<ISecretDecryptor> decryptor,
                             GatewayBuilder gateway_builder,
                             PaperConfig paper_config = {});

    /**
     * Venue gateways from GatewayFactory, each wrapped in a ResilientGateway charging the
     * user's call budget and sharing the venue's "exchange:<id>" breaker from the registry.
     */
    static GatewayBuilder make_resilient_builder(std::shared_ptr<IHttpHandler> http,
                                                 ratelimit::RateLimiter& limiter,
                                                 std::map<std::string, exchanges::VenueSettings> venue_settings = {},
                                                 std::optional<resilience::CircuitBreakerConfig> breaker_config = std::nullopt);

    // Throws ConnectionError for unknown, foreign or undecryptable records, unsupported
    // venues and credentials the venue rejects
    SessionState connect_exchange(const std::string& user_id, const std::string& connection_id);
    // Live requires acknowledged; failures leave the session untouched
    void switch_mode(const std::string& user_id, TradingMode mode, bool acknowledged = false);
    SessionState get_state(const std::string& user_id) const;
    // Best effort; venue disconnect failures are logged
    void disconnect_exchange(const std::string& user_id);
    void disconnect_all();

    // Delegated operations; all throw NoSessionError without a session
    exchanges::Ticker get_ticker(const std::string& user_id, const std::string& symbol);
    std::vector<exchanges::Ticker> get_tickers(const std::string& user_id, const std::vector<std::string>& symbols);
    exchanges::OrderBook get_order_book(const std::string& user_id, const std::string& symbol, int depth = 20);
    std::vector<exchanges::TradingPair> get_trading_pairs(const std::string& user_id);

    std::vector<exchanges::Balance> get_balances(const std::string& user_id);
    std::optional<exchanges::Balance> get_balance(const std::string& user_id, const std::string& asset);

    exchanges::Order create_order(const std::string& user_id, const exchanges::OrderRequest& request);
    bool cancel_order(const std::string& user_id, const std::string& order_id,
                      const std::optional<std::string>& symbol = std::nullopt);
    std::optional<exchanges::Order> get_order(const std::string& user_id, const std::string& order_id,
                                              const std::optional<std::string>& symbol = std::nullopt);
    std::vector<exchanges::Order> get_open_orders(const std::string& user_id,
                                                  const std::optional<std::string>& symbol = std::nullopt);
    std::vector<exchanges::Order> get_order_history(const std::string& user_id,
                                                    const std::optional<std::string>& symbol = std::nullopt,
                                                    int limit = 50);

    std::vector<exchanges::Position> get_positions(const std::string& user_id);
    std::vector<exchanges::Trade> get_trades(const std::string& user_id,
                                             const std::optional<std::string>& symbol = std::nullopt,
                                             int limit = 50);

    // Quote-asset balances plus positions at current prices, in the active mode
    double get_portfolio_value(const std::string& user_id);
    void reset_paper_account(const std::string& user_id);

    std::shared_ptr<exchanges::IExchangeGateway> get_active_gateway(const std::string& user_id) const;
    std::shared_ptr<PaperExecutionEngine> get_paper_engine(const std::string& user_id) const;
    size_t session_count() const;

private:
    struct Session {
        std::shared_ptr<exchanges::IExchangeGateway> live;
        std::shared_ptr<PaperExecutionEngine> paper;
        TradingMode mode = TradingMode::PAPER;
        std::string exchange_id;
        std::string exchange_name;
        std::string connection_id;
    };

    Session require_session(const std::string& user_id) const;
    static SessionState to_state(const Session& session);

    std::shared_ptr<ICredentialStore> credential_store_;
    std::shared_ptr<ISecretDecryptor> decryptor_;
    GatewayBuilder gateway_builder_;
    PaperConfig paper_config_;

    mutable std::mutex mutex_;
    std::map<std::string, Session> sessions_;
};

} // namespace trading
