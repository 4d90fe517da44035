#pragma once
#include <memory>
#include <string>
#include <vector>
#include "i_exchange_gateway.hpp"
#include "../utils/http/i_http_handler.hpp"

namespace exchanges {

// Per-venue transport settings; empty base_url selects the venue default
struct VenueSettings {
    std::string base_url;
    int timeout_ms{10000};
    int recv_window_ms{5000};
};

/**
 * Factory for creating venue gateways
 */
class GatewayFactory {
public:
    /**
     * Create a gateway for the specified exchange
     * @param exchange_name The name of the exchange (e.g., "binance", "coinbase")
     * @param credentials Account credentials, owned by the returned gateway
     * @param http Transport shared by the gateway
     * @param settings Venue transport settings
     * @throws error_handling::ConnectionError if the exchange is not supported
     */
    static std::shared_ptr<IExchangeGateway> create(const std::string& exchange_name,
                                                    const ExchangeCredentials& credentials,
                                                    std::shared_ptr<IHttpHandler> http,
                                                    const VenueSettings& settings = {});

    static bool is_supported(const std::string& exchange_name);

    static std::vector<std::string> get_supported_exchanges();

    // Lowercases and folds common aliases ("Binance.com", "coinbase_advanced")
    static std::string normalize_exchange_name(const std::string& exchange_name);
};

} // namespace exchanges
