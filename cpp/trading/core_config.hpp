#pragma once
#include "credential_store.hpp"
#include "execution_service.hpp"
#include "paper_execution_engine.hpp"
#include "../exchanges/gateway_factory.hpp"
#include "../utils/config/process_config_manager.hpp"
#include "../utils/logging/logger.hpp"
#include "../utils/resilience/resilience.hpp"
#include <map>
#include <string>
#include <vector>

namespace trading {

struct LoggingSettings {
    logging::LogLevel level = logging::LogLevel::INFO;
    std::string file;
    bool console = true;
};

struct EventSettings {
    bool enabled = false;
    std::string endpoint = "tcp://127.0.0.1:5560";
};

// Driver settings for trading_core_cli
struct CliSettings {
    std::string user_id = "local";
    std::string tier = "free";
    std::string connection_id;          // connected on startup when set
};

// Key vault parameters; empty passphrase means connection secrets are stored in plaintext
struct VaultSettings {
    std::string passphrase;
    std::string salt;
};

struct CoreConfig {
    std::string process_name = "trading_core";
    LoggingSettings logging;
    PaperConfig paper;
    RiskSettings risk;
    resilience::CircuitBreakerConfig circuit_breaker;
    std::map<std::string, int> exchange_limits;                     // calls per minute
    std::map<std::string, exchanges::VenueSettings> venues;
    EventSettings events;
    CliSettings cli;
    VaultSettings vault;
    std::vector<StoredConnection> connections;                      // [connection.<id>]
};

CoreConfig load_core_config(const config::ProcessConfigManager& manager);
// Throws std::runtime_error if the file cannot be read
CoreConfig load_core_config(const std::string& config_file);

} // namespace trading
