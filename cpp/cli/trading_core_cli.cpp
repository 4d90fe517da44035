#include "command_shell.hpp"
#include "../trading/core_config.hpp"
#include "../trading/credential_store.hpp"
#include "../trading/event_sink.hpp"
#include "../trading/execution_service.hpp"
#include "../trading/trading_session_controller.hpp"
#include "../utils/http/curl_http_handler.hpp"
#include "../utils/logging/log_helper.hpp"
#include "../utils/metrics/metrics_collector.hpp"
#include "../utils/ratelimit/rate_limiter.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " -c <path/to/trading_core.ini> [--user <id>] [--tier <tier>]\n"
              << "Example: " << program << " -c config/trading_core.ini --user alice --tier pro\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string user_override;
    std::string tier_override;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            config_file = arg.substr(std::string("--config=").size());
        } else if (arg == "--user" && i + 1 < argc) {
            user_override = argv[++i];
        } else if (arg == "--tier" && i + 1 < argc) {
            tier_override = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
    }

    if (config_file.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::signal(SIGPIPE, SIG_IGN);

    try {
        trading::CoreConfig cfg = trading::load_core_config(config_file);
        logging::initialize_logging(cfg.logging.file, cfg.logging.level, cfg.logging.console);
        LOG_INFO_COMP("CLI", "=== " + cfg.process_name + " ===");

        const std::string user_id = user_override.empty() ? cfg.cli.user_id : user_override;

        ratelimit::RateLimiter limiter;
        for (const auto& [exchange, limit] : cfg.exchange_limits) {
            limiter.set_exchange_limit(exchange, limit);
        }
        limiter.set_user_tier(user_id, ratelimit::parse_tier(tier_override.empty() ? cfg.cli.tier : tier_override));

        auto store = std::make_shared<trading::InMemoryCredentialStore>();
        for (const auto& connection : cfg.connections) {
            store->add(connection);
        }

        std::shared_ptr<trading::ISecretDecryptor> decryptor;
        if (cfg.vault.passphrase.empty()) {
            decryptor = std::make_shared<trading::PlaintextDecryptor>();
        } else {
            decryptor = std::make_shared<trading::AesGcmDecryptor>(cfg.vault.passphrase, cfg.vault.salt);
        }

        std::shared_ptr<IHttpHandler> http = HttpHandlerFactory::create(HttpHandlerFactory::Type::CURL);

        std::shared_ptr<trading::IEventSink> events;
        if (cfg.events.enabled) {
            events = std::make_shared<trading::ZmqEventSink>(cfg.events.endpoint);
        }

        trading::TradingSessionController sessions(
            store, decryptor,
            trading::TradingSessionController::make_resilient_builder(http, limiter, cfg.venues, cfg.circuit_breaker),
            cfg.paper);
        trading::ExecutionService service(sessions, limiter, events, cfg.risk);

        cli::CommandShell shell(service, sessions, user_id, std::cout);
        if (!cfg.cli.connection_id.empty()) {
            shell.execute("connect " + cfg.cli.connection_id);
        }
        shell.run(std::cin);

        sessions.disconnect_all();
        metrics::MetricsCollector::instance().print_all_metrics();
        http->shutdown();
        LOG_INFO_COMP("CLI", "Shutdown complete");
        logging::cleanup_logging();
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR_COMP("CLI", "Fatal: " + std::string(e.what()));
        logging::cleanup_logging();
        return 1;
    }
}
