#include "command_shell.hpp"
#include "../utils/error_handling.hpp"
#include "../utils/health/health_checker.hpp"
#include "../utils/logging/log_helper.hpp"
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace cli {

namespace {

double parse_number(const std::string& text, const char* what) {
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw error_handling::InvalidRequestError(std::string("Invalid ") + what + ": " + text);
    }
}

std::string upper(std::string value) {
    for (auto& c : value) c = static_cast<char>(::toupper(static_cast<unsigned char>(c)));
    return value;
}

} // namespace

std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

CommandShell::CommandShell(trading::ExecutionService& service, trading::TradingSessionController& sessions,
                           std::string user_id, std::ostream& out)
    : service_(service), sessions_(sessions), user_id_(std::move(user_id)), out_(out) {
    out_ << std::fixed << std::setprecision(8);
}

void CommandShell::run(std::istream& in) {
    std::string line;
    out_ << "> " << std::flush;
    while (std::getline(in, line)) {
        if (!execute(line)) {
            break;
        }
        out_ << "> " << std::flush;
    }
}

bool CommandShell::execute(const std::string& line) {
    auto tokens = tokenize(line);
    if (tokens.empty()) {
        return true;
    }
    const std::string command = tokens.front();
    std::vector<std::string> args(tokens.begin() + 1, tokens.end());

    try {
        if (command == "quit" || command == "exit") return false;
        else if (command == "help") help();
        else if (command == "connect") connect(args);
        else if (command == "disconnect") { service_.disconnect(user_id_); out_ << "disconnected\n"; }
        else if (command == "mode") mode(args);
        else if (command == "ticker") ticker(args);
        else if (command == "buy") market(exchanges::OrderSide::BUY, args);
        else if (command == "sell") market(exchanges::OrderSide::SELL, args);
        else if (command == "limit") limit(args);
        else if (command == "cancel") cancel(args);
        else if (command == "orders") orders(args);
        else if (command == "balances") balances();
        else if (command == "positions") positions();
        else if (command == "portfolio") portfolio();
        else if (command == "risk") risk();
        else if (command == "limits") limits();
        else if (command == "status") status();
        else if (command == "breakers") breakers();
        else if (command == "reset") reset();
        else out_ << "unknown command: " << command << " (try help)\n";
    } catch (const error_handling::RiskRejectedError& e) {
        out_ << "error: " << e.what() << "\n";
        for (const auto& warning : e.warnings()) {
            out_ << "  warning: " << warning << "\n";
        }
    } catch (const error_handling::RateLimitExceededError& e) {
        out_ << "error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        LOG_DEBUG_COMP("CLI", "Command '" + command + "' failed: " + std::string(e.what()));
        out_ << "error: " << e.what() << "\n";
    }
    return true;
}

void CommandShell::help() const {
    out_ << "commands:\n"
         << "  connect <connection_id>          verify credentials and open a paper session\n"
         << "  disconnect\n"
         << "  mode <paper|live> [--ack]        live requires --ack\n"
         << "  ticker <BASE/QUOTE>\n"
         << "  buy|sell <BASE/QUOTE> <qty> [price] [sl=<stop>] [tp=<target>]\n"
         << "  limit <buy|sell> <BASE/QUOTE> <qty> <price>\n"
         << "  cancel <order_id> [BASE/QUOTE]\n"
         << "  orders [open] [BASE/QUOTE]\n"
         << "  balances | positions | portfolio | risk | limits | status | breakers\n"
         << "  reset                            restore the paper account\n"
         << "  quit\n";
}

void CommandShell::connect(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        throw error_handling::InvalidRequestError("usage: connect <connection_id>");
    }
    auto state = service_.connect(user_id_, args[0]);
    out_ << "connected to " << state.exchange_name.value_or("?") << " (" << trading::to_string(state.mode) << ")\n";
}

void CommandShell::mode(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << trading::to_string(service_.get_state(user_id_).mode) << "\n";
        return;
    }
    bool ack = args.size() > 1 && args[1] == "--ack";
    auto mode = trading::parse_trading_mode(args[0]);
    service_.switch_mode(user_id_, mode, ack);
    out_ << "mode: " << trading::to_string(mode) << "\n";
}

void CommandShell::ticker(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        throw error_handling::InvalidRequestError("usage: ticker <BASE/QUOTE>");
    }
    auto t = sessions_.get_ticker(user_id_, upper(args[0]));
    out_ << t.symbol << " last " << t.price << " bid " << t.bid << " ask " << t.ask
         << " high " << t.high_24h << " low " << t.low_24h << " vol " << t.volume_24h << "\n";
}

void CommandShell::market(exchanges::OrderSide side, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        throw error_handling::InvalidRequestError("usage: buy|sell <BASE/QUOTE> <qty> [price] [sl=<stop>] [tp=<target>]");
    }
    exchanges::OrderRequest request;
    request.symbol = upper(args[0]);
    request.side = side;
    request.type = exchanges::OrderType::MARKET;
    request.quantity = parse_number(args[1], "quantity");

    trading::RiskPlan plan;
    for (size_t i = 2; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg.rfind("sl=", 0) == 0) {
            plan.stop_loss = parse_number(arg.substr(3), "stop loss");
        } else if (arg.rfind("tp=", 0) == 0) {
            plan.take_profit = parse_number(arg.substr(3), "take profit");
        } else {
            request.price = parse_number(arg, "price");
        }
    }

    auto placement = service_.place_order(user_id_, request, plan);
    for (const auto& warning : placement.warnings) {
        out_ << "warning: " << warning << "\n";
    }
    print_order(placement.order);
}

void CommandShell::limit(const std::vector<std::string>& args) {
    if (args.size() != 4) {
        throw error_handling::InvalidRequestError("usage: limit <buy|sell> <BASE/QUOTE> <qty> <price>");
    }
    exchanges::OrderRequest request;
    request.side = exchanges::parse_order_side(args[0]);
    request.symbol = upper(args[1]);
    request.type = exchanges::OrderType::LIMIT;
    request.quantity = parse_number(args[2], "quantity");
    request.price = parse_number(args[3], "price");

    auto placement = service_.place_order(user_id_, request);
    for (const auto& warning : placement.warnings) {
        out_ << "warning: " << warning << "\n";
    }
    print_order(placement.order);
}

void CommandShell::cancel(const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) {
        throw error_handling::InvalidRequestError("usage: cancel <order_id> [BASE/QUOTE]");
    }
    std::optional<std::string> symbol;
    if (args.size() == 2) {
        symbol = upper(args[1]);
    }
    out_ << (service_.cancel_order(user_id_, args[0], symbol) ? "cancelled " : "not cancelled ") << args[0] << "\n";
}

void CommandShell::orders(const std::vector<std::string>& args) {
    bool open_only = !args.empty() && args[0] == "open";
    std::optional<std::string> symbol;
    size_t symbol_index = open_only ? 1 : 0;
    if (args.size() > symbol_index) {
        symbol = upper(args[symbol_index]);
    }

    auto list = open_only ? service_.get_open_orders(user_id_, symbol)
                          : service_.get_order_history(user_id_, symbol, 20);
    if (list.empty()) {
        out_ << "no orders\n";
    }
    for (const auto& order : list) {
        print_order(order);
    }
}

void CommandShell::balances() {
    for (const auto& balance : service_.get_balances(user_id_)) {
        out_ << std::left << std::setw(8) << balance.asset << std::right
             << " available " << balance.available << " locked " << balance.locked << "\n";
    }
}

void CommandShell::positions() {
    auto list = service_.get_positions(user_id_);
    if (list.empty()) {
        out_ << "no positions\n";
    }
    for (const auto& p : list) {
        out_ << p.symbol << " " << exchanges::to_string(p.side) << " qty " << p.quantity << " entry " << p.entry_price
             << " mark " << p.current_price << " pnl " << p.unrealized_pnl << "\n";
    }
}

void CommandShell::portfolio() {
    out_ << "portfolio value " << sessions_.get_portfolio_value(user_id_) << "\n";
}

void CommandShell::risk() {
    auto m = service_.get_risk_metrics(user_id_);
    out_ << std::setprecision(4)
         << "equity " << m.total_equity << " realized " << m.realized_pnl << " unrealized " << m.unrealized_pnl
         << " daily " << m.daily_pnl << "\n"
         << "open positions " << m.open_positions << " max drawdown " << m.drawdown.max_drawdown_percent * 100.0
         << "% current " << m.drawdown.current_drawdown_percent * 100.0 << "%\n"
         << "VaR95 " << m.var_95 << " CVaR95 " << m.cvar_95 << " sharpe " << m.sharpe_ratio
         << " sortino " << m.sortino_ratio << "\n"
         << "trades " << m.trade_stats.total_trades << " win rate " << m.trade_stats.win_rate * 100.0
         << "% profit factor " << m.trade_stats.profit_factor << " expectancy " << m.trade_stats.expectancy << "\n"
         << std::setprecision(8);
}

void CommandShell::limits() {
    auto status = service_.get_rate_limit_status(user_id_);
    out_ << "tier " << ratelimit::to_string(status.tier)
         << " orders/min " << status.limits.orders_per_minute
         << " live " << (status.limits.live_trading ? "yes" : "no") << "\n";
    for (const auto& [category, bucket] : status.buckets) {
        out_ << "  " << category << " " << bucket.used << "/" << bucket.limit << "\n";
    }
    if (status.exchange) {
        if (status.exchange->remaining < 0) {
            out_ << "  exchange unlimited\n";
        } else {
            out_ << "  exchange " << status.exchange->percent_used << "% used, " << status.exchange->remaining
                 << " remaining" << (status.exchange->warning ? " (warning)" : "") << "\n";
        }
    }

    auto risk_limits = service_.get_risk_limits(user_id_);
    out_ << std::setprecision(4)
         << "risk: max position " << risk_limits.max_position_size << " daily loss " << risk_limits.max_daily_loss
         << " drawdown " << risk_limits.max_drawdown << " positions " << risk_limits.max_open_positions
         << " min r/r " << risk_limits.min_risk_reward_ratio << "\n"
         << std::setprecision(8);
}

void CommandShell::status() {
    auto state = service_.get_state(user_id_);
    out_ << "user " << user_id_ << " mode " << trading::to_string(state.mode)
         << " exchange " << state.exchange_name.value_or("-")
         << " connected " << (state.is_connected ? "yes" : "no")
         << " can trade " << (state.can_trade ? "yes" : "no") << "\n";

    health::HealthChecker checker("trading_core");
    health::register_circuit_breaker_checks(checker, service_.breakers());
    checker.register_check("session", [&state]() -> health::ProbeResult {
        if (!state.is_connected) {
            return {health::HealthStatus::DEGRADED, "no exchange connected"};
        }
        return {health::HealthStatus::HEALTHY, "connected to " + state.exchange_name.value_or("?")};
    });
    auto report = checker.check();
    out_ << "health " << health::to_string(report.status) << ": " << report.message << "\n";
    for (const auto& [name, probe] : report.probes) {
        out_ << "  " << name << " " << health::to_string(probe.status) << " " << probe.message << "\n";
    }

    service_.publish_metrics();
}

void CommandShell::breakers() {
    auto stats = service_.get_breaker_stats();
    if (stats.empty()) {
        out_ << "no breakers\n";
    }
    for (const auto& [name, s] : stats) {
        out_ << name << " " << resilience::to_string(s.state) << " failures " << s.total_failures << "/"
             << s.total_requests << "\n";
    }
}

void CommandShell::reset() {
    sessions_.reset_paper_account(user_id_);
    out_ << "paper account reset\n";
}

void CommandShell::print_order(const exchanges::Order& order) const {
    out_ << order.id << " " << exchanges::to_string(order.side) << " " << exchanges::to_string(order.type) << " "
         << order.symbol << " qty " << order.quantity << " filled " << order.filled_quantity;
    if (order.price) {
        out_ << " price " << *order.price;
    }
    if (order.average_price > 0.0) {
        out_ << " avg " << order.average_price;
    }
    out_ << " " << exchanges::to_string(order.status) << "\n";
}

} // namespace cli
