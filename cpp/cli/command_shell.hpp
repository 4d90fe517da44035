#pragma once
#include "../trading/execution_service.hpp"
#include "../trading/trading_session_controller.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace cli {

/**
 * Line-oriented driver over ExecutionService for one configured user.
 *
 * Each line is one command; errors are printed and never end the session. See help().
 */
class CommandShell {
public:
    CommandShell(trading::ExecutionService& service, trading::TradingSessionController& sessions,
                 std::string user_id, std::ostream& out);

    // Returns false once "quit" has been read
    bool execute(const std::string& line);
    // Reads commands until quit or end of input
    void run(std::istream& in);

    void help() const;

private:
    void connect(const std::vector<std::string>& args);
    void mode(const std::vector<std::string>& args);
    void ticker(const std::vector<std::string>& args);
    void market(exchanges::OrderSide side, const std::vector<std::string>& args);
    void limit(const std::vector<std::string>& args);
    void cancel(const std::vector<std::string>& args);
    void orders(const std::vector<std::string>& args);
    void balances();
    void positions();
    void portfolio();
    void risk();
    void limits();
    void status();
    void breakers();
    void reset();

    void print_order(const exchanges::Order& order) const;

    trading::ExecutionService& service_;
    trading::TradingSessionController& sessions_;
    std::string user_id_;
    std::ostream& out_;
};

std::vector<std::string> tokenize(const std::string& line);

} // namespace cli
