#pragma once
#include "weathermcp/client/client.hpp"

#include <csignal>
#include <cstddef>
#include <iosfwd>
#include <string>

namespace weathermcp::client
{

enum class ReplState
{
    Connecting,
    Ready,
    AwaitingInput,
    Dispatching,
    Closed
};

const char* to_string(ReplState state);

/// One parsed input line
struct Command
{
    enum class Kind
    {
        Empty,
        Quit,
        Alerts,
        Forecast,
        Usage,
        Unknown
    };

    Kind kind{Kind::Empty};
    std::string state;     ///< Alerts: region code as typed
    double latitude{0.0};  ///< Forecast
    double longitude{0.0}; ///< Forecast
    std::string message;   ///< Usage / Unknown: text to print
};

constexpr const char* PROMPT = "Query (alerts <STATE> | forecast <LAT> <LON> | quit): ";
constexpr const char* ALERTS_USAGE = "Usage: alerts <STATE>";
constexpr const char* FORECAST_USAGE = "Usage: forecast <LAT> <LON>";
constexpr const char* UNKNOWN_COMMAND = "Unknown command. Try: alerts CA  |  forecast 37.78 -122.42";

/// Parses one line of user input.
/// @throws ValidationError when forecast coordinates are not numbers
Command parse_command(const std::string& line);

/// Interactive loop over a Client: handshake and tool listing once, then one
/// tool call per input line until quit, end of input or interrupt.
///
/// Errors raised while dispatching a command are printed as "Error: <message>"
/// and the loop carries on.
class Repl
{
  public:
    Repl(Client& client, std::istream& in, std::ostream& out);

    /// Connecting -> Ready: initialize and list tools. Throws on failure.
    void start();

    /// Runs until Closed. Calls start() first if needed.
    void run();

    /// Processes one line in AwaitingInput. Returns false once Closed.
    bool handle_line(const std::string& line);

    /// Checked before each prompt; a non-zero value closes the loop.
    void set_interrupt_flag(const volatile std::sig_atomic_t* flag)
    {
        interrupted_ = flag;
    }

    ReplState state() const
    {
        return state_;
    }

    /// Number of tools/call requests issued so far
    std::size_t calls_made() const
    {
        return calls_made_;
    }

  private:
    void dispatch(const Command& cmd);
    void print_result(const CallToolResult& result);
    bool interrupted() const
    {
        return interrupted_ != nullptr && *interrupted_ != 0;
    }

    Client& client_;
    std::istream& in_;
    std::ostream& out_;
    ReplState state_{ReplState::Connecting};
    std::size_t calls_made_{0};
    const volatile std::sig_atomic_t* interrupted_{nullptr};
};

} // namespace weathermcp::client
