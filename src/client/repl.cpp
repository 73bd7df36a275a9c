#include "weathermcp/client/repl.hpp"

#include "weathermcp/exceptions.hpp"
#include "weathermcp/util/log.hpp"
#include "weathermcp/util/strings.hpp"

#include <istream>
#include <ostream>

namespace weathermcp::client
{

const char* to_string(ReplState state)
{
    switch (state)
    {
    case ReplState::Connecting:
        return "Connecting";
    case ReplState::Ready:
        return "Ready";
    case ReplState::AwaitingInput:
        return "AwaitingInput";
    case ReplState::Dispatching:
        return "Dispatching";
    case ReplState::Closed:
        return "Closed";
    }
    return "Unknown";
}

static double parse_coordinate(const std::string& token)
{
    auto v = util::parse_double(token);
    if (!v)
        throw weathermcp::ValidationError("could not convert '" + token + "' to a number");
    return *v;
}

Command parse_command(const std::string& line)
{
    Command cmd;
    const std::string q = util::trim(line);
    if (q.empty())
        return cmd;

    if (util::to_lower(q) == "quit")
    {
        cmd.kind = Command::Kind::Quit;
        return cmd;
    }

    auto tokens = util::split_ws(q);
    const std::string& verb = tokens.front();

    if (verb == "alerts")
    {
        if (tokens.size() < 2)
        {
            cmd.kind = Command::Kind::Usage;
            cmd.message = ALERTS_USAGE;
            return cmd;
        }
        // Everything after the verb, so "alerts C A" reaches the tool as "C A"
        cmd.kind = Command::Kind::Alerts;
        cmd.state = util::trim(q.substr(verb.size()));
        return cmd;
    }

    if (verb == "forecast")
    {
        if (tokens.size() != 3)
        {
            cmd.kind = Command::Kind::Usage;
            cmd.message = FORECAST_USAGE;
            return cmd;
        }
        cmd.kind = Command::Kind::Forecast;
        cmd.latitude = parse_coordinate(tokens[1]);
        cmd.longitude = parse_coordinate(tokens[2]);
        return cmd;
    }

    cmd.kind = Command::Kind::Unknown;
    cmd.message = UNKNOWN_COMMAND;
    return cmd;
}

Repl::Repl(Client& client, std::istream& in, std::ostream& out)
    : client_(client), in_(in), out_(out)
{
}

void Repl::start()
{
    state_ = ReplState::Connecting;
    client_.initialize();

    std::string names;
    for (const auto& tool : client_.list_tools())
    {
        if (!names.empty())
            names += ", ";
        names += tool.name;
    }
    out_ << "Connected. Tools available: " << names << std::endl;
    state_ = ReplState::Ready;
}

void Repl::run()
{
    if (state_ == ReplState::Connecting)
        start();

    std::string line;
    while (state_ != ReplState::Closed)
    {
        if (interrupted())
            break;

        state_ = ReplState::AwaitingInput;
        out_ << "\n" << PROMPT << std::flush;
        if (!std::getline(in_, line))
            break;
        if (!handle_line(line))
            break;
    }

    if (state_ != ReplState::Closed)
        out_ << std::endl;
    state_ = ReplState::Closed;
}

bool Repl::handle_line(const std::string& line)
{
    if (state_ == ReplState::Closed)
        return false;
    state_ = ReplState::AwaitingInput;

    try
    {
        Command cmd = parse_command(line);
        switch (cmd.kind)
        {
        case Command::Kind::Empty:
            return true;
        case Command::Kind::Quit:
            state_ = ReplState::Closed;
            return false;
        case Command::Kind::Usage:
        case Command::Kind::Unknown:
            out_ << cmd.message << std::endl;
            return true;
        case Command::Kind::Alerts:
        case Command::Kind::Forecast:
            state_ = ReplState::Dispatching;
            dispatch(cmd);
            break;
        }
    }
    catch (const std::exception& e)
    {
        log::debug(std::string("command failed: ") + e.what());
        out_ << "Error: " << e.what() << std::endl;
    }

    state_ = ReplState::Ready;
    return true;
}

void Repl::dispatch(const Command& cmd)
{
    ++calls_made_;
    if (cmd.kind == Command::Kind::Alerts)
        print_result(client_.call_tool("get_alerts", {{"state", cmd.state}}));
    else
        print_result(client_.call_tool(
            "get_forecast", {{"latitude", cmd.latitude}, {"longitude", cmd.longitude}}));
}

void Repl::print_result(const CallToolResult& result)
{
    out_ << result.text() << std::endl;
}

} // namespace weathermcp::client
