#pragma once
#include "weathermcp/types.hpp"

#include <optional>
#include <string>

namespace weathermcp
{

struct Settings
{
    std::string log_level{"INFO"};
    std::string api_base{"https://api.weather.gov"};
    std::string user_agent{"mcp-weather/1.0 (example)"};
    int http_timeout_seconds{30};
    /// Per-request wait on the stdio stream, 0 waits forever
    int request_timeout_ms{0};
    /// Where a spawned server's stderr goes; inherited when unset
    std::optional<std::string> server_log_file;

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace weathermcp
