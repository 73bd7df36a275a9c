#pragma once

/// @file weathermcp.hpp
/// @brief Main header for weathermcp - includes commonly used components
///
/// Usage:
/// @code
/// #include <weathermcp.hpp>
///
/// int main() {
///     weathermcp::client::Client client(
///         std::make_unique<weathermcp::client::StdioTransport>("./weathermcp_server"));
///     client.initialize();
///     auto result = client.call_tool("get_forecast", {{"latitude", 37.78}, {"longitude", -122.42}});
///     std::cout << result.text() << std::endl;
/// }
/// @endcode

// Core types and exceptions
#include "weathermcp/content.hpp"
#include "weathermcp/exceptions.hpp"
#include "weathermcp/settings.hpp"
#include "weathermcp/types.hpp"
#include "weathermcp/version.hpp"

// Client
#include "weathermcp/client/client.hpp"
#include "weathermcp/client/repl.hpp"
#include "weathermcp/client/transports.hpp"
#include "weathermcp/client/types.hpp"

// Server
#include "weathermcp/mcp/handler.hpp"
#include "weathermcp/server/stdio_server.hpp"

// Tools
#include "weathermcp/tools/manager.hpp"
#include "weathermcp/tools/outcome.hpp"
#include "weathermcp/tools/tool.hpp"

// Weather API tools
#include "weathermcp/weather/nws_client.hpp"
#include "weathermcp/weather/params.hpp"
#include "weathermcp/weather/weather_tools.hpp"
