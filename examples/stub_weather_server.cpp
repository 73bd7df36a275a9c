// Stdio MCP server exposing get_alerts / get_forecast with canned answers.
// Used by the end-to-end tests; never touches the network.

#include "weathermcp/mcp/handler.hpp"
#include "weathermcp/server/stdio_server.hpp"
#include "weathermcp/tools/manager.hpp"
#include "weathermcp/weather/params.hpp"

#include <iostream>
#include <string>

int main()
{
    using weathermcp::Json;
    namespace tools = weathermcp::tools;
    namespace weather = weathermcp::weather;

    tools::ToolManager tm;
    tm.register_tool(tools::Tool{"get_alerts", weather::alerts_input_schema(),
                                 [](const Json& args)
                                 {
                                     weather::decode_alerts_params(args);
                                     return std::string("Event: Canned Storm\n"
                                                        "Area: Stub County\n"
                                                        "Severity: Minor\n"
                                                        "Description: canned alert text\n"
                                                        "Instructions: none");
                                 },
                                 "Canned alerts"});
    tm.register_tool(tools::Tool{"get_forecast", weather::forecast_input_schema(),
                                 [](const Json& args)
                                 {
                                     auto decoded = weather::decode_forecast_params(args);
                                     if (auto* p = std::get_if<weather::ForecastParams>(&decoded))
                                         return "Tonight: Canned (50°F) Wind 5 mph @ " +
                                                Json(p->latitude).dump() + "," +
                                                Json(p->longitude).dump();
                                     return std::string("Invalid latitude/longitude.");
                                 },
                                 "Canned forecast"});

    auto handler = weathermcp::mcp::make_mcp_handler("weather-stub", "0.1.0", tm,
                                                     std::string("Canned weather for tests"));
    weathermcp::server::StdioServerWrapper server(handler);
    server.run();
    std::cerr << "stub server: stdin closed" << std::endl;
    return 0;
}
