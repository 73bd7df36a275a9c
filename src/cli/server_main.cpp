#include "weathermcp/mcp/handler.hpp"
#include "weathermcp/server/stdio_server.hpp"
#include "weathermcp/settings.hpp"
#include "weathermcp/tools/manager.hpp"
#include "weathermcp/util/log.hpp"
#include "weathermcp/version.hpp"
#include "weathermcp/weather/weather_tools.hpp"

#include <exception>
#include <memory>
#include <string>

int main(int argc, char** argv)
{
    using namespace weathermcp;

    (void)argv;
    auto settings = Settings::from_env();
    log::set_level(log::level_from_string(settings.log_level));
    log::set_name("weather");

    if (argc > 1)
        log::warning("weathermcp_server takes no arguments; ignoring them");

    try
    {
        tools::ToolManager registry;
        weather::register_weather_tools(registry, std::make_shared<const weather::NwsClient>(settings));

        auto handler = mcp::make_mcp_handler("weather", VERSION_STRING, registry);
        server::StdioServerWrapper server(handler);

        log::info("serving " + std::to_string(registry.size()) + " tools over stdio (API " +
                  settings.api_base + ")");
        server.run();
        log::info("stdin closed, shutting down");
    }
    catch (const std::exception& e)
    {
        log::error(std::string("fatal: ") + e.what());
        return 1;
    }
    return 0;
}
