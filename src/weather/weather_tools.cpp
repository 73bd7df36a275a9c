#include "weathermcp/weather/weather_tools.hpp"

namespace weathermcp::weather
{

void register_weather_tools(tools::ToolManager& manager, std::shared_ptr<const NwsClient> nws)
{
    manager.register_tool(tools::Tool{
        "get_alerts", alerts_input_schema(),
        [nws](const weathermcp::Json& args)
        { return tools::present("get_alerts", get_alerts(*nws, decode_alerts_params(args))); },
        "Get active weather alerts for a US state (e.g., CA, NY)."});

    manager.register_tool(tools::Tool{
        "get_forecast", forecast_input_schema(),
        [nws](const weathermcp::Json& args)
        {
            auto decoded = decode_forecast_params(args);
            if (auto* err = std::get_if<tools::ToolError>(&decoded))
                return tools::present("get_forecast", *err);
            return tools::present("get_forecast",
                                  get_forecast(*nws, std::get<ForecastParams>(decoded)));
        },
        "Get a short forecast for a location by lat/lon (first ~4 periods)."});
}

} // namespace weathermcp::weather
