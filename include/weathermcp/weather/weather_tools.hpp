#pragma once
#include "weathermcp/tools/manager.hpp"
#include "weathermcp/tools/outcome.hpp"
#include "weathermcp/types.hpp"
#include "weathermcp/weather/nws_client.hpp"
#include "weathermcp/weather/params.hpp"

#include <memory>
#include <string>

namespace weathermcp::weather
{

/// Maximum number of forecast periods reported
constexpr std::size_t MAX_FORECAST_PERIODS = 4;

/// Five labelled lines (Event, Area, Severity, Description, Instructions)
/// for one feature of an alerts response.
std::string format_alert(const weathermcp::Json& feature);

/// "<name>: <short> (<temp>°<unit>) Wind <speed>" for one forecast period.
std::string format_period(const weathermcp::Json& period);

/// Active alerts for a two-letter state code; a code of any other length is
/// answered with guidance and no request is made.
tools::Outcome get_alerts(const NwsClient& nws, const AlertsParams& params);

/// Points lookup, then the forecast it links to. The second request is only
/// made when the first one yields a forecast URL.
tools::Outcome get_forecast(const NwsClient& nws, const ForecastParams& params);

/// Registers get_alerts and get_forecast. The tools share the client.
void register_weather_tools(tools::ToolManager& manager, std::shared_ptr<const NwsClient> nws);

} // namespace weathermcp::weather
