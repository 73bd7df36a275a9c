#pragma once
#include "weathermcp/tools/outcome.hpp"
#include "weathermcp/types.hpp"

#include <string>
#include <variant>

namespace weathermcp::weather
{

/// Arguments of get_alerts
struct AlertsParams
{
    std::string state;
};

/// Arguments of get_forecast
struct ForecastParams
{
    double latitude;
    double longitude;
};

/// Decodes {"state": <string>}.
/// @throws ValidationError for a non-object, a missing or non-string state,
///         or any field other than "state"
AlertsParams decode_alerts_params(const weathermcp::Json& args);

/// Decodes {"latitude": ..., "longitude": ...}. Each coordinate may be a JSON
/// number or a string holding one.
/// @throws ValidationError for a non-object, missing or unknown fields, or a
///         coordinate that is neither number nor string
/// @return InvalidInput error when a coordinate string is not a finite number
std::variant<ForecastParams, tools::ToolError> decode_forecast_params(const weathermcp::Json& args);

weathermcp::Json alerts_input_schema();
weathermcp::Json forecast_input_schema();

} // namespace weathermcp::weather
