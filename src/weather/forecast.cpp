#include "weathermcp/util/json.hpp"
#include "weathermcp/weather/messages.hpp"
#include "weathermcp/weather/weather_tools.hpp"

#include <algorithm>

namespace weathermcp::weather
{

namespace
{

/// Shortest text that reads back as the same double ("37.78", "1.0")
std::string coordinate_text(double v)
{
    return weathermcp::Json(v).dump();
}

/// Scalar field as text: strings verbatim, numbers in JSON form
std::string scalar_or(const weathermcp::Json& obj, const char* key, const std::string& fallback)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return fallback;
    if (it->is_string())
        return it->get<std::string>();
    if (it->is_number())
        return it->dump();
    return fallback;
}

} // namespace

std::string format_period(const weathermcp::Json& period)
{
    using weathermcp::util::json::string_or;

    if (!period.is_object())
        return "Period: n/a (n/a°) Wind ";

    return string_or(period, "name", "Period") + ": " +
           string_or(period, "shortForecast", "n/a") + " (" +
           scalar_or(period, "temperature", "n/a") + "°" +
           string_or(period, "temperatureUnit", "") + ") Wind " +
           string_or(period, "windSpeed", "");
}

tools::Outcome get_forecast(const NwsClient& nws, const ForecastParams& params)
{
    // Step 1: resolve the gridpoint forecast URL
    auto points = nws.get_json(nws.api_url("/points/" + coordinate_text(params.latitude) + "," +
                                           coordinate_text(params.longitude)));
    if (auto* err = std::get_if<tools::ToolError>(&points))
    {
        err->message = messages::GRID_UNRESOLVED;
        return *err;
    }

    const auto& pdata = std::get<weathermcp::Json>(points);
    if (!pdata.is_object() || !pdata.contains("properties") ||
        !pdata["properties"].is_object() || !pdata["properties"].contains("forecast") ||
        !pdata["properties"]["forecast"].is_string())
        return tools::ToolError{tools::ErrorKind::MissingField,
                                "points response has no 'properties.forecast' URL",
                                messages::GRID_UNRESOLVED};

    const std::string forecast_url = pdata["properties"]["forecast"].get<std::string>();

    // Step 2: fetch the periods
    auto forecast = nws.get_json(forecast_url);
    if (auto* err = std::get_if<tools::ToolError>(&forecast))
    {
        err->message = messages::PERIODS_UNAVAILABLE;
        return *err;
    }

    const auto& fdata = std::get<weathermcp::Json>(forecast);
    if (!fdata.is_object() || !fdata.contains("properties") ||
        !fdata["properties"].is_object() || !fdata["properties"].contains("periods") ||
        !fdata["properties"]["periods"].is_array())
        return tools::ToolError{tools::ErrorKind::MissingField,
                                "forecast response has no 'properties.periods' array",
                                messages::PERIODS_UNAVAILABLE};

    const auto& periods = fdata["properties"]["periods"];
    const std::size_t count = std::min(periods.size(), MAX_FORECAST_PERIODS);

    std::string text;
    for (std::size_t i = 0; i < count; ++i)
    {
        if (i > 0)
            text += "\n";
        text += format_period(periods[i]);
    }
    return text;
}

} // namespace weathermcp::weather
