#include "weathermcp/weather/params.hpp"

#include "weathermcp/exceptions.hpp"
#include "weathermcp/util/strings.hpp"
#include "weathermcp/weather/messages.hpp"

#include <cmath>
#include <initializer_list>
#include <optional>

namespace weathermcp::weather
{

namespace
{

void require_fields(const weathermcp::Json& args, std::initializer_list<const char*> fields)
{
    if (!args.is_object())
        throw weathermcp::ValidationError("arguments must be an object, got " +
                                          std::string(args.type_name()));

    for (const auto& [key, value] : args.items())
    {
        (void)value;
        bool known = false;
        for (const char* f : fields)
            if (key == f)
                known = true;
        if (!known)
            throw weathermcp::ValidationError("unexpected argument '" + key + "'");
    }
    for (const char* f : fields)
        if (!args.contains(f))
            throw weathermcp::ValidationError(std::string("missing required argument '") + f +
                                              "'");
}

/// Empty when the value is a string that is not a number
std::optional<double> coerce_coordinate(const weathermcp::Json& value, const char* name)
{
    if (value.is_number())
    {
        double v = value.get<double>();
        if (!std::isfinite(v))
            return std::nullopt;
        return v;
    }
    if (value.is_string())
        return util::parse_double(value.get<std::string>());
    throw weathermcp::ValidationError(std::string("argument '") + name +
                                      "' must be a number, got " + value.type_name());
}

} // namespace

AlertsParams decode_alerts_params(const weathermcp::Json& args)
{
    require_fields(args, {"state"});
    const auto& state = args.at("state");
    if (!state.is_string())
        throw weathermcp::ValidationError(std::string("argument 'state' must be a string, got ") +
                                          state.type_name());
    return AlertsParams{state.get<std::string>()};
}

std::variant<ForecastParams, tools::ToolError> decode_forecast_params(const weathermcp::Json& args)
{
    require_fields(args, {"latitude", "longitude"});
    auto lat = coerce_coordinate(args.at("latitude"), "latitude");
    auto lon = coerce_coordinate(args.at("longitude"), "longitude");
    if (!lat || !lon)
        return tools::ToolError{tools::ErrorKind::InvalidInput,
                                "latitude=" + args.at("latitude").dump() +
                                    " longitude=" + args.at("longitude").dump(),
                                messages::INVALID_COORDINATES};
    return ForecastParams{*lat, *lon};
}

weathermcp::Json alerts_input_schema()
{
    return weathermcp::Json{
        {"type", "object"},
        {"properties",
         weathermcp::Json{{"state", weathermcp::Json{{"type", "string"},
                                                     {"title", "State"},
                                                     {"description",
                                                      "Two-letter US state or territory code "
                                                      "(e.g. CA, NY)"}}}}},
        {"required", weathermcp::Json::array({"state"})},
        {"additionalProperties", false}};
}

weathermcp::Json forecast_input_schema()
{
    return weathermcp::Json{
        {"type", "object"},
        {"properties",
         weathermcp::Json{
             {"latitude", weathermcp::Json{{"type", "number"}, {"title", "Latitude"}}},
             {"longitude", weathermcp::Json{{"type", "number"}, {"title", "Longitude"}}}}},
        {"required", weathermcp::Json::array({"latitude", "longitude"})},
        {"additionalProperties", false}};
}

} // namespace weathermcp::weather
