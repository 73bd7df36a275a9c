#include "weathermcp/util/json.hpp"
#include "weathermcp/util/strings.hpp"
#include "weathermcp/weather/messages.hpp"
#include "weathermcp/weather/weather_tools.hpp"

#include <sstream>

namespace weathermcp::weather
{

std::string format_alert(const weathermcp::Json& feature)
{
    using weathermcp::util::json::string_or;

    const weathermcp::Json empty = weathermcp::Json::object();
    const auto& props = feature.is_object() && feature.contains("properties") &&
                                feature["properties"].is_object()
                            ? feature["properties"]
                            : empty;

    std::ostringstream out;
    out << "Event: " << string_or(props, "event", "Unknown") << "\n"
        << "Area: " << string_or(props, "areaDesc", "Unknown") << "\n"
        << "Severity: " << string_or(props, "severity", "Unknown") << "\n"
        << "Description: " << string_or(props, "description", "No description available") << "\n"
        << "Instructions: "
        << string_or(props, "instruction", "No specific instructions provided");
    return out.str();
}

tools::Outcome get_alerts(const NwsClient& nws, const AlertsParams& params)
{
    if (util::utf8_length(params.state) != 2)
        return tools::ToolError{tools::ErrorKind::InvalidInput,
                                "state code '" + params.state + "' is not 2 characters",
                                messages::STATE_GUIDANCE};

    auto fetched = nws.get_json(nws.api_url("/alerts/active/area/" + util::to_upper(params.state)));
    if (auto* err = std::get_if<tools::ToolError>(&fetched))
    {
        err->message = messages::ALERTS_UNAVAILABLE;
        return *err;
    }

    const auto& data = std::get<weathermcp::Json>(fetched);
    if (!data.is_object() || !data.contains("features") || !data["features"].is_array())
        return tools::ToolError{tools::ErrorKind::MissingField,
                                "alerts response has no 'features' array",
                                messages::ALERTS_UNAVAILABLE};

    const auto& features = data["features"];
    if (features.empty())
        return std::string(messages::NO_ACTIVE_ALERTS);

    std::string joined;
    for (const auto& feature : features)
    {
        if (!joined.empty())
            joined += messages::ALERT_SEPARATOR;
        joined += format_alert(feature);
    }
    return joined;
}

} // namespace weathermcp::weather
