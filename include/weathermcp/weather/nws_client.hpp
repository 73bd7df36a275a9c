#pragma once
#include "weathermcp/settings.hpp"
#include "weathermcp/tools/outcome.hpp"
#include "weathermcp/types.hpp"

#include <string>
#include <variant>

namespace weathermcp::weather
{

/// Decoded JSON body, or why there is none. Errors carry kind and detail;
/// their user-facing message is left for the calling tool to fill in.
using Fetched = std::variant<weathermcp::Json, tools::ToolError>;

/// GET client for the National Weather Service API (api.weather.gov).
///
/// Every call builds its own HTTP connection, sends the identifying
/// User-Agent plus "Accept: application/geo+json", follows redirects, and
/// gives up after the configured timeout. The connection is released before
/// get_json() returns, whatever the outcome.
class NwsClient
{
  public:
    explicit NwsClient(weathermcp::Settings settings) : settings_(std::move(settings)) {}

    /// Absolute URL for an API path such as "/points/1.0,2.0"
    std::string api_url(const std::string& path) const
    {
        return settings_.api_base + path;
    }

    Fetched get_json(const std::string& url) const;

    const weathermcp::Settings& settings() const
    {
        return settings_;
    }

  private:
    weathermcp::Settings settings_;
};

} // namespace weathermcp::weather
