#include "weathermcp/weather/nws_client.hpp"

#include "weathermcp/exceptions.hpp"
#include "weathermcp/util/log.hpp"
#include "weathermcp/util/url.hpp"

#include <httplib.h>

namespace weathermcp::weather
{

namespace
{
Fetched fetch_error(tools::ErrorKind kind, std::string detail)
{
    return Fetched(std::in_place_type<tools::ToolError>,
                   tools::ToolError{kind, std::move(detail), std::string()});
}
} // namespace

Fetched NwsClient::get_json(const std::string& url) const
{
    util::ParsedUrl parsed;
    try
    {
        parsed = util::parse_url(url);
    }
    catch (const weathermcp::ValidationError& e)
    {
        return fetch_error(tools::ErrorKind::Network, e.what());
    }

    const std::string origin =
        parsed.scheme + "://" + parsed.host + ":" + std::to_string(parsed.port);
    httplib::Client cli(origin);
    if (!cli.is_valid())
        return fetch_error(tools::ErrorKind::Network,
                           "cannot create HTTP client for " + origin +
                               (parsed.is_https() ? " (built without TLS support?)" : ""));

    cli.set_follow_location(true);
    cli.set_connection_timeout(settings_.http_timeout_seconds, 0);
    cli.set_read_timeout(settings_.http_timeout_seconds, 0);
    cli.set_write_timeout(settings_.http_timeout_seconds, 0);

    httplib::Headers headers = {{"User-Agent", settings_.user_agent},
                                {"Accept", "application/geo+json"}};

    log::debug("GET " + url);
    auto res = cli.Get(parsed.target, headers);
    if (!res)
        return fetch_error(tools::ErrorKind::Network,
                           "GET " + url + " failed: " + httplib::to_string(res.error()));

    if (res->status < 200 || res->status >= 300)
        return fetch_error(tools::ErrorKind::HttpStatus,
                           "GET " + url + " returned HTTP " + std::to_string(res->status));

    try
    {
        return Fetched(std::in_place_type<weathermcp::Json>, weathermcp::Json::parse(res->body));
    }
    catch (const weathermcp::Json::parse_error& e)
    {
        return fetch_error(tools::ErrorKind::Decode,
                           "GET " + url + " returned invalid JSON: " + e.what());
    }
}

} // namespace weathermcp::weather
