#pragma once
#include <string>

namespace weathermcp::util
{

struct ParsedUrl
{
    std::string scheme; // "http" or "https"
    std::string host;
    int port;
    std::string target; // path plus query, always starts with '/'

    bool is_https() const
    {
        return scheme == "https";
    }
};

/// Splits an absolute http(s) URL. Throws ValidationError for other schemes,
/// a missing host or a malformed port.
ParsedUrl parse_url(const std::string& url);

} // namespace weathermcp::util
