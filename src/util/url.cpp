#include "weathermcp/util/url.hpp"

#include "weathermcp/exceptions.hpp"
#include "weathermcp/util/strings.hpp"

#include <algorithm>
#include <cctype>

namespace weathermcp::util
{

ParsedUrl parse_url(const std::string& url)
{
    ParsedUrl result;

    auto scheme_pos = url.find("://");
    if (scheme_pos == std::string::npos)
        throw weathermcp::ValidationError("URL has no scheme: " + url);

    result.scheme = to_lower(url.substr(0, scheme_pos));
    if (result.scheme != "http" && result.scheme != "https")
        throw weathermcp::ValidationError("Unsupported URL scheme: " + result.scheme +
                                          " (only http and https are allowed)");

    std::string rest = url.substr(scheme_pos + 3);
    auto path_pos = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, path_pos);
    result.target = path_pos == std::string::npos ? "/" : rest.substr(path_pos);
    auto frag = result.target.find('#');
    if (frag != std::string::npos)
        result.target.erase(frag);
    if (result.target.empty() || result.target.front() != '/')
        result.target.insert(result.target.begin(), '/');

    auto at = authority.rfind('@');
    if (at != std::string::npos)
        authority = authority.substr(at + 1);

    auto colon_pos = authority.rfind(':');
    if (colon_pos != std::string::npos && authority.find(']') == std::string::npos)
    {
        std::string port_str = authority.substr(colon_pos + 1);
        result.host = authority.substr(0, colon_pos);
        if (port_str.empty() ||
            !std::all_of(port_str.begin(), port_str.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; }) ||
            port_str.size() > 5)
            throw weathermcp::ValidationError("Invalid port in URL: " + url);
        result.port = std::stoi(port_str);
        if (result.port <= 0 || result.port > 65535)
            throw weathermcp::ValidationError("Invalid port in URL: " + url);
    }
    else
    {
        result.host = authority;
        result.port = result.is_https() ? 443 : 80;
    }

    if (result.host.empty())
        throw weathermcp::ValidationError("URL has no host: " + url);

    return result;
}

} // namespace weathermcp::util
