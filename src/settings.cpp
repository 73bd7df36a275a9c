#include "weathermcp/settings.hpp"

#include "weathermcp/util/json.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace weathermcp
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static int parse_positive_or(const std::string& s, int defv)
{
    try
    {
        size_t pos = 0;
        int v = std::stoi(s, &pos, 10);
        if (pos != s.size() || v < 0)
            return defv;
        return v;
    }
    catch (const std::exception&)
    {
        return defv;
    }
}

static std::string level_name(std::string lvl)
{
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return lvl;
}

static std::string strip_trailing_slashes(std::string url)
{
    while (!url.empty() && url.back() == '/')
        url.pop_back();
    return url;
}

/// Integer field of a JSON object; anything but a non-negative integer keeps the default
static int non_negative_or(const Json& j, const char* key, int defv)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer())
        return defv;
    auto v = it->get<long long>();
    if (v < 0 || v > std::numeric_limits<int>::max())
        return defv;
    return static_cast<int>(v);
}

Settings Settings::from_env()
{
    Settings s;
    s.log_level = level_name(getenv_str("WEATHERMCP_LOG_LEVEL", s.log_level));
    s.api_base = getenv_str("WEATHERMCP_API_BASE", s.api_base);
    s.api_base = strip_trailing_slashes(s.api_base);
    s.user_agent = getenv_str("WEATHERMCP_USER_AGENT", s.user_agent);
    s.http_timeout_seconds = parse_positive_or(getenv_str("WEATHERMCP_HTTP_TIMEOUT", ""),
                                               s.http_timeout_seconds);
    s.request_timeout_ms = parse_positive_or(getenv_str("WEATHERMCP_REQUEST_TIMEOUT_MS", ""),
                                             s.request_timeout_ms);
    auto log_file = getenv_str("WEATHERMCP_SERVER_LOG", "");
    if (!log_file.empty())
        s.server_log_file = log_file;
    return s;
}

Settings Settings::from_json(const Json& j)
{
    using util::json::string_or;

    Settings s;
    if (!j.is_object())
        return s;
    s.log_level = level_name(string_or(j, "log_level", s.log_level));
    s.api_base = strip_trailing_slashes(string_or(j, "api_base", s.api_base));
    s.user_agent = string_or(j, "user_agent", s.user_agent);
    s.http_timeout_seconds = non_negative_or(j, "http_timeout_seconds", s.http_timeout_seconds);
    s.request_timeout_ms = non_negative_or(j, "request_timeout_ms", s.request_timeout_ms);
    if (j.contains("server_log_file") && j["server_log_file"].is_string())
        s.server_log_file = j["server_log_file"].get<std::string>();
    return s;
}

} // namespace weathermcp
