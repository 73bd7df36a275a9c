#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace weathermcp::util::json
{

using json = nlohmann::json;

inline json parse(const std::string& s)
{
    return json::parse(s);
}
inline std::string dump(const json& j)
{
    return j.dump();
}

/// String field of an object, or fallback when absent, null or not a string.
inline std::string string_or(const json& obj, const char* key, const std::string& fallback)
{
    if (!obj.is_object())
        return fallback;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return fallback;
    return it->get<std::string>();
}

} // namespace weathermcp::util::json
