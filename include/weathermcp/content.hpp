#pragma once
#include "weathermcp/types.hpp"

#include <string>

namespace weathermcp
{

struct TextContent
{
    std::string type{"text"};
    std::string text;
};

inline void to_json(Json& j, const TextContent& c)
{
    j = Json{{"type", c.type}, {"text", c.text}};
}

inline void from_json(const Json& j, TextContent& c)
{
    c.type = j.value("type", "text");
    c.text = j.at("text").get<std::string>();
}

} // namespace weathermcp
