#include "weathermcp/exceptions.hpp"
#include "weathermcp/tools/manager.hpp"

#include <cassert>
#include <iostream>

int main()
{
    using namespace weathermcp;

    tools::ToolManager tm;
    tm.register_tool(tools::Tool{"echo",
                                 Json{{"type", "object"},
                                      {"properties", Json{{"text", Json{{"type", "string"}}}}},
                                      {"required", Json::array({"text"})}},
                                 [](const Json& in) { return in.at("text").get<std::string>(); },
                                 "Echo the input"});
    tm.register_tool(tools::Tool{"always", Json::object(),
                                 [](const Json&) { return std::string("same"); }});

    assert(tm.size() == 2);
    assert(tm.has("echo"));
    assert(!tm.has("missing"));
    assert(tm.invoke("echo", Json{{"text", "hi"}}) == "hi");
    assert(tm.get("echo").description().value() == "Echo the input");
    assert(!tm.get("always").description());

    // Listing order is stable (lexical)
    auto names = tm.list_names();
    assert(names.size() == 2);
    assert(names[0] == "always");
    assert(names[1] == "echo");

    bool threw = false;
    try
    {
        tm.invoke("missing", Json::object());
    }
    catch (const NotFoundError& e)
    {
        threw = std::string(e.what()) == "Unknown tool: missing";
    }
    assert(threw);

    // Duplicate and empty names are rejected at registration
    threw = false;
    try
    {
        tm.register_tool(tools::Tool{"echo", Json::object(),
                                     [](const Json&) { return std::string(); }});
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);

    threw = false;
    try
    {
        tm.register_tool(tools::Tool{"", Json::object(), [](const Json&) { return std::string(); }});
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);
    assert(tm.size() == 2);

    std::cout << "tool manager: all tests passed" << std::endl;
    return 0;
}
