#include "weathermcp/util/strings.hpp"

#include <cassert>
#include <iostream>

int main()
{
    using namespace weathermcp::util;

    assert(trim("  alerts CA \t") == "alerts CA");
    assert(trim("   ").empty());
    assert(to_lower("QuIt") == "quit");
    assert(to_upper("ca") == "CA");

    // Bytes outside ASCII pass through unchanged
    assert(to_upper("\xC3\xA9") == "\xC3\xA9");
    assert(to_lower("\xC3\x89X") == "\xC3\x89x");

    assert(utf8_length("") == 0);
    assert(utf8_length("CA") == 2);
    assert(utf8_length("\xC3\xA9") == 1);
    assert(utf8_length("\xC3\xA9\xC3\xA9") == 2);
    assert(utf8_length("\xE2\x82\xAC") == 1);

    auto tokens = split_ws(" forecast  37.78\t-122.42 ");
    assert(tokens.size() == 3);
    assert(tokens[0] == "forecast");
    assert(tokens[2] == "-122.42");

    assert(parse_double("37.78").value() == 37.78);
    assert(parse_double(" -122.42 ").value() == -122.42);
    assert(parse_double("1e2").value() == 100.0);
    assert(!parse_double(""));
    assert(!parse_double("abc"));
    assert(!parse_double("12abc"));
    assert(!parse_double("inf"));
    assert(!parse_double("nan"));

    std::cout << "util strings: all tests passed" << std::endl;
    return 0;
}
