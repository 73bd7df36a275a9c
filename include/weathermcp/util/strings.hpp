#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace weathermcp::util
{

std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::string to_upper(std::string s);

/// Number of UTF-8 code points (continuation bytes are not counted)
std::size_t utf8_length(const std::string& s);

/// Whitespace-separated tokens
std::vector<std::string> split_ws(const std::string& s);

/// Parses a finite decimal number, surrounding whitespace allowed.
std::optional<double> parse_double(const std::string& s);

} // namespace weathermcp::util
