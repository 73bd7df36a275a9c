#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace weathermcp
{

using Json = nlohmann::json;

/// Protocol revision spoken by both sides of the stdio session.
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

/// Revisions the server accepts from a client's initialize request.
inline bool is_known_protocol_version(const std::string& v)
{
    return v == "2024-11-05" || v == "2025-03-26" || v == "2025-06-18";
}

} // namespace weathermcp
