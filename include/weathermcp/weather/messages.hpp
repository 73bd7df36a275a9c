#pragma once

/// User-facing texts returned by the weather tools.
namespace weathermcp::weather::messages
{

constexpr const char* STATE_GUIDANCE =
    "Please provide a 2-letter US state/territory code (e.g., CA, NY).";
constexpr const char* ALERTS_UNAVAILABLE = "Unable to fetch alerts or invalid response.";
constexpr const char* NO_ACTIVE_ALERTS = "No active alerts for this state.";
constexpr const char* INVALID_COORDINATES = "Invalid latitude/longitude.";
constexpr const char* GRID_UNRESOLVED = "Unable to resolve grid forecast URL for this location.";
constexpr const char* PERIODS_UNAVAILABLE = "Unable to fetch forecast periods.";

/// Separates alert blocks
constexpr const char* ALERT_SEPARATOR = "\n\n---\n\n";

} // namespace weathermcp::weather::messages
