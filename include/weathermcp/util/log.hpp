#pragma once
#include <string>

namespace weathermcp::log
{

enum class Level
{
    Debug,
    Info,
    Warning,
    Error,
    Off
};

Level level_from_string(const std::string& s);

/// Sets the process-wide threshold; messages below it are dropped.
void set_level(Level level);
Level level();

/// Prefix printed before every line, e.g. "weather-server".
void set_name(std::string name);

void write(Level level, const std::string& message);

inline void debug(const std::string& message)
{
    write(Level::Debug, message);
}
inline void info(const std::string& message)
{
    write(Level::Info, message);
}
inline void warning(const std::string& message)
{
    write(Level::Warning, message);
}
inline void error(const std::string& message)
{
    write(Level::Error, message);
}

} // namespace weathermcp::log
