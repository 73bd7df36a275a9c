#include "weathermcp/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace weathermcp::log
{

namespace
{
std::atomic<Level> g_level{Level::Info};
std::mutex g_mutex;
std::string g_name{"weathermcp"};

const char* level_name(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        break;
    }
    return "OFF";
}

std::string timestamp()
{
    using clock = std::chrono::system_clock;
    std::time_t t = clock::to_time_t(clock::now());
    std::tm tm;
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}
} // namespace

Level level_from_string(const std::string& s)
{
    std::string upper = s;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return Level::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return Level::Warning;
    if (upper == "ERROR" || upper == "CRITICAL")
        return Level::Error;
    if (upper == "OFF" || upper == "NONE")
        return Level::Off;
    return Level::Info;
}

void set_level(Level level)
{
    g_level = level;
}

Level level()
{
    return g_level.load();
}

void set_name(std::string name)
{
    std::lock_guard<std::mutex> lock(g_mutex);
    g_name = std::move(name);
}

void write(Level lvl, const std::string& message)
{
    if (lvl == Level::Off || lvl < g_level.load())
        return;
    // stderr only: stdout carries the protocol stream
    std::lock_guard<std::mutex> lock(g_mutex);
    std::cerr << timestamp() << " " << level_name(lvl) << " [" << g_name << "] " << message
              << std::endl;
}

} // namespace weathermcp::log
