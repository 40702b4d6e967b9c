#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace lumen
{
namespace Log
{

enum class Level { Info, Warn, Error };

struct LogEntry
{
    Level level;
    double timestamp; // seconds since startup
    std::string message;
};

// Safe to call from render workers.
void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

// Returns a snapshot of everything logged since the last clear().
std::vector<LogEntry> getEntries();
void clear();

} // namespace Log
} // namespace lumen
