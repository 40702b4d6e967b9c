#include <lumen/core/log.h>
#include <iostream>
#include <chrono>
#include <cstdio>
#include <mutex>

namespace lumen
{
namespace Log
{

static std::vector<LogEntry> s_entries;
static std::mutex s_mutex;
static const auto s_startTime = std::chrono::steady_clock::now();

static double elapsed()
{
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - s_startTime).count();
}

static void write(Level level, const char* tag, std::ostream& out, std::string_view msg)
{
    double ts = elapsed();
    char tsBuf[16];
    std::snprintf(tsBuf, sizeof(tsBuf), "[%7.3fs]", ts);

    std::lock_guard<std::mutex> lock(s_mutex);
    out << tsBuf << " " << tag << " " << msg << "\n";
    s_entries.push_back({ level, ts, std::string(msg) });
}

void info(std::string_view msg)
{
    write(Level::Info, "[LUMEN INFO]", std::cout, msg);
}

void warn(std::string_view msg)
{
    write(Level::Warn, "[LUMEN WARN]", std::cerr, msg);
}

void error(std::string_view msg)
{
    write(Level::Error, "[LUMEN ERROR]", std::cerr, msg);
}

std::vector<LogEntry> getEntries()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_entries;
}

void clear()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_entries.clear();
}

} // namespace Log
} // namespace lumen
