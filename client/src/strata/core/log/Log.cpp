#include "strata/core/log/Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstring>

namespace sta::log
{

namespace
{
std::atomic<Level> g_level {Level::Info};

// Keeps only the file name of __FILE__
const char* basename(const char* path)
{
    const char* slash = std::strrchr(path, '/');
    return slash != nullptr ? slash + 1 : path;
}
}  // namespace

void set_level(Level level)
{
    g_level.store(level, std::memory_order_relaxed);
}

Level level()
{
    return g_level.load(std::memory_order_relaxed);
}

const char* level_string(Level level)
{
    switch (level) {
        case Level::Trace:
            return "TRACE";
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
        case Level::Off:
            return "OFF";
    }
    return "";
}

std::optional<Level> parse_level(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") {
        return Level::Trace;
    } else if (lower == "debug") {
        return Level::Debug;
    } else if (lower == "info") {
        return Level::Info;
    } else if (lower == "warn" || lower == "warning") {
        return Level::Warn;
    } else if (lower == "error") {
        return Level::Error;
    } else if (lower == "off") {
        return Level::Off;
    }
    return std::nullopt;
}

void emit(Level level, const char* file, int line, const std::string& msg)
{
    fmt::print(stderr, "[{}] {}:{} - {}\n", level_string(level), basename(file), line, msg);
}

void emit_dropped(const char* file, int line, const char* reason) noexcept
{
    std::fprintf(stderr, "[LOG] %s:%d - message dropped: %s\n", basename(file), line, reason);
}

}  // namespace sta::log
