#pragma once

#include <fmt/format.h>

#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace sta::log
{

enum class Level { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Off = 5 };

/**
 * @brief Sets the process-wide threshold. Messages below it are dropped.
 */
void set_level(Level level);

Level level();

const char* level_string(Level level);

/**
 * @brief Parses a level name ("trace", "debug", "info", "warn", "error", "off"), case-insensitive
 */
std::optional<Level> parse_level(std::string_view name);

void emit(Level level, const char* file, int line, const std::string& msg);

/**
 * @brief Reports a message that could not be formatted or written. Never throws.
 */
void emit_dropped(const char* file, int line, const char* reason) noexcept;

inline bool enabled(Level lvl)
{
    return lvl != Level::Off && lvl >= level();
}

// Safe to call from destructors and noexcept functions
template <typename... Args>
void write(Level lvl, const char* file, int line, fmt::format_string<Args...> fmt, Args&&... args) noexcept
{
    if (!enabled(lvl)) {
        return;
    }

    try {
        emit(lvl, file, line, fmt::format(fmt, std::forward<Args>(args)...));
    } catch (const std::exception& e) {
        emit_dropped(file, line, e.what());
    }
}

}  // namespace sta::log

#define STA_LOG(lvl, text, args...) \
    sta::log::write(lvl, __FILE__, __LINE__, FMT_STRING(text), ##args)

#define STA_LOG_TRACE(text, args...) STA_LOG(sta::log::Level::Trace, text, ##args)
#define STA_LOG_DEBUG(text, args...) STA_LOG(sta::log::Level::Debug, text, ##args)
#define STA_LOG_INFO(text, args...)  STA_LOG(sta::log::Level::Info, text, ##args)
#define STA_LOG_WARN(text, args...)  STA_LOG(sta::log::Level::Warn, text, ##args)
#define STA_LOG_ERROR(text, args...) STA_LOG(sta::log::Level::Error, text, ##args)
