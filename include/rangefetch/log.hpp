#pragma once

#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace rangefetch::log {

enum class Level { Trace, Debug, Info, Warn, Error, Off };

void setLevel(Level level) noexcept;
[[nodiscard]] Level level() noexcept;
[[nodiscard]] bool enabled(Level level) noexcept;

// Accepts "trace", "debug", "info", "warn", "error" and "off".
[[nodiscard]] Level parseLevel(std::string_view name);
[[nodiscard]] const char* levelName(Level level) noexcept;

// Writes one timestamped line to stderr. Safe to call from any thread.
void write(Level level, std::string_view message);

template <typename... Args>
void trace(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Trace)) {
        write(Level::Trace, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Debug)) {
        write(Level::Debug, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Info)) {
        write(Level::Info, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Warn)) {
        write(Level::Warn, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Error)) {
        write(Level::Error, fmt::format(format, std::forward<Args>(args)...));
    }
}

} // namespace rangefetch::log
