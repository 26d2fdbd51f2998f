#include "rangefetch/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <stdexcept>
#include <string>

#include <fmt/chrono.h>

namespace rangefetch::log {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_write_mutex;

std::string currentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()) % 1000;
    const std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    if (::localtime_r(&time, &local) == nullptr) {
        return fmt::format("{}.{:03}", time, ms.count());
    }
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03}", local, ms.count());
}

} // namespace

void setLevel(Level level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

Level level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

bool enabled(Level level) noexcept {
    return level != Level::Off && level >= g_level.load(std::memory_order_relaxed);
}

Level parseLevel(std::string_view name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info")  return Level::Info;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "off")   return Level::Off;
    throw std::invalid_argument(fmt::format("Unknown log level: {}", name));
}

const char* levelName(Level level) noexcept {
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
    default:
        return "UNKNOWN";
    }
}

void write(Level level, std::string_view message) {
    const std::string line = fmt::format("{} [{}] {}\n", currentTimestamp(), levelName(level), message);

    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::fwrite(line.data(), 1, line.size(), stderr);
    std::fflush(stderr);
}

} // namespace rangefetch::log
