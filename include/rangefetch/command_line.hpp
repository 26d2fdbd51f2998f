#pragma once

#include "log.hpp"
#include "options.hpp"

#include <cstdint>
#include <string>

namespace rangefetch {

struct CommandLine {
    DownloadOptions options;
    log::Level log_level{log::Level::Info};
    bool show_help{false};
};

// Throws CommandLineError on malformed or missing arguments.
[[nodiscard]] CommandLine parseCommandLine(int argc, const char* const* argv);

// "4096", "512K", "10M", "1G". Suffixes are binary multiples.
[[nodiscard]] std::uint64_t parseByteSize(const std::string& text);

[[nodiscard]] std::string usage(const std::string& program_name);

} // namespace rangefetch
