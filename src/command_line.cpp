#include "rangefetch/command_line.hpp"
#include "rangefetch/errors.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

namespace rangefetch {

namespace {

int parseThreadCount(const std::string& text) {
    int threads = 0;
    std::size_t consumed = 0;
    try {
        threads = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw CommandLineError("Invalid thread count: " + text);
    }
    if (consumed != text.size()) {
        throw CommandLineError("Invalid thread count: " + text);
    }
    if (threads <= 0 || threads > kMaxConcurrency) {
        throw CommandLineError(
            fmt::format("Thread count must be in [1, {}], got {}", kMaxConcurrency, threads));
    }
    return threads;
}

const char* requireValue(int argc, const char* const* argv, int index, const std::string& option) {
    if (index + 1 >= argc) {
        throw CommandLineError("Missing value for " + option);
    }
    return argv[index + 1];
}

} // namespace

std::uint64_t parseByteSize(const std::string& text) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
        throw CommandLineError("Invalid byte size: " + text);
    }

    std::size_t consumed = 0;
    std::uint64_t value = 0;
    try {
        value = std::stoull(text, &consumed);
    } catch (const std::exception&) {
        throw CommandLineError("Invalid byte size: " + text);
    }

    std::uint64_t multiplier = 1;
    if (consumed < text.size()) {
        if (consumed + 1 != text.size()) {
            throw CommandLineError("Invalid byte size: " + text);
        }
        switch (std::toupper(static_cast<unsigned char>(text[consumed]))) {
        case 'K':
            multiplier = 1024ULL;
            break;
        case 'M':
            multiplier = 1024ULL * 1024;
            break;
        case 'G':
            multiplier = 1024ULL * 1024 * 1024;
            break;
        default:
            throw CommandLineError("Invalid byte size suffix: " + text);
        }
    }

    if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        throw CommandLineError("Byte size out of range: " + text);
    }
    return value * multiplier;
}

CommandLine parseCommandLine(int argc, const char* const* argv) {
    CommandLine result;
    int arg_index = 1;

    while (arg_index < argc && argv[arg_index][0] == '-') {
        const std::string option = argv[arg_index];

        if (option == "-t") {
            result.options.concurrency = parseThreadCount(requireValue(argc, argv, arg_index, option));
            arg_index += 2;
        } else if (option == "-c") {
            result.options.chunk_size = parseByteSize(requireValue(argc, argv, arg_index, option));
            if (result.options.chunk_size == 0) {
                throw CommandLineError("Chunk size must be greater than zero");
            }
            arg_index += 2;
        } else if (option == "-v") {
            try {
                result.log_level = log::parseLevel(requireValue(argc, argv, arg_index, option));
            } catch (const std::invalid_argument& ex) {
                throw CommandLineError(ex.what());
            }
            arg_index += 2;
        } else if (option == "-f" || option == "--overwrite") {
            result.options.overwrite = true;
            ++arg_index;
        } else if (option == "-h" || option == "--help") {
            result.show_help = true;
            return result;
        } else {
            throw CommandLineError("Unknown option: " + option);
        }
    }

    if (argc - arg_index != 2) {
        throw CommandLineError("Expected exactly one <url> and one <file>");
    }

    result.options.url = argv[arg_index];
    result.options.destination = argv[arg_index + 1];
    return result;
}

std::string usage(const std::string& program_name) {
    return fmt::format(
        "Usage: {} [-t <threads>] [-c <chunk-bytes>] [-f] [-v <level>] <url> <file>\n"
        "Options:\n"
        "  -t <threads>       Number of download workers (default: {})\n"
        "  -c <chunk-bytes>   Bytes per range request, K/M/G suffixes allowed (default: 10M)\n"
        "  -f, --overwrite    Write over an existing destination file\n"
        "  -v <level>         Log level: trace, debug, info, warn, error (default: info)\n"
        "  -h, --help         Show this message\n",
        program_name, kDefaultConcurrency);
}

} // namespace rangefetch
