#include "rangefetch/progress.hpp"
#include "rangefetch/log.hpp"

#include <exception>

#include <fmt/format.h>

namespace rangefetch {

std::string ConsoleProgressReporter::formatLine(std::uint64_t downloaded_bytes, std::uint64_t total_bytes) {
    if (total_bytes == 0) {
        return fmt::format("[{:<30}]    N/A ({})", "", formatSize(downloaded_bytes));
    }

    const double ratio = static_cast<double>(downloaded_bytes) / static_cast<double>(total_bytes);
    constexpr int bar_width = 30;
    const int bar_pos = static_cast<int>(ratio * bar_width);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(bar_width) * 3);
    for (int i = 0; i < bar_width; ++i) {
        bar += (i < bar_pos) ? u8"█" : u8"░";
    }

    return fmt::format("[{}] {:>6.2f}% ({}/{})",
                       bar,
                       ratio * 100.0,
                       formatSize(downloaded_bytes),
                       formatSize(total_bytes));
}

std::string ConsoleProgressReporter::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

void ConsoleProgressReporter::onProgress(std::uint64_t downloaded_bytes, std::uint64_t total_bytes) {
    fmt::print(out_, "\r{}\033[K", formatLine(downloaded_bytes, total_bytes));
    std::fflush(out_);
}

void ConsoleProgressReporter::onComplete(std::uint64_t, std::uint64_t) {
    fmt::print(out_, "\nDownload complete\n");
    std::fflush(out_);
}

std::uint64_t ProgressAggregator::run() {
    std::uint64_t downloaded = 0;

    while (auto notice = notices_.receive()) {
        downloaded += notice->bytes;
        log::trace("chunk {} done by worker {}: {}/{} bytes",
                   notice->chunk_index, notice->worker_id, downloaded, total_bytes_);
        // A broken display must not stop the drain, or workers would block
        // on the full channel.
        try {
            reporter_.onProgress(downloaded, total_bytes_);
        } catch (const std::exception& ex) {
            log::warn("Progress display failed: {}", ex.what());
        }
    }

    try {
        reporter_.onComplete(downloaded, total_bytes_);
    } catch (const std::exception& ex) {
        log::warn("Progress display failed: {}", ex.what());
    }
    return downloaded;
}

} // namespace rangefetch
