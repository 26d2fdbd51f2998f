#pragma once

#include "bounded_channel.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

namespace rangefetch {

// Sent by a worker after one chunk has been written in full.
struct CompletionNotice {
    std::size_t worker_id{0};
    std::uint64_t chunk_index{0};
    std::uint64_t bytes{0};
};

using CompletionChannel = BoundedChannel<CompletionNotice>;

class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    virtual void onProgress(std::uint64_t downloaded_bytes, std::uint64_t total_bytes) = 0;
    virtual void onComplete(std::uint64_t downloaded_bytes, std::uint64_t total_bytes) = 0;
};

// Single-line terminal display, redrawn in place after every notice.
class ConsoleProgressReporter final : public ProgressReporter {
public:
    explicit ConsoleProgressReporter(std::FILE* out = stdout) noexcept : out_(out) {}

    void onProgress(std::uint64_t downloaded_bytes, std::uint64_t total_bytes) override;
    void onComplete(std::uint64_t downloaded_bytes, std::uint64_t total_bytes) override;

    [[nodiscard]] static std::string formatLine(std::uint64_t downloaded_bytes, std::uint64_t total_bytes);
    [[nodiscard]] static std::string formatSize(std::uint64_t bytes);

private:
    std::FILE* out_;
};

// Drains completion notices until the channel is closed, keeping a running
// byte total. Reaching the total is not required for run() to return.
class ProgressAggregator {
public:
    ProgressAggregator(std::uint64_t total_bytes, CompletionChannel& notices, ProgressReporter& reporter) noexcept
        : total_bytes_(total_bytes), notices_(notices), reporter_(reporter) {}

    // Returns the sum of all reported bytes.
    [[nodiscard]] std::uint64_t run();

private:
    std::uint64_t total_bytes_;
    CompletionChannel& notices_;
    ProgressReporter& reporter_;
};

} // namespace rangefetch
