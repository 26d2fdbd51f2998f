#pragma once

#include "http_client.hpp"
#include "options.hpp"
#include "progress.hpp"
#include "worker.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace rangefetch {

struct DownloadSummary {
    // False when the destination check refused the run; nothing was fetched.
    bool started{false};
    std::uint64_t total_bytes{0};
    // Sum of completion notices as seen by the progress aggregator.
    std::uint64_t reported_bytes{0};
    std::vector<WorkerOutcome> outcomes;

    [[nodiscard]] std::size_t failedWorkers() const noexcept;
};

// Downloads one resource with a pool of range-fetching workers.
//
// run() resolves the size, opens the destination, starts the progress
// aggregator and the workers, and returns once every worker has exhausted
// the allocator or failed. A failed worker is logged and recorded in the
// summary; its chunk stays unwritten.
class RangeDownloader {
public:
    RangeDownloader(DownloadOptions options, HttpClient& http, ProgressReporter& reporter);
    ~RangeDownloader();

    RangeDownloader(const RangeDownloader&) = delete;
    RangeDownloader& operator=(const RangeDownloader&) = delete;

    // Throws DownloadError if the size cannot be resolved or the destination
    // cannot be opened, and std::invalid_argument for bad options.
    [[nodiscard]] DownloadSummary run();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rangefetch
