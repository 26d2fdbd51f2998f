#include "rangefetch/range_downloader.hpp"
#include "rangefetch/chunk_allocator.hpp"
#include "rangefetch/destination_file.hpp"
#include "rangefetch/errors.hpp"
#include "rangefetch/log.hpp"

#include <algorithm>
#include <exception>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace rangefetch {

std::size_t DownloadSummary::failedWorkers() const noexcept {
    return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                                  [](const WorkerOutcome& o) { return o.failed; }));
}

class RangeDownloader::Impl {
public:
    Impl(DownloadOptions options, HttpClient& http, ProgressReporter& reporter)
        : options_(std::move(options)), http_(http), reporter_(reporter) {}

    DownloadSummary run() {
        options_.validate();

        DownloadSummary summary;
        if (!mayWriteDestination(options_.destination, options_.overwrite)) {
            return summary;
        }

        summary.total_bytes = resolveSize();
        log::info("{}: {} bytes, {} workers, {} byte chunks",
                  options_.url, summary.total_bytes, options_.concurrency, options_.chunk_size);

        DestinationFile file{options_.destination};
        ChunkAllocator allocator{summary.total_bytes, options_.chunk_size};
        CompletionChannel completions{options_.channel_capacity};
        ProgressAggregator aggregator{summary.total_bytes, completions, reporter_};

        summary.started = true;
        summary.outcomes.resize(static_cast<std::size_t>(options_.concurrency));

        std::thread collector([&aggregator, &summary] { summary.reported_bytes = aggregator.run(); });

        std::vector<std::thread> workers;
        try {
            workers.reserve(summary.outcomes.size());
            for (std::size_t i = 0; i < summary.outcomes.size(); ++i) {
                workers.emplace_back([&, i] {
                    summary.outcomes[i] = runWorker(i, allocator, file, completions);
                });
            }
        } catch (...) {
            // Reserving or spawning failed: let the started threads finish so
            // no joinable thread is destroyed, then report the failure.
            joinAll(workers);
            completions.close();
            collector.join();
            throw;
        }

        joinAll(workers);
        completions.close();
        collector.join();

        for (const auto& outcome : summary.outcomes) {
            if (outcome.failed && outcome.failed_chunk) {
                log::warn("worker {} stopped after {} chunks; bytes {}-{} were not downloaded",
                          outcome.worker_id, outcome.chunks_completed,
                          outcome.failed_chunk->start, outcome.failed_chunk->end);
            }
        }
        log::info("{}: reported {}/{} bytes, {} of {} workers failed",
                  options_.destination, summary.reported_bytes, summary.total_bytes,
                  summary.failedWorkers(), summary.outcomes.size());
        return summary;
    }

private:
    std::uint64_t resolveSize() {
        try {
            return http_.fetchContentLength(options_.url);
        } catch (const HttpError& ex) {
            throw DownloadError(fmt::format("Cannot determine size of {}: {}", options_.url, ex.what()));
        }
    }

    WorkerOutcome runWorker(std::size_t id, ChunkAllocator& allocator, DestinationFile& file,
                            CompletionChannel& completions) {
        try {
            Worker worker{id, options_.url, allocator, http_, file, completions};
            return worker.run();
        } catch (const std::exception& ex) {
            log::error("worker {}: {}", id, ex.what());
            WorkerOutcome outcome;
            outcome.worker_id = id;
            outcome.failed = true;
            outcome.error = ex.what();
            return outcome;
        }
    }

    static void joinAll(std::vector<std::thread>& threads) {
        for (auto& thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        threads.clear();
    }

    DownloadOptions options_;
    HttpClient& http_;
    ProgressReporter& reporter_;
};

RangeDownloader::RangeDownloader(DownloadOptions options, HttpClient& http, ProgressReporter& reporter)
    : impl_(std::make_unique<Impl>(std::move(options), http, reporter)) {}

RangeDownloader::~RangeDownloader() = default;

DownloadSummary RangeDownloader::run() { return impl_->run(); }

} // namespace rangefetch
