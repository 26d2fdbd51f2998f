#include "rangefetch/worker.hpp"
#include "rangefetch/errors.hpp"
#include "rangefetch/log.hpp"

#include <exception>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace rangefetch {

Worker::Worker(std::size_t id,
               std::string url,
               ChunkAllocator& allocator,
               HttpClient& http,
               DestinationFile& file,
               CompletionChannel& completions)
    : id_(id),
      url_(std::move(url)),
      allocator_(allocator),
      http_(http),
      file_(file),
      completions_(completions) {}

WorkerOutcome Worker::run() {
    WorkerOutcome outcome;
    outcome.worker_id = id_;

    while (auto chunk = allocator_.next()) {
        log::debug("worker {}: chunk {} [{}-{}]", id_, chunk->index, chunk->start, chunk->end);

        try {
            fetchChunk(*chunk);
        } catch (const std::exception& ex) {
            log::error("worker {}: chunk {} [{}-{}] failed: {}",
                       id_, chunk->index, chunk->start, chunk->end, ex.what());
            outcome.failed = true;
            outcome.failed_chunk = *chunk;
            outcome.error = ex.what();
            return outcome;
        }

        // Reports the chunk's nominal length, not the number of bytes the
        // transfer actually delivered.
        const CompletionNotice notice{id_, chunk->index, chunk->length};
        if (!completions_.send(notice)) {
            log::warn("worker {}: progress channel closed, chunk {} not reported", id_, chunk->index);
        }

        ++outcome.chunks_completed;
        outcome.bytes_reported += notice.bytes;
    }

    log::debug("worker {}: no chunks left after {} completed", id_, outcome.chunks_completed);
    return outcome;
}

void Worker::fetchChunk(const ChunkRange& chunk) {
    OffsetWriter writer{file_, chunk.start};
    std::error_code write_error;

    const BodySink sink = [&writer, &write_error](const char* data, std::size_t size) {
        write_error = writer.write(data, size);
        return !write_error;
    };

    try {
        http_.fetchRange(url_, chunk.rangeHeaderValue(), sink);
    } catch (const HttpError&) {
        if (write_error) {
            throw DownloadError(fmt::format("Writing {} at offset {} failed: {}",
                                            file_.path(), chunk.start + writer.written(), write_error.message()));
        }
        throw;
    }
}

} // namespace rangefetch
