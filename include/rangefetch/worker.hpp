#pragma once

#include "chunk_allocator.hpp"
#include "destination_file.hpp"
#include "http_client.hpp"
#include "progress.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace rangefetch {

struct WorkerOutcome {
    std::size_t worker_id{0};
    std::uint64_t chunks_completed{0};
    std::uint64_t bytes_reported{0};
    bool failed{false};
    // The chunk that was claimed but never written. It is not retried.
    std::optional<ChunkRange> failed_chunk;
    std::string error;
};

// Claims chunks until the allocator runs dry or a chunk fails. A failure
// ends this worker only; the others keep draining the allocator.
class Worker {
public:
    Worker(std::size_t id,
           std::string url,
           ChunkAllocator& allocator,
           HttpClient& http,
           DestinationFile& file,
           CompletionChannel& completions);

    [[nodiscard]] WorkerOutcome run();

private:
    void fetchChunk(const ChunkRange& chunk);

    std::size_t id_;
    std::string url_;
    ChunkAllocator& allocator_;
    HttpClient& http_;
    DestinationFile& file_;
    CompletionChannel& completions_;
};

} // namespace rangefetch
