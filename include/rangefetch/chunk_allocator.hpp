#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace rangefetch {

struct ChunkRange {
    std::uint64_t index{0};
    std::uint64_t start{0};
    // Inclusive. The last chunk may run past the end of the resource.
    std::uint64_t end{0};
    // Bytes of the resource actually covered by [start, end].
    std::uint64_t length{0};

    [[nodiscard]] std::uint64_t span() const noexcept { return end - start + 1; }

    // "bytes=<start>-<end>"
    [[nodiscard]] std::string rangeHeaderValue() const;

    friend bool operator==(const ChunkRange& lhs, const ChunkRange& rhs) noexcept {
        return lhs.index == rhs.index && lhs.start == rhs.start && lhs.end == rhs.end;
    }
    friend bool operator<(const ChunkRange& lhs, const ChunkRange& rhs) noexcept {
        return lhs.index < rhs.index;
    }
};

// Hands out disjoint, fixed-size byte ranges of a resource. next() may be
// called from any number of threads; every call consumes exactly one index.
class ChunkAllocator {
public:
    ChunkAllocator(std::uint64_t resource_size, std::uint64_t chunk_size);

    ChunkAllocator(const ChunkAllocator&) = delete;
    ChunkAllocator& operator=(const ChunkAllocator&) = delete;

    // std::nullopt once the resource is fully handed out. Issued ranges are
    // never handed out again.
    [[nodiscard]] std::optional<ChunkRange> next() noexcept;

    [[nodiscard]] std::uint64_t resourceSize() const noexcept { return resource_size_; }
    [[nodiscard]] std::uint64_t chunkSize() const noexcept { return chunk_size_; }
    [[nodiscard]] std::uint64_t chunkCount() const noexcept { return chunk_count_; }
    // Number of next() calls so far, including the exhausted ones.
    [[nodiscard]] std::uint64_t issued() const noexcept;

private:
    const std::uint64_t resource_size_;
    const std::uint64_t chunk_size_;
    const std::uint64_t chunk_count_;
    std::atomic<std::uint64_t> cursor_{0};
};

} // namespace rangefetch
