#include "rangefetch/chunk_allocator.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace rangefetch {

namespace {

std::uint64_t checkedChunkSize(std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be greater than zero");
    }
    return chunk_size;
}

} // namespace

std::string ChunkRange::rangeHeaderValue() const {
    return fmt::format("bytes={}-{}", start, end);
}

ChunkAllocator::ChunkAllocator(std::uint64_t resource_size, std::uint64_t chunk_size)
    : resource_size_(resource_size),
      chunk_size_(checkedChunkSize(chunk_size)),
      chunk_count_(resource_size / chunk_size_ + (resource_size % chunk_size_ != 0 ? 1 : 0)) {}

std::optional<ChunkRange> ChunkAllocator::next() noexcept {
    // Uniqueness only needs the read-modify-write to be atomic; no other
    // memory is published through the cursor.
    const std::uint64_t index = cursor_.fetch_add(1, std::memory_order_relaxed);

    // index >= chunk_count_ is start >= resource_size_ without the overflow.
    if (index >= chunk_count_) {
        return std::nullopt;
    }

    ChunkRange range;
    range.index = index;
    range.start = index * chunk_size_;
    range.end = range.start + chunk_size_ - 1;
    range.length = std::min(chunk_size_, resource_size_ - range.start);
    return range;
}

std::uint64_t ChunkAllocator::issued() const noexcept {
    return cursor_.load(std::memory_order_relaxed);
}

} // namespace rangefetch
