#include "rangefetch/options.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace rangefetch {

void DownloadOptions::validate() const {
    if (url.empty()) {
        throw std::invalid_argument("URL must not be empty");
    }
    if (destination.empty()) {
        throw std::invalid_argument("Destination path must not be empty");
    }
    if (concurrency < 1 || concurrency > kMaxConcurrency) {
        throw std::invalid_argument(
            fmt::format("Worker count must be in [1, {}], got {}", kMaxConcurrency, concurrency));
    }
    if (chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be greater than zero");
    }
    if (channel_capacity == 0) {
        throw std::invalid_argument("Progress channel capacity must be greater than zero");
    }
}

} // namespace rangefetch
