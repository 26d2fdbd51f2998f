#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace rangefetch {

inline constexpr int kDefaultConcurrency = 10;
inline constexpr int kMaxConcurrency = 256;
inline constexpr std::uint64_t kDefaultChunkSize = 10ULL * 1024 * 1024;
inline constexpr std::size_t kDefaultChannelCapacity = 1;

struct DownloadOptions {
    std::string url;
    std::string destination;
    int concurrency{kDefaultConcurrency};
    std::uint64_t chunk_size{kDefaultChunkSize};
    bool overwrite{false};
    std::size_t channel_capacity{kDefaultChannelCapacity};

    // Throws std::invalid_argument describing the first bad field.
    void validate() const;
};

} // namespace rangefetch
