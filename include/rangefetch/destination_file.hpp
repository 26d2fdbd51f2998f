#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

namespace rangefetch {

// Write-only handle to the download target. writeAt() is positional and does
// not touch a shared file offset, so threads writing disjoint regions need no
// locking.
class DestinationFile {
public:
    // Opens for writing, creating the file if absent. Existing contents are
    // kept; the file is neither truncated nor pre-sized. Throws DownloadError.
    explicit DestinationFile(std::string path);
    ~DestinationFile();

    DestinationFile(const DestinationFile&) = delete;
    DestinationFile& operator=(const DestinationFile&) = delete;
    DestinationFile(DestinationFile&& other) noexcept;
    DestinationFile& operator=(DestinationFile&& other) noexcept;

    // Writes all of [data, data + size) at offset, extending the file if
    // needed. Retries short writes.
    [[nodiscard]] std::error_code writeAt(std::uint64_t offset, const char* data, std::size_t size) noexcept;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }

private:
    void close() noexcept;

    std::string path_;
    int fd_{-1};
};

// Sequential writer over one region of a DestinationFile, starting at a fixed
// base offset.
class OffsetWriter {
public:
    OffsetWriter(DestinationFile& file, std::uint64_t base_offset) noexcept
        : file_(file), base_offset_(base_offset) {}

    [[nodiscard]] std::error_code write(const char* data, std::size_t size) noexcept;

    [[nodiscard]] std::uint64_t written() const noexcept { return written_; }

private:
    DestinationFile& file_;
    std::uint64_t base_offset_;
    std::uint64_t written_{0};
};

// Pre-flight check on the target path: a missing path may be written, an
// existing one only when overwrite is set.
[[nodiscard]] bool mayWriteDestination(const std::filesystem::path& path, bool overwrite);

} // namespace rangefetch
