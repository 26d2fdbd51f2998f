#include "rangefetch/destination_file.hpp"
#include "rangefetch/errors.hpp"
#include "rangefetch/log.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>

namespace rangefetch {

DestinationFile::DestinationFile(std::string path)
    : path_(std::move(path)) {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0664);
    if (fd_ < 0) {
        throw DownloadError(
            fmt::format("Cannot open destination file {}: {}", path_, std::strerror(errno)));
    }
}

DestinationFile::~DestinationFile() { close(); }

DestinationFile::DestinationFile(DestinationFile&& other) noexcept
    : path_(std::move(other.path_)), fd_(std::exchange(other.fd_, -1)) {}

DestinationFile& DestinationFile::operator=(DestinationFile&& other) noexcept {
    if (this != &other) {
        close();
        path_ = std::move(other.path_);
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

std::error_code DestinationFile::writeAt(std::uint64_t offset, const char* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }

    while (size > 0) {
        const ssize_t n = ::pwrite(fd_, data, size, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::error_code(errno, std::generic_category());
        }
        if (n == 0) {
            return std::make_error_code(std::errc::io_error);
        }
        data += n;
        size -= static_cast<std::size_t>(n);
        offset += static_cast<std::uint64_t>(n);
    }
    return {};
}

void DestinationFile::close() noexcept {
    if (fd_ >= 0) {
        if (::close(fd_) != 0) {
            log::warn("Closing {} failed: {}", path_, std::strerror(errno));
        }
        fd_ = -1;
    }
}

std::error_code OffsetWriter::write(const char* data, std::size_t size) noexcept {
    const std::error_code ec = file_.writeAt(base_offset_ + written_, data, size);
    if (!ec) {
        written_ += size;
    }
    return ec;
}

bool mayWriteDestination(const std::filesystem::path& path, bool overwrite) {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);

    if (status.type() == std::filesystem::file_type::not_found) {
        return true;
    }
    if (ec) {
        log::error("Cannot check destination {}: {}", path.string(), ec.message());
        return false;
    }
    if (overwrite) {
        log::info("Destination {} exists, overwriting in place", path.string());
        return true;
    }

    log::warn("Destination {} exists; pass -f/--overwrite to write over it", path.string());
    return false;
}

} // namespace rangefetch
