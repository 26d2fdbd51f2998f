#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace rangefetch {

// Receives response body fragments in order. Returning false aborts the
// transfer.
using BodySink = std::function<bool(const char* data, std::size_t size)>;

// The transport the download engine runs on. Implementations must allow
// concurrent calls from multiple threads. Failures are reported by throwing
// HttpError.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // HEAD request; returns the Content-Length of the resource.
    [[nodiscard]] virtual std::uint64_t fetchContentLength(const std::string& url) = 0;

    // GET request carrying "Range: <range>", streaming the body into sink.
    virtual void fetchRange(const std::string& url, const std::string& range, const BodySink& sink) = 0;
};

} // namespace rangefetch
