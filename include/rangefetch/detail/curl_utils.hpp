#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rangefetch::detail {

// curl_global_init() once per process; cleanup is registered with atexit.
void ensureCurlInitialized();

// Feeds one raw response header line. A status line ("HTTP/...") starts a new
// response and forgets the value seen so far, so after redirects only the
// final response counts. Header names match case-insensitively.
void trackContentLength(std::string_view header_line, std::optional<std::string>& content_length);

// Strict decimal parse of a Content-Length value. Throws HttpError when it is
// empty, has trailing characters or does not fit in 64 bits.
[[nodiscard]] std::uint64_t parseContentLength(std::string_view text);

} // namespace rangefetch::detail
