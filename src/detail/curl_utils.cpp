#include "rangefetch/detail/curl_utils.hpp"
#include "rangefetch/errors.hpp"
#include "rangefetch/log.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <mutex>

#include <curl/curl.h>

#include <fmt/format.h>

namespace rangefetch::detail {

namespace {

bool startsWithIgnoreCase(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw HttpError("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });

        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        log::debug("libcurl {} ({})", info->version, info->ssl_version ? info->ssl_version : "no TLS");
    });
}

void trackContentLength(std::string_view header_line, std::optional<std::string>& content_length) {
    constexpr std::string_view kStatusPrefix = "HTTP/";
    constexpr std::string_view kLengthPrefix = "Content-Length:";

    if (startsWithIgnoreCase(header_line, kStatusPrefix)) {
        content_length.reset();
    } else if (startsWithIgnoreCase(header_line, kLengthPrefix)) {
        content_length = std::string{trim(header_line.substr(kLengthPrefix.size()))};
    }
}

std::uint64_t parseContentLength(std::string_view text) {
    if (text.empty()) {
        throw HttpError("Content-Length not found");
    }

    std::uint64_t length = 0;
    const char* const last = text.data() + text.size();
    const auto [end, ec] = std::from_chars(text.data(), last, length);
    if (ec != std::errc{} || end != last) {
        throw HttpError(fmt::format("invalid Content-Length '{}'", text));
    }
    return length;
}

} // namespace rangefetch::detail
