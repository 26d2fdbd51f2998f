#include "rangefetch/curl_http_client.hpp"
#include "rangefetch/detail/curl_utils.hpp"
#include "rangefetch/errors.hpp"
#include "rangefetch/log.hpp"

#include <memory>
#include <optional>
#include <string_view>
#include <utility>

#include <curl/curl.h>

#include <fmt/format.h>

namespace rangefetch {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

CurlHandle makeHandle() {
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw HttpError("Failed to allocate curl handle");
    }
    return curl;
}

template <typename Value>
void setOption(CURL* curl, CURLoption option, Value value) {
    const CURLcode res = curl_easy_setopt(curl, option, value);
    if (res != CURLE_OK) {
        throw HttpError(std::string{"Failed to configure request: "} + curl_easy_strerror(res));
    }
}

void applyCommonOptions(CURL* curl, const std::string& url, const CurlSettings& settings, char* error_buffer) {
    setOption(curl, CURLOPT_URL, url.c_str());
    setOption(curl, CURLOPT_ERRORBUFFER, error_buffer);
    setOption(curl, CURLOPT_FOLLOWLOCATION, 1L);
    setOption(curl, CURLOPT_FAILONERROR, 1L);
    setOption(curl, CURLOPT_NOPROGRESS, 1L);
    setOption(curl, CURLOPT_NOSIGNAL, 1L);
    setOption(curl, CURLOPT_CONNECTTIMEOUT, settings.connect_timeout_seconds);
    setOption(curl, CURLOPT_LOW_SPEED_LIMIT, settings.low_speed_limit);
    setOption(curl, CURLOPT_LOW_SPEED_TIME, settings.low_speed_time_seconds);
    setOption(curl, CURLOPT_USERAGENT, settings.user_agent.c_str());
    if (!settings.no_proxy.empty()) {
        setOption(curl, CURLOPT_NOPROXY, settings.no_proxy.c_str());
    }
}

std::string describeFailure(CURLcode res, const char* error_buffer) {
    if (error_buffer[0] != '\0') {
        return fmt::format("{} ({})", curl_easy_strerror(res), error_buffer);
    }
    return curl_easy_strerror(res);
}

// Collects Content-Length from the final response when redirects are followed.
struct HeadContext {
    std::optional<std::string> content_length;
};

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<HeadContext*>(userdata);
    const size_t total = size * nitems;
    detail::trackContentLength(std::string_view{buffer, total}, ctx->content_length);
    return total;
}

struct RangeContext {
    const BodySink* sink{nullptr};
    bool sink_rejected{false};
};

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<RangeContext*>(userdata);
    const size_t total = size * nmemb;
    if (total == 0) {
        return 0;
    }
    if (!(*ctx->sink)(ptr, total)) {
        ctx->sink_rejected = true;
        return 0;
    }
    return total;
}

} // namespace

CurlHttpClient::CurlHttpClient(CurlSettings settings)
    : settings_(std::move(settings)) {
    detail::ensureCurlInitialized();
}

std::uint64_t CurlHttpClient::fetchContentLength(const std::string& url) {
    CurlHandle curl = makeHandle();
    char error_buffer[CURL_ERROR_SIZE] = {};
    HeadContext ctx;

    applyCommonOptions(curl.get(), url, settings_, error_buffer);
    setOption(curl.get(), CURLOPT_NOBODY, 1L);
    setOption(curl.get(), CURLOPT_HEADERFUNCTION, &headerCallback);
    setOption(curl.get(), CURLOPT_HEADERDATA, &ctx);

    log::debug("HEAD {}", url);
    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw HttpError(fmt::format("HEAD {} failed: {}", url, describeFailure(res, error_buffer)));
    }

    try {
        return detail::parseContentLength(ctx.content_length.value_or(std::string{}));
    } catch (const HttpError& ex) {
        throw HttpError(fmt::format("HEAD {}: {}", url, ex.what()));
    }
}

void CurlHttpClient::fetchRange(const std::string& url, const std::string& range, const BodySink& sink) {
    CurlHandle curl = makeHandle();
    char error_buffer[CURL_ERROR_SIZE] = {};

    const std::string header = "Range: " + range;
    HeaderList headers{curl_slist_append(nullptr, header.c_str()), &curl_slist_free_all};
    if (!headers) {
        throw HttpError("Failed to build Range header");
    }

    RangeContext ctx{&sink, false};

    applyCommonOptions(curl.get(), url, settings_, error_buffer);
    setOption(curl.get(), CURLOPT_HTTPGET, 1L);
    setOption(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    setOption(curl.get(), CURLOPT_WRITEFUNCTION, &writeCallback);
    setOption(curl.get(), CURLOPT_WRITEDATA, &ctx);

    log::trace("GET {} ({})", url, range);
    const CURLcode res = curl_easy_perform(curl.get());
    if (ctx.sink_rejected) {
        throw HttpError(fmt::format("GET {} ({}): body sink rejected data", url, range));
    }
    if (res != CURLE_OK) {
        throw HttpError(fmt::format("GET {} ({}) failed: {}", url, range, describeFailure(res, error_buffer)));
    }

    long status = 0;
    if (curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status) == CURLE_OK && status == 200) {
        log::warn("GET {} ({}): server ignored the Range header and sent the whole resource", url, range);
    }
}

} // namespace rangefetch
