#pragma once

#include "http_client.hpp"

#include <string>

namespace rangefetch {

struct CurlSettings {
    long connect_timeout_seconds{30};
    // Abort a transfer slower than low_speed_limit bytes/s for low_speed_time seconds.
    long low_speed_limit{1};
    long low_speed_time_seconds{60};
    std::string user_agent{"rangefetch/1.0"};
    // Hosts contacted directly even when a proxy is set in the environment.
    std::string no_proxy;
};

// HttpClient over the libcurl easy interface. Each call uses its own easy
// handle, so one instance can be shared by every worker.
class CurlHttpClient final : public HttpClient {
public:
    explicit CurlHttpClient(CurlSettings settings = CurlSettings{});

    [[nodiscard]] std::uint64_t fetchContentLength(const std::string& url) override;
    void fetchRange(const std::string& url, const std::string& range, const BodySink& sink) override;

private:
    CurlSettings settings_;
};

} // namespace rangefetch
