#pragma once

#include "rangefetch/errors.hpp"
#include "rangefetch/http_client.hpp"
#include "rangefetch/progress.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace rangefetch::test {

// Serves one resource from memory with the same Range semantics a server
// applies: inclusive bounds, end clamped to the last byte.
class InMemoryHttpClient final : public HttpClient {
public:
    explicit InMemoryHttpClient(std::string body) : body_(std::move(body)) {}

    std::uint64_t fetchContentLength(const std::string&) override {
        ++head_calls;
        if (!has_content_length) {
            throw HttpError("Content-Length not found");
        }
        return body_.size();
    }

    void fetchRange(const std::string&, const std::string& range, const BodySink& sink) override {
        ++get_calls;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ranges_.push_back(range);
        }
        if (failing_ranges.count(range) != 0) {
            throw HttpError("simulated failure for " + range);
        }

        std::uint64_t start = 0;
        std::uint64_t end = 0;
        parseRange(range, start, end);
        if (start >= body_.size()) {
            throw HttpError("416 Range Not Satisfiable");
        }
        end = std::min<std::uint64_t>(end, body_.size() - 1);
        std::uint64_t length = end - start + 1;
        if (short_ranges.count(range) != 0) {
            length /= 2;
        }

        for (std::uint64_t sent = 0; sent < length; sent += fragment_size) {
            const std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(fragment_size, length - sent));
            if (!sink(body_.data() + start + sent, n)) {
                throw HttpError("body sink rejected data");
            }
        }
    }

    [[nodiscard]] std::vector<std::string> ranges() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ranges_;
    }

    const std::string& body() const { return body_; }

    std::atomic<int> head_calls{0};
    std::atomic<int> get_calls{0};
    bool has_content_length{true};
    std::uint64_t fragment_size{7};
    // Set before the download starts; read concurrently afterwards.
    std::set<std::string> failing_ranges;
    std::set<std::string> short_ranges;

private:
    static void parseRange(const std::string& range, std::uint64_t& start, std::uint64_t& end) {
        const std::string prefix = "bytes=";
        const auto dash = range.find('-', prefix.size());
        if (range.compare(0, prefix.size(), prefix) != 0 || dash == std::string::npos) {
            throw HttpError("malformed range " + range);
        }
        start = std::stoull(range.substr(prefix.size(), dash - prefix.size()));
        end = std::stoull(range.substr(dash + 1));
    }

    std::string body_;
    mutable std::mutex mutex_;
    std::vector<std::string> ranges_;
};

class RecordingReporter final : public ProgressReporter {
public:
    void onProgress(std::uint64_t downloaded_bytes, std::uint64_t total_bytes) override {
        std::lock_guard<std::mutex> lock(mutex);
        progress.push_back(downloaded_bytes);
        total = total_bytes;
    }

    void onComplete(std::uint64_t downloaded_bytes, std::uint64_t total_bytes) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++complete_calls;
        final_bytes = downloaded_bytes;
        total = total_bytes;
    }

    std::mutex mutex;
    std::vector<std::uint64_t> progress;
    std::uint64_t total{0};
    std::uint64_t final_bytes{0};
    int complete_calls{0};
};

// Non-zero pseudo-random bytes, so unwritten (zero) regions stand out.
inline std::string makeBody(std::size_t size) {
    std::mt19937 rng(static_cast<std::mt19937::result_type>(size));
    std::uniform_int_distribution<int> dist(1, 255);
    std::string body(size, '\0');
    for (auto& c : body) {
        c = static_cast<char>(dist(rng));
    }
    return body;
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("rangefetch_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] std::filesystem::path file(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

} // namespace rangefetch::test
