#pragma once

#include <stdexcept>

namespace rangefetch {

// Fatal, run-level failure. Nothing has been fetched when this is thrown.
class DownloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Transport failure reported by an HttpClient.
class HttpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CommandLineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace rangefetch
