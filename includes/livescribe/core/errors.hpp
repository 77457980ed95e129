#pragma once
#include <stdexcept>
#include <string>

namespace livescribe {

// Bad sample rate, unsupported mode, missing credential. Fatal at session start.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

class BackendInitError : public std::runtime_error {
public:
    explicit BackendInitError(const std::string& what) : std::runtime_error(what) {}
};

// Unrecoverable capture stream failure (open/start failed, device vanished).
class CaptureError : public std::runtime_error {
public:
    explicit CaptureError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace livescribe
