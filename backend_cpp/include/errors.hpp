#pragma once
#include <stdexcept>
#include <string>

namespace code_query {

// Session start failure: missing root or nothing worth indexing.
class IndexBuildError : public std::runtime_error {
public:
    explicit IndexBuildError(const std::string& msg) : std::runtime_error(msg) {}
};

// Per-path read failure. Never fatal to a query.
class FileReadError : public std::runtime_error {
public:
    FileReadError(std::string path, const std::string& reason)
        : std::runtime_error("cannot read '" + path + "': " + reason), path_(std::move(path)) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Transport failure, timeout or unusable response from the reasoning engine.
class ReasoningUnavailable : public std::runtime_error {
public:
    explicit ReasoningUnavailable(const std::string& msg) : std::runtime_error(msg) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace code_query
