#pragma once

#include <stdexcept>
#include <string>

namespace core {

// Bad or missing configuration; raised before any scanning starts.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// The report file could not be created or written.
class ReportWriteError : public std::runtime_error {
public:
    ReportWriteError(const std::string& path, const std::string& reason)
        : std::runtime_error("failed to write report " + path + ": " + reason) {}
};

} // namespace core
