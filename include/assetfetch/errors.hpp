#pragma once

#include <stdexcept>
#include <string>

namespace assetfetch {

// Fatal setup problem. Raised before any task runs.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

// Raised by transports and streams. Never escapes a task.
class NetworkFailure : public std::runtime_error {
public:
    explicit NetworkFailure(const std::string& message) : std::runtime_error(message) {}
};

} // namespace assetfetch
