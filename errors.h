#pragma once

#include <stdexcept>
#include <string>

namespace readyset {

// Malformed client configuration (tier gaps/overlaps, bad JSON, negative
// amounts). Raised at load time only; never from a calculation.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("invalid configuration: " + message), detail_(message) {}

    // Message without the prefix, for callers adding their own context.
    const std::string& detail() const { return detail_; }

private:
    std::string detail_;
};

} // namespace readyset
