#pragma once

#include <stdexcept>
#include <string>

namespace agentshell {
namespace core {

// Operation attempted on a backend whose process has exited or was never started.
class NotRunningError : public std::runtime_error {
public:
    explicit NotRunningError(const std::string& what) : std::runtime_error(what) {}
};

// Rejected request; raised before any process interaction.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace core
} // namespace agentshell
