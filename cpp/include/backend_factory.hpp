#pragma once

#include "config.hpp"
#include "terminal_backend.hpp"

#include <memory>
#include <optional>
#include <string>

namespace agentshell {
namespace core {

/**
 * @brief What the host offers, gathered once per session.
 */
struct HostProbe {
    bool        platformShellHost{false}; ///< Windows: the platform interpreter is the only choice
    bool        multiplexerFound{false};  ///< Multiplexer binary resolved on PATH
    std::string multiplexerPath{};        ///< Resolved binary, when found
};

// Looks for the multiplexer named in @p config on PATH; no other side effects.
HostProbe probe_host(const Config& config);

// Pure selection: forced choice first, then platform shell, multiplexer, raw pipe.
BackendKind select_backend(BackendChoice choice, const HostProbe& host) noexcept;

std::unique_ptr<TerminalBackend> make_backend(BackendKind kind, BackendOptions opts);

/**
 * @brief Probe, select and construct (not initialize) a backend.
 * @param kindOut Receives the selected kind when not null.
 */
std::unique_ptr<TerminalBackend> create_backend(BackendOptions opts, BackendKind* kindOut = nullptr);

// First executable named @p name on PATH (or @p name itself when it has a directory part).
std::optional<std::string> find_executable(const std::string& name);

} // namespace core
} // namespace agentshell
