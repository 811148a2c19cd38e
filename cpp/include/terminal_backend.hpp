#pragma once

#include "config.hpp"
#include "output_buffer.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace agentshell {
namespace core {

enum class BackendKind {
    Multiplexer,    ///< Named multiplexer session over a pseudo-terminal
    RawPipe,        ///< POSIX shell on plain pipes
    PlatformShell,  ///< Platform command interpreter on pipes
};

const char* to_string(BackendKind kind) noexcept;

struct BackendOptions {
    std::string                workDir{};   ///< Initial working directory
    std::optional<std::string> username{};  ///< Identity to run the shell as (POSIX only)
    Config                     config{};
};

/**
 * @brief Capability contract for driving one interactive shell.
 *
 * All methods are called from the owning session's thread; implementations
 * may run their own reader thread internally.
 */
class TerminalBackend {
public:
    virtual ~TerminalBackend() = default;

    virtual BackendKind kind() const noexcept = 0;

    // Idempotent. Blocks for at most the configured setup wait.
    virtual void initialize() = 0;

    /**
     * @brief Write to the shell's input.
     *
     * Unless @p isInternal is set or @p text is an interrupt key, the text is
     * wrapped so the shell prints a completion record after it, and the
     * backend is marked busy.
     * @throws NotRunningError when the shell process is not alive.
     */
    virtual void send(std::string_view text, bool addNewline = true, bool isInternal = false) = 0;

    // Output produced since the last clearing read/clear().
    virtual std::string read(bool clear) = 0;

    // read(false) plus the stream offset of its first character. Backends
    // that cannot count evicted output (the multiplexer pane) report 0.
    virtual OutputWindow window() { return OutputWindow{read(false), 0}; }

    // Clear the screen and the buffered output; no command is considered running afterwards.
    virtual void clear() = 0;

    // Best-effort and non-blocking; false when nothing could be delivered.
    virtual bool interrupt() = 0;

    // Process alive and no completion record seen since the last wrapped send.
    virtual bool is_busy() = 0;

    virtual bool is_alive() = 0;

    // Idempotent and never throws.
    virtual void close() noexcept = 0;

    virtual bool initialized() const noexcept = 0;
    virtual bool closed() const noexcept = 0;
};

// Raw interrupt keys accepted in place of a command.
bool is_interrupt_key(std::string_view text) noexcept;

// "C-<letter>" key names; returns the matching control byte.
std::optional<char> control_key_byte(std::string_view text) noexcept;

} // namespace core
} // namespace agentshell
