#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace agentshell {
namespace core {

/**
 * @brief Which terminal backend a session should drive.
 *
 * Auto probes the host once at session creation (see backend_factory.hpp).
 */
enum class BackendChoice {
    Auto,
    Multiplexer,
    RawPipe,
    PlatformShell,
};

struct Config {
    BackendChoice backend{BackendChoice::Auto};   ///< Forced backend, Auto = probe the host
    std::string shellPath{"/bin/bash"};           ///< POSIX shell used by the multiplexer and raw-pipe backends
    std::string multiplexerPath{"tmux"};          ///< Multiplexer binary (looked up on PATH when not absolute)
#ifdef _WIN32
    std::string powershellPath{"powershell.exe"}; ///< Platform command interpreter
#else
    std::string powershellPath{"pwsh"};           ///< Platform command interpreter
#endif
    std::map<std::string, std::string> environment;  ///< Extra environment variables for the shell
    std::vector<std::string> initialCommands;        ///< Internal commands sent after every (re)start

    size_t historyLimit{10000};               ///< Output buffer chunk capacity / multiplexer scroll-back lines
    double noOutputTimeoutSeconds{30.0};      ///< Default silence timeout when the action sets none
    double hardTimeoutSeconds{600.0};         ///< Absolute ceiling on a single poll loop
    double pollIntervalSeconds{0.1};          ///< Sleep between reads in execute()
    double setupWaitSeconds{2.0};             ///< Bounded wait for the shell to become ready
    double readerJoinTimeoutSeconds{1.0};     ///< Bounded join of the background reader on close()
    double terminateGraceSeconds{5.0};        ///< Grace period before the shell is force-killed
    double screenClearDelaySeconds{0.2};      ///< Settle time after a screen-clear command
    size_t maxOutputChars{30000};             ///< Observation text cap (head and tail kept)

    // Throws std::invalid_argument when a field is out of range.
    void validate() const;
};

} // namespace core
} // namespace agentshell
