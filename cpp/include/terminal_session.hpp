#pragma once

#include "cmd_state.hpp"
#include "config.hpp"
#include "execution_result.hpp"
#include "terminal_backend.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace agentshell {
namespace core {

class TimeoutPolicy;

/**
 * @brief One stateful shell conversation bound to a working directory.
 *
 * Owns exactly one backend. execute() sends a command and polls the backend
 * until the completion record shows up or a timeout fires; a command that
 * times out keeps running and can be polled again with an empty command.
 *
 * execute() and close() are serialised; interrupt() may be called from
 * another thread while execute() is polling.
 */
class TerminalSession {
public:
    enum class State {
        Uninitialized,
        Ready,
        Busy,     ///< A command is in flight (timed out or still being polled)
        Closed,
    };

    using BackendFactory = std::function<std::unique_ptr<TerminalBackend>()>;

    static constexpr const char* RESET_NOTICE =
        "Terminal session has been reset. All previous environment variables and session state have been cleared.";
    static constexpr const char* TRUNCATION_NOTICE =
        "\n[... Observation truncated due to length ...]\n";

    /**
     * @param backend  Backend for the first shell (not yet initialized).
     * @param factory  Builds a fresh backend bound to the original directory; used by reset.
     */
    TerminalSession(std::unique_ptr<TerminalBackend> backend,
                    BackendFactory factory,
                    std::string workDir,
                    Config config);
    ~TerminalSession();

    TerminalSession(const TerminalSession&) = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;

    // Starts the shell. Called implicitly by the first execute().
    void initialize();

    /**
     * @throws ValidationError when reset and isInput are both set (before any I/O).
     * @throws NotRunningError after close() or when the shell is gone.
     */
    Observation execute(const Action& action);

    bool interrupt();
    void close() noexcept;

    State state() const noexcept { return state_.load(); }
    bool is_busy();
    BackendKind backend_kind() const noexcept { return kind_; }

    const std::string& work_dir() const noexcept { return workDir_; }
    // Directory reported by the most recent completion record.
    std::optional<std::string> current_dir() const;

    const Config& config() const noexcept { return config_; }

private:
    Observation reset_(const Action& action);
    Observation run_command_(const std::string& command, std::optional<double> timeout);
    Observation send_input_(const std::string& keys, std::optional<double> timeout);
    Observation poll_(std::optional<double> timeout);
    Observation busy_guard_(const std::string& command) const;
    Observation error_observation_(std::string text, const std::string& label) const;

    std::string shape_text_(std::string raw, bool stripEcho) const;
    std::string timeout_notice_(CommandStatus status, const TimeoutPolicy& policy) const;
    void ensure_open_();
    void mark_ready_() noexcept;
    std::shared_ptr<TerminalBackend> backend_snapshot_() const;

    mutable std::mutex backend_mutex_;         ///< Guards swapping backend_ on reset
    std::shared_ptr<TerminalBackend> backend_;
    BackendFactory factory_;
    const std::string workDir_;
    const Config config_;
    BackendKind kind_;

    std::atomic<State> state_{State::Uninitialized};
    std::optional<CmdState> inflight_;

    mutable std::mutex dir_mutex_;
    std::optional<std::string> currentDir_;

    std::mutex exec_mutex_;
};

// Cap @p text at @p maxChars, keeping its head and tail around TRUNCATION_NOTICE.
std::string truncate_middle(const std::string& text, size_t maxChars);

/**
 * @brief Probe the host, select a backend and wrap it in a session.
 * @throws std::invalid_argument when @p config does not validate.
 */
std::unique_ptr<TerminalSession> create_terminal_session(const std::string& workDir,
                                                         const std::optional<std::string>& username = std::nullopt,
                                                         const Config& config = Config{});

} // namespace core
} // namespace agentshell
