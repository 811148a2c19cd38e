#pragma once

#include "pipe_process.hpp"
#include "terminal_backend.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentshell {
namespace core {

/**
 * @brief Interactive shell in a detached tmux session on a private socket.
 *
 * The pane is the output buffer: there is no reader thread, read() captures
 * the pane (scroll-back included). A prompt hook prints a completion record
 * before every prompt, so completion is detected even for commands typed as
 * raw input. Before each new command the pane is cleared, leaving exactly one
 * idle record at the top; read() returns what follows it.
 */
class TmuxBackend final : public TerminalBackend {
public:
    explicit TmuxBackend(BackendOptions opts);
    ~TmuxBackend() override;

    TmuxBackend(const TmuxBackend&) = delete;
    TmuxBackend& operator=(const TmuxBackend&) = delete;

    BackendKind kind() const noexcept override { return BackendKind::Multiplexer; }

    void initialize() override;
    void send(std::string_view text, bool addNewline = true, bool isInternal = false) override;
    std::string read(bool clear) override;
    void clear() override;
    bool interrupt() override;
    bool is_busy() override;
    bool is_alive() override;
    void close() noexcept override;

    bool initialized() const noexcept override { return initialized_.load(); }
    bool closed() const noexcept override { return closed_.load(); }

    const std::string& session_name() const noexcept { return session_; }
    const std::string& socket_name() const noexcept { return socket_; }

private:
    std::optional<CommandOutput> tmux_(std::vector<std::string> args) const;
    bool tmux_ok_(std::vector<std::string> args) const;
    std::optional<std::string> capture_() const;
    std::string shell_command_() const;

    void type_(std::string_view text, bool enter);
    // Clear screen and scroll-back, then wait (bounded) for the idle record.
    void clear_pane_();
    bool wait_for_record_(std::chrono::milliseconds budget) const;

    BackendOptions opts_;
    std::string socket_;
    std::string session_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> closed_{false};
    std::atomic<bool> running_{false};
};

} // namespace core
} // namespace agentshell
