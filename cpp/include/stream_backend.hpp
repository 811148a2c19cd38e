#pragma once

#include "io_pump.hpp"
#include "output_buffer.hpp"
#include "pipe_process.hpp"
#include "terminal_backend.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentshell {
namespace core {

/**
 * @brief Shared machinery of the pipe-driven backends.
 *
 * One PipeProcess, one IoPump reader thread decoding into an OutputBuffer.
 * Subclasses supply the interpreter: how to spawn it, how to wrap a command
 * with its completion record and what to run once it is up.
 */
class StreamBackend : public TerminalBackend {
public:
    explicit StreamBackend(BackendOptions opts);
    ~StreamBackend() override;

    StreamBackend(const StreamBackend&) = delete;
    StreamBackend& operator=(const StreamBackend&) = delete;

    void initialize() override;
    void send(std::string_view text, bool addNewline = true, bool isInternal = false) override;
    std::string read(bool clear) override;
    OutputWindow window() override;
    void clear() override;
    bool interrupt() override;
    bool is_busy() override;
    bool is_alive() override;
    void close() noexcept override;

    bool initialized() const noexcept override { return initialized_.load(); }
    bool closed() const noexcept override { return closed_.load(); }

protected:
    virtual ProcessConfig process_config_() const = 0;
    virtual std::string wrap_command_(std::string_view command) const = 0;
    // Internal commands run once the interpreter is up, before the readiness probe.
    virtual std::vector<std::string> setup_commands_() const = 0;
    // Command whose output contains @p token once everything before it ran.
    virtual std::string ready_probe_(std::string_view token) const = 0;
    virtual std::optional<std::string> clear_screen_command_() const = 0;
    virtual std::string_view interrupt_sequence_() const { return "\x03\n"; }

    BackendOptions opts_;

private:
    void write_or_throw_(std::string_view payload);
    void wait_ready_();
    void shutdown_locked_() noexcept;

    std::mutex lifecycle_mutex_;
    std::shared_ptr<PipeProcess>  proc_;
    std::shared_ptr<OutputBuffer> buffer_;
    IoPump pump_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> closed_{false};
};

} // namespace core
} // namespace agentshell
