#pragma once

#include "process.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <sys/types.h>
#endif

namespace agentshell {
namespace core {

struct ProcessConfig {
    std::string program{};                              ///< Looked up on PATH when not absolute
    std::vector<std::string> arguments{};
    std::string working_directory{};                    ///< Empty = inherit
    std::map<std::string, std::string> environment{};   ///< Added to the inherited environment
    bool merge_stderr{true};                            ///< stderr -> stdout pipe, otherwise discarded
};

/**
 * @brief Child process wired to anonymous pipes (stdin, stdout+stderr).
 *
 * POSIX children run in their own session so signals sent to the process
 * group reach everything the shell spawned. Win32 children get no console
 * window and binary pipes (no newline translation).
 */
class PipeProcess final : public Process {
public:
    explicit PipeProcess(ProcessConfig config);
    ~PipeProcess() override;

    PipeProcess(const PipeProcess&) = delete;
    PipeProcess& operator=(const PipeProcess&) = delete;
    PipeProcess(PipeProcess&&) = delete;
    PipeProcess& operator=(PipeProcess&&) = delete;

    // False when the pipes cannot be created or the program cannot be executed.
    bool start();
    bool is_alive() noexcept;

    bool write(std::string_view data) override;
    std::optional<std::string> read_stdout(std::chrono::milliseconds wait) override;
    void shutdown_streams() override;

    void close_stdin() noexcept;
    // Must not race a read_stdout() in flight; join the reader first.
    void close_stdout() noexcept;

    bool wait_for_exit(std::chrono::milliseconds timeout);
    // Polite stop (SIGTERM to the group), then a forced kill after @p grace.
    void terminate(std::chrono::milliseconds grace);

    std::optional<int> exit_code() const noexcept;

private:
    bool create_pipes_();
    void close_pipes_() noexcept;
    bool spawn_child_();
    void record_exit_(int code) noexcept;

#ifdef _WIN32
    std::wstring build_command_line_() const;
    std::vector<wchar_t> build_environment_block_() const;
#else
    bool reap_(bool block) noexcept;
#endif

    ProcessConfig config_;
    std::atomic<bool> running_{false};
    std::atomic<int>  exit_code_{-1};
    std::atomic<bool> exited_{false};

#ifdef _WIN32
    HANDLE stdin_read_{nullptr};
    HANDLE stdin_write_{nullptr};
    HANDLE stdout_read_{nullptr};
    HANDLE stdout_write_{nullptr};
    PROCESS_INFORMATION process_info_{};
#else
    int stdin_pipe_[2]{-1, -1};
    int stdout_pipe_[2]{-1, -1};
    pid_t child_pid_{-1};
#endif

    std::mutex stdin_mutex_;
    std::mutex wait_mutex_;
};

/**
 * @brief Result of a short-lived helper command (see run_command()).
 */
struct CommandOutput {
    int         exitCode{-1};
    std::string output{};
    bool        timedOut{false};
};

/**
 * @brief Run @p argv to completion, collecting stdout (stderr is discarded).
 *
 * The child is force-killed when @p timeout elapses. Returns nullopt when it
 * could not be started at all.
 */
std::optional<CommandOutput> run_command(const std::vector<std::string>& argv,
                                         std::chrono::milliseconds timeout,
                                         const std::map<std::string, std::string>& env = {});

} // namespace core
} // namespace agentshell
