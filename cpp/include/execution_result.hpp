#pragma once

#include <optional>
#include <string>

namespace agentshell {
namespace core {

    /**
     * @brief Request from the orchestration layer.
     *
     * isInput means "raw keystrokes for the program already running in the
     * foreground", not a new command. reset together with isInput is rejected.
     */
    struct Action {
        std::string           command{};   ///< Command text (or keys when isInput)
        bool                  isInput{};   ///< Send to the running program instead of starting a command
        std::optional<double> timeout{};   ///< Silence timeout in seconds (session default when unset)
        bool                  reset{};     ///< Restart the shell before running command
    };

    enum class CommandStatus {
        Completed,        ///< Completion record observed
        Running,          ///< Command still in flight (busy guard)
        NoOutputTimeout,  ///< No new output for the silence timeout
        HardTimeout,      ///< Absolute ceiling reached
    };

    const char* to_string(CommandStatus status) noexcept;

    /**
     * @brief Structured result decoded from the end-of-command marker.
     */
    struct CompletionRecord {
        int                        pid{-1};
        int                        exitCode{-1};
        std::string                username{};
        std::string                hostname{};
        std::string                workingDir{};
        std::optional<std::string> interpreterPath{};
    };

    /**
     * @brief Result returned by TerminalSession::execute().
     */
    struct Observation {
        std::string                     text{};          ///< Decoded output, completion record stripped
        std::optional<int>              exitCode{};      ///< Set when the command completed
        CommandStatus                   status{CommandStatus::Completed};
        std::optional<std::string>      workingDir{};    ///< Shell working directory after the command
        std::string                     commandLabel{};  ///< Command echo, "[RESET]" prefixed on reset
        std::optional<CompletionRecord> record{};        ///< Full record when one was decoded
    };

} // namespace core
} // namespace agentshell
