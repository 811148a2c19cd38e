#pragma once

#include "stream_backend.hpp"

namespace agentshell {
namespace core {

/**
 * @brief POSIX shell on plain pipes, used when no multiplexer is available.
 *
 * There is no pseudo-terminal and no job control: interrupt() writes the
 * interrupt byte to the shell's input, which a child that does not read
 * its input will not notice.
 */
class SubprocessBackend final : public StreamBackend {
public:
    explicit SubprocessBackend(BackendOptions opts);
    ~SubprocessBackend() override;

    BackendKind kind() const noexcept override { return BackendKind::RawPipe; }

protected:
    ProcessConfig process_config_() const override;
    std::string wrap_command_(std::string_view command) const override;
    std::vector<std::string> setup_commands_() const override;
    std::string ready_probe_(std::string_view token) const override;
    std::optional<std::string> clear_screen_command_() const override { return std::nullopt; }
};

// True when @p username names someone other than the current user.
bool needs_identity_switch(const std::optional<std::string>& username);

} // namespace core
} // namespace agentshell
