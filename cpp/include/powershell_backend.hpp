#pragma once

#include "stream_backend.hpp"

namespace agentshell {
namespace core {

/**
 * @brief PowerShell on pipes, with console window suppressed.
 *
 * Every command is suffixed with a PowerShell expression that prints the
 * completion record (see metadata::powershell_wrap_command). The identity
 * option is ignored.
 */
class PowerShellBackend final : public StreamBackend {
public:
    explicit PowerShellBackend(BackendOptions opts);
    ~PowerShellBackend() override;

    BackendKind kind() const noexcept override { return BackendKind::PlatformShell; }

protected:
    ProcessConfig process_config_() const override;
    std::string wrap_command_(std::string_view command) const override;
    std::vector<std::string> setup_commands_() const override;
    std::string ready_probe_(std::string_view token) const override;
    std::optional<std::string> clear_screen_command_() const override { return std::string("Clear-Host"); }
};

} // namespace core
} // namespace agentshell
