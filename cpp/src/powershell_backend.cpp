#include "powershell_backend.hpp"
#include "helpers.h"
#include "metadata.hpp"

using agentshell::helpers::quoting::ps_quote;

namespace agentshell {
namespace core {

PowerShellBackend::PowerShellBackend(BackendOptions opts) : StreamBackend(std::move(opts)) {}

PowerShellBackend::~PowerShellBackend() {
    close();
}

ProcessConfig PowerShellBackend::process_config_() const {
    ProcessConfig pc;
    pc.program = opts_.config.powershellPath;
    pc.arguments = {"-NoLogo", "-NoProfile", "-Command", "-"};
    pc.working_directory = opts_.workDir;
    pc.environment = opts_.config.environment;
    return pc;
}

std::string PowerShellBackend::wrap_command_(std::string_view command) const {
    return metadata::powershell_wrap_command(command);
}

std::vector<std::string> PowerShellBackend::setup_commands_() const {
    std::vector<std::string> cmds;
    cmds.emplace_back("[Console]::OutputEncoding = [System.Text.Encoding]::UTF8");
    cmds.emplace_back("$ProgressPreference = 'SilentlyContinue'");
    if (!opts_.workDir.empty()) cmds.push_back("Set-Location -LiteralPath " + ps_quote(opts_.workDir));
    return cmds;
}

std::string PowerShellBackend::ready_probe_(std::string_view token) const {
    return "Write-Output " + ps_quote(token);
}

} // namespace core
} // namespace agentshell
