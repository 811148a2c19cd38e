#include "subprocess_backend.hpp"
#include "helpers.h"
#include "metadata.hpp"

#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#endif

using agentshell::helpers::quoting::sh_quote;

namespace agentshell {
namespace core {

bool needs_identity_switch(const std::optional<std::string>& username) {
    if (!username || username->empty()) return false;
#ifdef _WIN32
    return false;
#else
    const passwd* pw = ::getpwuid(::geteuid());
    return !pw || *username != pw->pw_name;
#endif
}

SubprocessBackend::SubprocessBackend(BackendOptions opts) : StreamBackend(std::move(opts)) {}

SubprocessBackend::~SubprocessBackend() {
    close();
}

ProcessConfig SubprocessBackend::process_config_() const {
    ProcessConfig pc;
    pc.working_directory = opts_.workDir;
    pc.environment = opts_.config.environment;
    if (needs_identity_switch(opts_.username)) {
        pc.program = "su";
        pc.arguments = {"-", *opts_.username, "-s", opts_.config.shellPath};
    } else {
        pc.program = opts_.config.shellPath;
        pc.arguments = {"--noprofile", "--norc"};
    }
    return pc;
}

std::string SubprocessBackend::wrap_command_(std::string_view command) const {
    return metadata::posix_wrap_command(command);
}

std::vector<std::string> SubprocessBackend::setup_commands_() const {
    std::vector<std::string> cmds{metadata::posix_json_escaper()};
    // A login shell started through su loses the directory and environment.
    if (needs_identity_switch(opts_.username)) {
        for (const auto& [k, v] : opts_.config.environment) {
            cmds.push_back("export " + k + "=" + sh_quote(v));
        }
    }
    if (!opts_.workDir.empty()) cmds.push_back("cd " + sh_quote(opts_.workDir));
    // Job control messages and history expansion only get in the way on pipes.
    cmds.push_back("set +m +H 2>/dev/null");
    // An interrupt byte the foreground child never read reaches the shell as
    // a command line of its own once the child is done; keep it silent.
    cmds.push_back(R"sh(command_not_found_handle() { [ "$1" = $'\003' ] && return 0; )sh"
                   R"sh(printf '%s: %s: command not found\n' "${0##*/}" "$1" >&2; return 127; })sh");
    return cmds;
}

std::string SubprocessBackend::ready_probe_(std::string_view token) const {
    return "echo " + sh_quote(token);
}

} // namespace core
} // namespace agentshell
