#include "backend_factory.hpp"
#include "dev_debug.hpp"
#include "powershell_backend.hpp"
#include "subprocess_backend.hpp"
#include "tmux_backend.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace agentshell {
namespace core {

namespace {

bool is_executable(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) return false;
#ifdef _WIN32
    return true;
#else
    return ::access(p.c_str(), X_OK) == 0;
#endif
}

} // namespace

std::optional<std::string> find_executable(const std::string& name) {
    if (name.empty()) return std::nullopt;

    const fs::path candidate(name);
    if (candidate.has_parent_path()) {
        if (is_executable(candidate)) return candidate.string();
        return std::nullopt;
    }

    const char* path = std::getenv("PATH");
    if (!path) return std::nullopt;

#ifdef _WIN32
    const char sep = ';';
    const char* exts[] = {"", ".exe", ".cmd", ".bat"};
#else
    const char sep = ':';
    const char* exts[] = {""};
#endif

    std::string_view rest(path);
    while (true) {
        const size_t pos = rest.find(sep);
        std::string_view dir = rest.substr(0, pos);
        if (!dir.empty()) {
            for (const char* ext : exts) {
                fs::path full = fs::path(std::string(dir)) / (name + ext);
                if (is_executable(full)) return full.string();
            }
        }
        if (pos == std::string_view::npos) break;
        rest.remove_prefix(pos + 1);
    }
    return std::nullopt;
}

HostProbe probe_host(const Config& config) {
    HostProbe host;
#ifdef _WIN32
    host.platformShellHost = true;
#else
    if (auto found = find_executable(config.multiplexerPath)) {
        host.multiplexerFound = true;
        host.multiplexerPath = *found;
    }
#endif
    ASHELL_DBG("FACTORY", "probe platformShell=%d multiplexer=%d path='%s'",
               int(host.platformShellHost), int(host.multiplexerFound), host.multiplexerPath.c_str());
    return host;
}

BackendKind select_backend(BackendChoice choice, const HostProbe& host) noexcept {
    switch (choice) {
        case BackendChoice::Multiplexer:   return BackendKind::Multiplexer;
        case BackendChoice::RawPipe:       return BackendKind::RawPipe;
        case BackendChoice::PlatformShell: return BackendKind::PlatformShell;
        case BackendChoice::Auto:          break;
    }
    if (host.platformShellHost) return BackendKind::PlatformShell;
    if (host.multiplexerFound) return BackendKind::Multiplexer;
    return BackendKind::RawPipe;
}

std::unique_ptr<TerminalBackend> make_backend(BackendKind kind, BackendOptions opts) {
    switch (kind) {
        case BackendKind::Multiplexer:   return std::make_unique<TmuxBackend>(std::move(opts));
        case BackendKind::PlatformShell: return std::make_unique<PowerShellBackend>(std::move(opts));
        case BackendKind::RawPipe:       break;
    }
    return std::make_unique<SubprocessBackend>(std::move(opts));
}

std::unique_ptr<TerminalBackend> create_backend(BackendOptions opts, BackendKind* kindOut) {
    const HostProbe host = opts.config.backend == BackendChoice::Auto ? probe_host(opts.config) : HostProbe{};
    const BackendKind kind = select_backend(opts.config.backend, host);
    if (kind == BackendKind::Multiplexer && host.multiplexerFound) {
        opts.config.multiplexerPath = host.multiplexerPath;
    }
    ASHELL_DBG("FACTORY", "selected backend %s", to_string(kind));
    if (kindOut) *kindOut = kind;
    return make_backend(kind, std::move(opts));
}

} // namespace core
} // namespace agentshell
