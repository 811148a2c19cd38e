#include "terminal_backend.hpp"

namespace agentshell {
namespace core {

const char* to_string(BackendKind kind) noexcept {
    switch (kind) {
        case BackendKind::Multiplexer:   return "multiplexer";
        case BackendKind::RawPipe:       return "raw_pipe";
        case BackendKind::PlatformShell: return "platform_shell";
    }
    return "unknown";
}

bool is_interrupt_key(std::string_view text) noexcept {
    return text == "C-c" || text == "C-C" || text == "\x03";
}

std::optional<char> control_key_byte(std::string_view text) noexcept {
    if (text.size() != 3 || text[0] != 'C' || text[1] != '-') return std::nullopt;
    const char c = text[2];
    if (c >= 'a' && c <= 'z') return static_cast<char>(c - 'a' + 1);
    if (c >= 'A' && c <= 'Z') return static_cast<char>(c - 'A' + 1);
    return std::nullopt;
}

} // namespace core
} // namespace agentshell
