#include "metadata.hpp"
#include "dev_debug.hpp"
#include "helpers.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdlib>

using agentshell::helpers::quoting::ps_quote;
using agentshell::helpers::quoting::sh_quote;

namespace agentshell {
namespace core {
namespace metadata {

namespace {

using json = nlohmann::json;

constexpr const char* POSIX_EXIT_VAR = "__agentshell_ec";
constexpr const char* POSIX_HOOK_FN  = "__agentshell_prompt";
constexpr const char* POSIX_CMD_VAR  = "__agentshell_cmd";
constexpr const char* POSIX_HEREDOC_END = "__AGENTSHELL_CMD_EOF__";
constexpr const char* POSIX_JSON_FN  = "__agentshell_json";

std::optional<int> as_int(const json& v) {
    if (v.is_number_integer()) return v.get<int>();
    if (v.is_number_unsigned()) return static_cast<int>(v.get<unsigned>());
    if (v.is_string()) {
        const std::string& s = v.get_ref<const std::string&>();
        if (s.empty()) return std::nullopt;
        errno = 0;
        char* end = nullptr;
        long n = std::strtol(s.c_str(), &end, 10);
        if (errno != 0 || end == s.c_str() || *end != '\0') return std::nullopt;
        return static_cast<int>(n);
    }
    return std::nullopt;
}

std::string as_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

} // namespace

std::optional<CompletionRecord> parse_record(std::string_view payload) {
    std::string body(payload);
    helpers::parsers::trim_inplace(body);
    if (body.empty()) return std::nullopt;

    json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        ASHELL_DBG("PARSE", "record payload not decodable (%zu bytes)", body.size());
        return std::nullopt;
    }

    auto ec = j.find("exit_code");
    if (ec == j.end()) return std::nullopt;
    auto exitCode = as_int(*ec);
    if (!exitCode) return std::nullopt;

    CompletionRecord rec{};
    rec.exitCode = *exitCode;
    if (auto pid = j.find("pid"); pid != j.end()) {
        if (auto p = as_int(*pid)) rec.pid = *p;
    }
    rec.username   = as_string(j, "username");
    rec.hostname   = as_string(j, "hostname");
    rec.workingDir = as_string(j, "working_dir");
    std::string interp = as_string(j, "interpreter_path");
    helpers::parsers::trim_inplace(interp);
    if (!interp.empty()) rec.interpreterPath = std::move(interp);
    return rec;
}

std::optional<RecordMatch> find_record(std::string_view text) {
    // An echoed command line carries the quoted markers too; such a span has
    // no decodable payload and the scan moves on to the next BEGIN.
    size_t from = 0;
    for (;;) {
        const size_t b = text.find(kBeginMarker, from);
        if (b == std::string_view::npos) return std::nullopt;

        const size_t payloadStart = b + kBeginMarker.size();
        const size_t e = text.find(kEndMarker, payloadStart);
        if (e == std::string_view::npos) return std::nullopt;

        if (auto rec = parse_record(text.substr(payloadStart, e - payloadStart))) {
            RecordMatch m{};
            m.record = std::move(*rec);
            m.begin = b;
            m.end = e + kEndMarker.size();
            return m;
        }
        from = payloadStart;
    }
}

std::string posix_json_escaper() {
    // Escapes backslash, quote and every control character (as \u00XX) so
    // any directory or host name yields a decodable record.
    std::string s;
    s.reserve(320);
    s += POSIX_JSON_FN;
    s += R"sh(() { local s="$1" o='' c; while [ -n "$s" ]; do c="${s:0:1}"; s="${s:1}"; )sh"
         R"sh(case "$c" in '\') o+='\\' ;; '"') o+='\"' ;; )sh"
         R"sh([[:cntrl:]]) printf -v c '\\u%04x' "'$c"; o+="$c" ;; *) o+="$c" ;; esac; done; )sh"
         R"sh(printf '%s' "$o"; })sh";
    return s;
}

std::string posix_record_statement(std::string_view exit_var) {
    auto escaped = [](const std::string& expr) {
        return std::string(" \"$(") + POSIX_JSON_FN + " " + expr + ")\"";
    };

    std::string s;
    s.reserve(512);
    s += "printf '\\n%s\\n{\"pid\": %s, \"exit_code\": %s, \"username\": \"%s\", "
         "\"hostname\": \"%s\", \"working_dir\": \"%s\", \"interpreter_path\": \"%s\"}\\n%s\\n' ";
    s += sh_quote(kBeginMarker);
    s += " \"$$\" \"$";
    s.append(exit_var);
    s += "\"";
    s += escaped("\"$(id -un 2>/dev/null)\"");
    s += escaped("\"$(uname -n 2>/dev/null)\"");
    s += escaped("\"$PWD\"");
    s += escaped("\"$(command -v python3 2>/dev/null || command -v python 2>/dev/null)\"");
    s += " ";
    s += sh_quote(kEndMarker);
    return s;
}

std::string posix_wrap_command(std::string_view command) {
    std::string cmd(command);
    helpers::parsers::rtrim_inplace(cmd);

    // The body travels as a quoted here-document: the shell has consumed the
    // whole request before the command runs, so a command that reads stdin
    // sees only later input, and a syntax error still reaches the record.
    std::string full;
    full.reserve(cmd.size() + 640);
    full += "IFS= read -r -d '' ";
    full += POSIX_CMD_VAR;
    full += " <<'";
    full += POSIX_HEREDOC_END;
    full += "'\n";
    full += cmd;
    full += '\n';
    full += POSIX_HEREDOC_END;
    full += "\neval \"$";
    full += POSIX_CMD_VAR;
    full += "\"; ";
    full += POSIX_EXIT_VAR;
    full += "=$?; unset ";
    full += POSIX_CMD_VAR;
    full += "; ";
    full += posix_record_statement(POSIX_EXIT_VAR);
    return full;
}

std::string posix_prompt_hook() {
    std::string s;
    s.reserve(640);
    s += posix_json_escaper();
    s += "; ";
    s += POSIX_HOOK_FN;
    s += "() { ";
    s += POSIX_EXIT_VAR;
    s += "=$?; ";
    s += posix_record_statement(POSIX_EXIT_VAR);
    s += "; }; PROMPT_COMMAND=";
    s += POSIX_HOOK_FN;
    s += "; PS1=''; PS2=''; set +H; unset HISTFILE";
    return s;
}

std::string powershell_wrap_command(std::string_view command) {
    std::string cmd(command);
    helpers::parsers::rtrim_inplace(cmd);

    std::string full;
    full.reserve(cmd.size() + 640);
    full += "$global:LASTEXITCODE = $null; ";
    full += cmd;
    // The record goes on its own line so a trailing comment in the command
    // cannot swallow it. $? must be captured before anything else runs.
    full += "\n$__as_ok = $?; Write-Host ";
    full += ps_quote(kBeginMarker);
    full += "; $__as_ec = if ($__as_ok) { if ($null -ne $LASTEXITCODE) { $LASTEXITCODE } else { 0 } } else { 1 }; "
            "$__as_py = (Get-Command python -ErrorAction SilentlyContinue | "
            "Select-Object -ExpandProperty Source -First 1); "
            "$__as_meta = @{pid=$PID; exit_code=$__as_ec; "
            "username=[Environment]::UserName; "
            "hostname=[Environment]::MachineName; "
            "working_dir=(Get-Location).Path.Replace('\\', '/'); "
            "interpreter_path=if ($__as_py) { $__as_py } else { $null }}; "
            "Write-Host (ConvertTo-Json $__as_meta -Compress); Write-Host ";
    full += ps_quote(kEndMarker);
    return full;
}

} // namespace metadata
} // namespace core
} // namespace agentshell
