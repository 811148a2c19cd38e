#include "tmux_backend.hpp"
#include "dev_debug.hpp"
#include "errors.hpp"
#include "helpers.h"
#include "metadata.hpp"
#include "subprocess_backend.hpp"

#include <stdexcept>
#include <thread>

#ifndef _WIN32
#include <unistd.h>
#endif

using agentshell::helpers::quoting::sh_quote;

namespace agentshell {
namespace core {

namespace {

constexpr std::chrono::milliseconds TMUX_CALL_TIMEOUT{5000};
constexpr std::chrono::milliseconds RECORD_POLL{20};

std::atomic<unsigned> g_session_counter{0};

long current_pid() {
#ifdef _WIN32
    return static_cast<long>(::GetCurrentProcessId());
#else
    return static_cast<long>(::getpid());
#endif
}

std::chrono::milliseconds to_ms(double sec) {
    return std::chrono::milliseconds(static_cast<long long>(sec * 1000.0));
}

} // namespace

TmuxBackend::TmuxBackend(BackendOptions opts)
    : opts_(std::move(opts)),
      socket_("agentshell-" + std::to_string(current_pid())),
      session_("agentshell-" + std::to_string(current_pid()) + "-" + std::to_string(++g_session_counter)) {}

TmuxBackend::~TmuxBackend() {
    close();
}

std::optional<CommandOutput> TmuxBackend::tmux_(std::vector<std::string> args) const {
    std::vector<std::string> argv{opts_.config.multiplexerPath, "-L", socket_};
    argv.insert(argv.end(), std::make_move_iterator(args.begin()), std::make_move_iterator(args.end()));
    auto out = run_command(argv, TMUX_CALL_TIMEOUT);
    if (!out) {
        ASHELL_DBG("ERROR", "cannot run '%s'", opts_.config.multiplexerPath.c_str());
    } else if (out->exitCode != 0) {
        ASHELL_DBG("IO", "tmux %s exited %d", argv.size() > 3 ? argv[3].c_str() : "?", out->exitCode);
    }
    return out;
}

bool TmuxBackend::tmux_ok_(std::vector<std::string> args) const {
    auto out = tmux_(std::move(args));
    return out && !out->timedOut && out->exitCode == 0;
}

std::string TmuxBackend::shell_command_() const {
    if (needs_identity_switch(opts_.username)) {
        return "su - " + sh_quote(*opts_.username) + " -s " + sh_quote(opts_.config.shellPath);
    }
    return sh_quote(opts_.config.shellPath) + " --noprofile --norc";
}

void TmuxBackend::initialize() {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (initialized_.load()) return;
    if (closed_.load()) throw NotRunningError("backend has been closed");

    ASHELL_DBG("LIFECYCLE", "tmux initialize socket=%s session=%s dir='%s'",
               socket_.c_str(), session_.c_str(), opts_.workDir.c_str());

    // history-limit only applies to panes created after it is set.
    std::vector<std::string> args{
        "start-server", ";",
        "set-option", "-g", "history-limit", std::to_string(opts_.config.historyLimit), ";",
        "new-session", "-d", "-s", session_, "-x", "1000", "-y", "1000"};
    if (!opts_.workDir.empty()) {
        args.push_back("-c");
        args.push_back(opts_.workDir);
    }
    for (const auto& [k, v] : opts_.config.environment) {
        args.push_back("-e");
        args.push_back(k + "=" + v);
    }
    args.push_back(shell_command_());

    if (!tmux_ok_(std::move(args))) {
        throw std::runtime_error("failed to create tmux session '" + session_ + "'");
    }

    try {
        if (needs_identity_switch(opts_.username)) {
            for (const auto& [k, v] : opts_.config.environment) type_("export " + k + "=" + sh_quote(v), true);
            if (!opts_.workDir.empty()) type_("cd " + sh_quote(opts_.workDir), true);
        }
        type_(metadata::posix_prompt_hook(), true);
        for (const auto& cmd : opts_.config.initialCommands) type_(cmd, true);

        if (!wait_for_record_(to_ms(opts_.config.setupWaitSeconds))) {
            if (!tmux_ok_({"has-session", "-t", session_})) throw std::runtime_error("tmux session '" + session_ + "' exited during startup");
            ASHELL_DBG("LIFECYCLE", "prompt hook not seen within %.2fs, continuing", opts_.config.setupWaitSeconds);
        }
        initialized_.store(true);
        clear_pane_();
    } catch (const std::exception& ex) {
        ASHELL_DBG("ERROR", "tmux setup failed: %s", ex.what());
        initialized_.store(false);
        closed_.store(true);
        tmux_ok_({"kill-session", "-t", session_});
        throw;
    }
}

void TmuxBackend::type_(std::string_view text, bool enter) {
    if (!text.empty() && !tmux_ok_({"send-keys", "-t", session_, "-l", "--", std::string(text)})) {
        throw NotRunningError("Cannot send keys: tmux session is not running");
    }
    if (enter && !tmux_ok_({"send-keys", "-t", session_, "Enter"})) {
        throw NotRunningError("Cannot send keys: tmux session is not running");
    }
}

std::optional<std::string> TmuxBackend::capture_() const {
    auto out = tmux_({"capture-pane", "-p", "-J", "-t", session_,
                      "-S", "-" + std::to_string(opts_.config.historyLimit)});
    if (!out || out->timedOut || out->exitCode != 0) return std::nullopt;
    // The pane is padded with blank rows up to its height.
    helpers::parsers::rtrim_inplace(out->output);
    return std::move(out->output);
}

bool TmuxBackend::wait_for_record_(std::chrono::milliseconds budget) const {
    const auto deadline = std::chrono::steady_clock::now() + budget;
    for (;;) {
        if (auto snap = capture_(); snap && metadata::find_record(*snap)) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(RECORD_POLL);
    }
}

void TmuxBackend::clear_pane_() {
    type_("clear", true);
    std::this_thread::sleep_for(to_ms(opts_.config.screenClearDelaySeconds));
    tmux_ok_({"clear-history", "-t", session_});
    if (!wait_for_record_(to_ms(opts_.config.setupWaitSeconds))) {
        ASHELL_DBG("IO", "idle record not visible after clear");
    }
}

void TmuxBackend::send(std::string_view text, bool addNewline, bool isInternal) {
    if (!initialized_.load() || closed_.load() || !is_alive()) {
        ASHELL_DBG("ERROR", "tmux send while not running");
        throw NotRunningError("Cannot send keys: terminal process is not running");
    }

    if (is_interrupt_key(text)) {
        if (!tmux_ok_({"send-keys", "-t", session_, "C-c"})) {
            throw NotRunningError("Cannot send keys: tmux session is not running");
        }
        return;
    }

    if (isInternal && control_key_byte(text)) {
        if (!tmux_ok_({"send-keys", "-t", session_, std::string(text)})) {
            throw NotRunningError("Cannot send keys: tmux session is not running");
        }
        return;
    }

    std::string trimmed(text);
    helpers::parsers::trim_inplace(trimmed);
    if (!isInternal && !trimmed.empty()) {
        clear_pane_();
        running_.store(true);
    }

    // Newlines inside the text are typed as Enter, keeping multi-line input intact.
    std::string body(text);
    if (addNewline) helpers::parsers::rtrim_inplace(body);
    ASHELL_DBG("IO", "tmux send %zu bytes internal=%d", body.size(), int(isInternal));
    type_(body, addNewline);
}

std::string TmuxBackend::read(bool clear) {
    if (!initialized_.load() || closed_.load()) return {};
    auto snap = capture_();
    if (!snap) return {};

    std::string text = std::move(*snap);
    // Drop the idle record left at the top by the last clear. Once it has
    // scrolled out of the history the first record belongs to the command.
    auto idle = metadata::find_record(text);
    if (idle && text.find_first_not_of(" \t\r\n") == idle->begin) {
        text.erase(0, idle->end);
        if (!text.empty() && text.front() == '\n') text.erase(0, 1);
    }

    if (clear && !is_busy()) clear_pane_();
    return text;
}

void TmuxBackend::clear() {
    if (is_alive()) clear_pane_();
    running_.store(false);
}

bool TmuxBackend::interrupt() {
    if (!is_alive()) return false;
    if (!running_.load()) {
        ASHELL_DBG("IO", "tmux interrupt ignored, idle");
        return false;
    }
    if (!tmux_ok_({"send-keys", "-t", session_, "C-c"})) {
        ASHELL_DBG("ERROR", "tmux failed to deliver interrupt");
        return false;
    }
    // Busy until the prompt hook prints the record; the program may trap C-c.
    return true;
}

bool TmuxBackend::is_busy() {
    if (!running_.load()) return false;
    if (!is_alive()) {
        running_.store(false);
        return false;
    }
    if (metadata::find_record(read(false))) running_.store(false);
    return running_.load();
}

bool TmuxBackend::is_alive() {
    if (!initialized_.load() || closed_.load()) return false;
    return tmux_ok_({"has-session", "-t", session_});
}

void TmuxBackend::close() noexcept {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (closed_.exchange(true)) return;
    running_.store(false);
    if (!initialized_.load()) return;

    ASHELL_DBG("LIFECYCLE", "tmux close session=%s", session_.c_str());
    try {
        if (!tmux_ok_({"kill-session", "-t", session_})) {
            ASHELL_DBG("ERROR", "kill-session %s failed", session_.c_str());
        }
    } catch (const std::exception& ex) {
        ASHELL_DBG("ERROR", "kill-session %s threw: %s", session_.c_str(), ex.what());
    }
}

} // namespace core
} // namespace agentshell
