#include "terminal_session.hpp"
#include "backend_factory.hpp"
#include "dev_debug.hpp"
#include "errors.hpp"
#include "helpers.h"
#include "metadata.hpp"
#include "timeout_watcher.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <thread>

using namespace agentshell::helpers::parsers;

namespace agentshell {
namespace core {

namespace {

constexpr const char* NO_COMMAND_TO_POLL =
    "ERROR: No previous running command to retrieve logs from.";
constexpr const char* NO_COMMAND_TO_INTERACT =
    "ERROR: No previous running command to interact with.";
constexpr const char* NO_COMMAND_TO_INTERRUPT =
    "ERROR: No previous running command to interrupt.";
constexpr const char* SHELL_EXITED =
    "\n[The shell process has exited. Use reset to start a new shell.]";

// Step back to the first byte of the UTF-8 sequence containing @p pos.
size_t utf8_floor(const std::string& s, size_t pos) {
    while (pos > 0 && pos < s.size() && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80) --pos;
    return pos;
}

std::string format_seconds(double sec) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", sec);
    return buf;
}

} // namespace

std::string truncate_middle(const std::string& text, size_t maxChars) {
    if (text.size() <= maxChars) return text;
    const size_t head = utf8_floor(text, maxChars / 2);
    const size_t tail = utf8_floor(text, text.size() - (maxChars - maxChars / 2));
    std::string out;
    out.reserve(maxChars + 64);
    out.append(text, 0, head);
    out += TerminalSession::TRUNCATION_NOTICE;
    out.append(text, tail, std::string::npos);
    return out;
}

TerminalSession::TerminalSession(std::unique_ptr<TerminalBackend> backend,
                                 BackendFactory factory,
                                 std::string workDir,
                                 Config config)
    : backend_(std::move(backend)),
      factory_(std::move(factory)),
      workDir_(std::move(workDir)),
      config_(std::move(config)),
      kind_(backend_ ? backend_->kind() : BackendKind::RawPipe) {
    if (!backend_) throw std::invalid_argument("TerminalSession requires a backend");
}

TerminalSession::~TerminalSession() {
    close();
}

std::shared_ptr<TerminalBackend> TerminalSession::backend_snapshot_() const {
    std::lock_guard<std::mutex> lk(backend_mutex_);
    return backend_;
}

std::optional<std::string> TerminalSession::current_dir() const {
    std::lock_guard<std::mutex> lk(dir_mutex_);
    return currentDir_;
}

void TerminalSession::initialize() {
    if (state_.load() == State::Closed) throw NotRunningError("terminal session is closed");
    if (state_.load() != State::Uninitialized) return;

    backend_snapshot_()->initialize();
    {
        std::lock_guard<std::mutex> lk(dir_mutex_);
        if (!currentDir_) currentDir_ = workDir_;
    }
    State expected = State::Uninitialized;
    state_.compare_exchange_strong(expected, State::Ready);
    ASHELL_DBG("LIFECYCLE", "session ready backend=%s dir='%s'", to_string(kind_), workDir_.c_str());
}

void TerminalSession::mark_ready_() noexcept {
    State busy = State::Busy;
    state_.compare_exchange_strong(busy, State::Ready);
}

void TerminalSession::ensure_open_() {
    if (state_.load() == State::Closed) throw NotRunningError("terminal session is closed");
    if (state_.load() == State::Uninitialized) initialize();
}

bool TerminalSession::is_busy() {
    if (state_.load() == State::Closed) return false;
    auto backend = backend_snapshot_();
    return backend && backend->is_busy();
}

Observation TerminalSession::execute(const Action& action) {
    if (action.reset && action.isInput) {
        throw ValidationError("Cannot use reset=True with is_input=True");
    }

    std::lock_guard<std::mutex> lk(exec_mutex_);
    if (state_.load() == State::Closed) throw NotRunningError("terminal session is closed");
    if (action.reset) return reset_(action);
    ensure_open_();

    std::string trimmed = action.command;
    trim_inplace(trimmed);
    auto backend = backend_snapshot_();

    if (is_interrupt_key(trimmed)) {
        if (!inflight_ && !backend->is_busy()) {
            return error_observation_(NO_COMMAND_TO_INTERRUPT, action.command);
        }
        if (!backend->interrupt()) {
            ASHELL_DBG("IO", "interrupt key not delivered");
        }
        if (!inflight_) inflight_.emplace().command = action.command;
        Observation obs = poll_(action.timeout);
        obs.commandLabel = action.command;
        return obs;
    }

    if (action.isInput && !trimmed.empty()) {
        return send_input_(action.command, action.timeout);
    }

    if (trimmed.empty()) {
        if (!inflight_ && !backend->is_busy()) {
            return error_observation_(NO_COMMAND_TO_POLL, action.command);
        }
        if (!inflight_) inflight_.emplace();
        return poll_(action.timeout);
    }

    return run_command_(action.command, action.timeout);
}

Observation TerminalSession::run_command_(const std::string& command, std::optional<double> timeout) {
    auto backend = backend_snapshot_();
    if (backend->is_busy()) return busy_guard_(command);

    // Anything still recorded here finished while nobody was polling.
    inflight_.emplace();
    inflight_->command = command;
    State ready = State::Ready;
    state_.compare_exchange_strong(ready, State::Busy);

    ASHELL_DBG("IO", "execute '%s'", command.c_str());
    try {
        backend->send(command);
    } catch (const NotRunningError&) {
        inflight_.reset();
        mark_ready_();
        throw;
    }
    return poll_(timeout);
}

Observation TerminalSession::send_input_(const std::string& keys, std::optional<double> timeout) {
    auto backend = backend_snapshot_();
    if (!inflight_ && !backend->is_busy()) {
        return error_observation_(NO_COMMAND_TO_INTERACT, keys);
    }
    if (!inflight_) inflight_.emplace();

    ASHELL_DBG("IO", "input '%s'", keys.c_str());
    backend->send(keys, /*addNewline=*/!control_key_byte(keys), /*isInternal=*/true);

    Observation obs = poll_(timeout);
    obs.commandLabel = keys;
    return obs;
}

Observation TerminalSession::poll_(std::optional<double> timeout) {
    auto backend = backend_snapshot_();
    CmdState& S = *inflight_;

    const double silence = timeout && *timeout > 0 ? *timeout : config_.noOutputTimeoutSeconds;
    const TimeoutPolicy policy(silence, config_.hardTimeoutSeconds);
    const auto interval = std::chrono::duration<double>(config_.pollIntervalSeconds);

    // First @p len chars of the window minus what the caller has already seen.
    // Output evicted before it was ever returned is gone; the rest is kept.
    auto unseen = [&S](const OutputWindow& w, size_t len) {
        len = std::min(len, w.text.size());
        if (S.consumed <= w.offset) return w.text.substr(0, len);
        const uint64_t skip = S.consumed - w.offset;
        return skip >= len ? std::string{} : w.text.substr(static_cast<size_t>(skip), len - static_cast<size_t>(skip));
    };

    S.begin_poll(CmdState::clock::now());
    for (;;) {
        OutputWindow win = backend->window();
        const std::string& raw = win.text;
        const auto now = CmdState::clock::now();
        S.observe(raw, now);

        std::optional<metadata::RecordMatch> match = metadata::find_record(raw);
        if (!match && !backend->is_alive()) {
            // The record may have landed right before the shell went away.
            win = backend->window();
            match = metadata::find_record(raw);
            if (!match) {
                ASHELL_DBG("ERROR", "shell exited while '%s' was running", S.command.c_str());
                Observation obs;
                obs.text = shape_text_(unseen(win, raw.size()), S.consumed == 0) + SHELL_EXITED;
                obs.status = CommandStatus::Completed;
                obs.commandLabel = S.command;
                obs.workingDir = current_dir();
                inflight_.reset();
                mark_ready_();
                backend->close();
                return obs;
            }
        }

        if (match) {
            const CompletionRecord& rec = match->record;
            Observation obs;
            obs.text = shape_text_(unseen(win, match->begin), S.consumed == 0);
            obs.exitCode = rec.exitCode;
            obs.status = CommandStatus::Completed;
            obs.commandLabel = S.command;
            obs.record = rec;
            if (!rec.workingDir.empty()) {
                std::lock_guard<std::mutex> lk(dir_mutex_);
                currentDir_ = rec.workingDir;
            }
            obs.workingDir = current_dir();

            ASHELL_DBG("IO", "completed '%s' exit=%d", S.command.c_str(), rec.exitCode);
            inflight_.reset();
            mark_ready_();
            return obs;
        }

        if (auto status = policy.evaluate(S, now)) {
            Observation obs;
            obs.text = shape_text_(unseen(win, raw.size()), S.consumed == 0) + timeout_notice_(*status, policy);
            obs.status = *status;
            obs.commandLabel = S.command;
            obs.workingDir = current_dir();
            S.consumed = win.offset + raw.size();

            ASHELL_DBG("TIMEOUT", "'%s' %s after %.1fs", S.command.c_str(), to_string(*status),
                       std::chrono::duration<double>(now - S.tStart).count());
            return obs;
        }

        std::this_thread::sleep_for(interval);
    }
}

Observation TerminalSession::reset_(const Action& action) {
    ASHELL_DBG("RESET", "resetting %s session, restoring '%s'", to_string(kind_), workDir_.c_str());

    if (auto old = backend_snapshot_()) old->close();
    inflight_.reset();

    std::shared_ptr<TerminalBackend> fresh(factory_());
    {
        std::lock_guard<std::mutex> lk(backend_mutex_);
        backend_ = fresh;
    }
    {
        std::lock_guard<std::mutex> lk(dir_mutex_);
        currentDir_ = workDir_;
    }
    State cur = state_.load();
    if (cur == State::Closed || !state_.compare_exchange_strong(cur, State::Uninitialized)) {
        throw NotRunningError("terminal session is closed");
    }
    initialize();

    std::string trimmed = action.command;
    trim_inplace(trimmed);
    if (trimmed.empty()) {
        Observation obs;
        obs.text = RESET_NOTICE;
        obs.status = CommandStatus::Completed;
        obs.commandLabel = "[RESET]";
        obs.workingDir = workDir_;
        return obs;
    }

    Observation obs = run_command_(action.command, action.timeout);
    obs.text = std::string(RESET_NOTICE) + "\n\n" + obs.text;
    obs.commandLabel = "[RESET] " + action.command;
    return obs;
}

Observation TerminalSession::busy_guard_(const std::string& command) const {
    const std::string running = inflight_ ? inflight_->command : std::string{};
    Observation obs;
    obs.text = "[Your command \"" + command + "\" is NOT executed. The previous command" +
               (running.empty() ? std::string{} : " \"" + running + "\"") +
               " is still running - You CANNOT send new commands until the previous command is completed. "
               "By setting `is_input` to `true`, you can interact with the current process: "
               "You may wait longer to see additional output by sending empty command '', "
               "send other commands to interact with the current process, "
               "or send keys (\"C-c\", \"C-z\", \"C-d\") to interrupt/kill the previous command before sending your new command.]";
    obs.status = CommandStatus::Running;
    obs.commandLabel = command;
    obs.workingDir = current_dir();
    return obs;
}

Observation TerminalSession::error_observation_(std::string text, const std::string& label) const {
    Observation obs;
    obs.text = std::move(text);
    obs.status = CommandStatus::Completed;
    obs.commandLabel = label;
    obs.workingDir = current_dir();
    return obs;
}

std::string TerminalSession::shape_text_(std::string raw, bool stripEcho) const {
    std::string text = normalize_newlines(raw);

    // Panes echo the typed command line ahead of its output.
    if (stripEcho && inflight_ && !inflight_->command.empty()) {
        std::string echo = normalize_newlines(inflight_->command);
        rtrim_inplace(echo);
        size_t lead = 0;
        while (lead < text.size() && text[lead] == '\n') ++lead;
        if (!echo.empty() && text.compare(lead, echo.size(), echo) == 0) {
            text.erase(0, lead + echo.size());
            if (!text.empty() && text.front() == '\n') text.erase(0, 1);
        }
    }

    rtrim_inplace(text);
    return truncate_middle(text, config_.maxOutputChars);
}

std::string TerminalSession::timeout_notice_(CommandStatus status, const TimeoutPolicy& policy) const {
    using seconds = std::chrono::duration<double>;
    std::string head = status == CommandStatus::HardTimeout
        ? "\n[The command timed out after " + format_seconds(seconds(policy.hard()).count()) + " seconds."
        : "\n[The command has no new output after " + format_seconds(seconds(policy.silence()).count()) + " seconds.";
    return head +
           " You may wait longer to see additional output by sending empty command '', "
           "send other commands to interact with the current process, "
           "send keys (\"C-c\", \"C-z\", \"C-d\") to interrupt/kill the previous command before sending your new command, "
           "or use the timeout parameter for future commands.]";
}

bool TerminalSession::interrupt() {
    if (state_.load() == State::Closed) return false;
    auto backend = backend_snapshot_();
    if (!backend) return false;
    const bool delivered = backend->interrupt();
    ASHELL_DBG("IO", "session interrupt delivered=%d", int(delivered));
    return delivered;
}

void TerminalSession::close() noexcept {
    if (state_.exchange(State::Closed) == State::Closed) return;
    ASHELL_DBG("LIFECYCLE", "session close backend=%s", to_string(kind_));
    if (auto backend = backend_snapshot_()) backend->close();
}

std::unique_ptr<TerminalSession> create_terminal_session(const std::string& workDir,
                                                         const std::optional<std::string>& username,
                                                         const Config& config) {
    config.validate();

    BackendOptions opts{workDir, username, config};
    BackendKind kind = BackendKind::RawPipe;
    auto backend = create_backend(opts, &kind);

    // Reset rebuilds the same kind, always bound to the original directory.
    auto factory = [opts, kind]() { return make_backend(kind, opts); };
    return std::make_unique<TerminalSession>(std::move(backend), std::move(factory), workDir, config);
}

} // namespace core
} // namespace agentshell
