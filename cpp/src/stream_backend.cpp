#include "stream_backend.hpp"
#include "dev_debug.hpp"
#include "errors.hpp"
#include "helpers.h"
#include "metadata.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

namespace agentshell {
namespace core {

namespace {

constexpr const char* READY_TOKEN = "__AGENTSHELL_READY__";

std::chrono::milliseconds to_ms(double sec) {
    return std::chrono::milliseconds(static_cast<long long>(sec * 1000.0));
}

} // namespace

StreamBackend::StreamBackend(BackendOptions opts) : opts_(std::move(opts)) {}

StreamBackend::~StreamBackend() {
    close();
}

void StreamBackend::initialize() {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (initialized_.load()) return;
    if (closed_.load()) throw NotRunningError("backend has been closed");

    ProcessConfig pc = process_config_();
    ASHELL_DBG("LIFECYCLE", "%s initialize program='%s' dir='%s'",
               to_string(kind()), pc.program.c_str(), opts_.workDir.c_str());

    auto proc = std::make_shared<PipeProcess>(pc);
    if (!proc->start()) {
        throw std::runtime_error("failed to start shell '" + pc.program + "'");
    }

    auto buffer = std::make_shared<OutputBuffer>(opts_.config.historyLimit,
                                                 std::string(metadata::kEndMarker));
    pump_.start(proc,
                [buffer](std::string_view chunk) { buffer->append_bytes(chunk); },
                [buffer] {
                    // Transport ended on its own: flush the decoder, nothing runs anymore.
                    ASHELL_DBG("IO", "shell output stream closed");
                    buffer->finish();
                    buffer->end_command();
                });

    proc_ = std::move(proc);
    buffer_ = std::move(buffer);

    try {
        for (const auto& cmd : setup_commands_()) write_or_throw_(cmd + "\n");
        for (const auto& cmd : opts_.config.initialCommands) write_or_throw_(cmd + "\n");
        wait_ready_();
    } catch (const std::exception& ex) {
        ASHELL_DBG("ERROR", "%s setup failed: %s", to_string(kind()), ex.what());
        closed_.store(true);
        shutdown_locked_();
        throw;
    }

    initialized_.store(true);
}

void StreamBackend::wait_ready_() {
    write_or_throw_(ready_probe_(READY_TOKEN) + "\n");

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + to_ms(opts_.config.setupWaitSeconds);
    bool ready = false;
    while (clock::now() < deadline) {
        if (buffer_->drain(false).find(READY_TOKEN) != std::string::npos) {
            ready = true;
            break;
        }
        if (!proc_->is_alive()) {
            throw std::runtime_error("shell exited during startup (exit code " +
                                     std::to_string(proc_->exit_code().value_or(-1)) + ")");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    if (!ready) {
        ASHELL_DBG("LIFECYCLE", "%s readiness probe not seen within %.2fs, continuing",
                   to_string(kind()), opts_.config.setupWaitSeconds);
    }
    // Banner, setup echoes and the probe output are not part of any command.
    buffer_->clear();
}

void StreamBackend::write_or_throw_(std::string_view payload) {
    if (!proc_->write(payload)) {
        ASHELL_DBG("IO", "%s write of %zu bytes failed", to_string(kind()), payload.size());
        buffer_->end_command();
        throw NotRunningError("cannot write to shell: stream closed");
    }
}

void StreamBackend::send(std::string_view text, bool addNewline, bool isInternal) {
    if (!initialized_.load() || closed_.load() || !proc_->is_alive()) {
        ASHELL_DBG("ERROR", "%s send while not running", to_string(kind()));
        throw NotRunningError("Cannot send keys: terminal process is not running");
    }

    std::string payload;
    if (is_interrupt_key(text)) {
        payload.assign(interrupt_sequence_());
        addNewline = false;
    } else if (auto ctrl = control_key_byte(text); ctrl && isInternal) {
        // No terminal on a pipe: the program just reads the control byte.
        payload.assign(1, *ctrl);
        addNewline = false;
    } else if (!isInternal) {
        std::string trimmed(text);
        helpers::parsers::trim_inplace(trimmed);
        buffer_->clear();
        if (!trimmed.empty()) {
            payload = wrap_command_(text);
            buffer_->begin_command();
        }
    } else {
        payload.assign(text);
    }

    if (addNewline && (payload.empty() || payload.back() != '\n')) payload += '\n';
    ASHELL_DBG("IO", "%s send %zu bytes internal=%d", to_string(kind()), payload.size(), int(isInternal));
    write_or_throw_(payload);
}

std::string StreamBackend::read(bool clear) {
    if (!buffer_) return {};
    return buffer_->drain(clear);
}

OutputWindow StreamBackend::window() {
    if (!buffer_) return {};
    return buffer_->window();
}

void StreamBackend::clear() {
    if (!buffer_) return;
    if (is_alive()) {
        if (auto cmd = clear_screen_command_()) {
            send(*cmd, true, /*isInternal=*/true);
            std::this_thread::sleep_for(to_ms(opts_.config.screenClearDelaySeconds));
        }
    }
    buffer_->clear();
    buffer_->end_command();
}

bool StreamBackend::interrupt() {
    if (!is_alive()) return false;
    if (!buffer_->command_running()) {
        // Nothing in the foreground; writing the key would only corrupt the next command line.
        ASHELL_DBG("IO", "%s interrupt ignored, idle", to_string(kind()));
        return false;
    }
    if (!proc_->write(interrupt_sequence_())) {
        ASHELL_DBG("ERROR", "%s failed to deliver interrupt", to_string(kind()));
        return false;
    }
    // The child may ignore the byte; only the END marker or EOF ends the command.
    return true;
}

bool StreamBackend::is_busy() {
    if (!initialized_.load() || closed_.load()) return false;
    if (!proc_->is_alive()) {
        buffer_->end_command();
        return false;
    }
    return buffer_->command_running();
}

bool StreamBackend::is_alive() {
    return initialized_.load() && !closed_.load() && proc_ && proc_->is_alive();
}

void StreamBackend::close() noexcept {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (closed_.exchange(true)) return;
    shutdown_locked_();
}

void StreamBackend::shutdown_locked_() noexcept {
    if (!proc_) return;

    ASHELL_DBG("LIFECYCLE", "%s close", to_string(kind()));

    // 1) stop the reader, 2) ask the shell to leave and close its input
    pump_.request_stop();
    if (proc_->is_alive() && !proc_->write("exit\n")) {
        ASHELL_DBG("LIFECYCLE", "exit request not delivered");
    }
    proc_->close_stdin();

    // 3) bounded join; the read end is only closed once no read can be in flight
    if (pump_.stop(to_ms(opts_.config.readerJoinTimeoutSeconds))) {
        proc_->close_stdout();
    } else {
        ASHELL_DBG("ERROR", "Reader thread did not terminate within timeout");
    }

    // 4) graceful termination, forced kill after the grace period
    proc_->terminate(to_ms(opts_.config.terminateGraceSeconds));
    if (buffer_) buffer_->end_command();
    ASHELL_DBG("LIFECYCLE", "%s closed exit=%d", to_string(kind()), proc_->exit_code().value_or(-1));
}

} // namespace core
} // namespace agentshell
