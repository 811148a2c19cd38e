#include "io_pump.hpp"
#include "process.hpp"
#include "dev_debug.hpp"

#include <exception>
#include <optional>
#include <string>

namespace agentshell {
namespace core {

IoPump::~IoPump() {
    (void)stop(std::chrono::milliseconds(1000));
}

void IoPump::start(std::shared_ptr<Process> process, ChunkHandler onChunk, ClosedHandler onClosed) {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (thread_.joinable()) return; // already running

    state_ = std::make_shared<State>();
    exited_ = state_->exited.get_future();
    thread_ = std::thread(&IoPump::reader_loop_, state_, std::move(process),
                          std::move(onChunk), std::move(onClosed));
}

void IoPump::request_stop() noexcept {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (state_) state_->stop.store(true, std::memory_order_release);
}

bool IoPump::stop(std::chrono::milliseconds joinTimeout) {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (!thread_.joinable()) return true;
    state_->stop.store(true, std::memory_order_release);

    // WARNING: must not be called from the reader thread (join would deadlock).
    if (exited_.wait_for(joinTimeout) == std::future_status::ready) {
        thread_.join();
        return true;
    }

    ASHELL_DBG("ERROR", "reader did not exit within %lld ms, detaching",
               static_cast<long long>(joinTimeout.count()));
    thread_.detach();
    return false;
}

void IoPump::reader_loop_(std::shared_ptr<State> state,
                          std::shared_ptr<Process> process,
                          ChunkHandler onChunk,
                          ClosedHandler onClosed) {
    bool eof = false;
    try {
        while (!state->stop.load(std::memory_order_acquire)) {
            std::optional<std::string> chunk = process->read_stdout(POLL_SLICE);
            if (!chunk) { eof = true; break; }
            if (chunk->empty()) continue;
            if (onChunk) onChunk(*chunk);
        }
    } catch (const std::exception& ex) {
        // Never let a reader failure cross the thread boundary.
        ASHELL_DBG("ERROR", "reader loop failed: %s", ex.what());
        eof = true;
    }

    ASHELL_DBG("IO", "reader exit (eof=%d)", int(eof));

    if (eof && onClosed) {
        try {
            onClosed();
        } catch (const std::exception& ex) {
            ASHELL_DBG("ERROR", "reader close handler failed: %s", ex.what());
        }
    }
    state->exited.set_value();
}

} // namespace core
} // namespace agentshell
