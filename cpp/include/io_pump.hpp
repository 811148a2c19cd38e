#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>

namespace agentshell {
namespace core {

class Process; // see process.hpp

/**
 * @brief Background reader draining one process output stream.
 *
 * The worker holds its own references to the process and to whatever the
 * handlers capture, so a reader that fails to join in time can be detached
 * without dangling.
 */
class IoPump {
public:
    using ChunkHandler  = std::function<void(std::string_view chunk)>;
    using ClosedHandler = std::function<void()>;

    IoPump() = default;
    ~IoPump();

    IoPump(const IoPump&) = delete;
    IoPump& operator=(const IoPump&) = delete;

    /**
     * @brief Spawn the reader thread.
     * @param onChunk  Called on the reader thread for every chunk, in order.
     * @param onClosed Called once when the stream ends on its own (EOF or error),
     *                 not when stop() was requested.
     */
    void start(std::shared_ptr<Process> process, ChunkHandler onChunk, ClosedHandler onClosed = {});

    void request_stop() noexcept;

    /**
     * @brief Request stop and join with a bounded wait.
     * @return true when the reader exited, false when it was detached.
     */
    bool stop(std::chrono::milliseconds joinTimeout);

    static constexpr std::chrono::milliseconds POLL_SLICE{100};

private:
    struct State {
        std::atomic<bool>  stop{false};
        std::promise<void> exited;
    };

    static void reader_loop_(std::shared_ptr<State> state,
                             std::shared_ptr<Process> process,
                             ChunkHandler onChunk,
                             ClosedHandler onClosed);

    mutable std::mutex lifecycle_mutex_;
    std::shared_ptr<State> state_;
    std::future<void> exited_;
    std::thread thread_;
};

} // namespace core
} // namespace agentshell
