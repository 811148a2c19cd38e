#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>

namespace agentshell {
namespace core {

/**
 * @brief Incremental UTF-8 validator/decoder.
 *
 * Bytes may arrive split at any boundary. An incomplete trailing sequence is
 * carried to the next call; invalid bytes become U+FFFD. Output is always
 * well-formed UTF-8.
 */
class Utf8Decoder {
public:
    // Decode @p bytes. With @p final set, a dangling partial sequence is
    // flushed as U+FFFD instead of being carried.
    std::string decode(std::string_view bytes, bool final = false);

private:
    std::string pending_; ///< Up to 3 bytes of an unfinished sequence
};

// Buffered text and the stream offset of its first character. The offset
// counts every character ever appended and only moves forward, so a reader
// can tell how much of the window it has already seen after evictions.
struct OutputWindow {
    std::string text{};
    uint64_t    offset{};
};

/**
 * @brief Bounded, thread-safe store of decoded output chunks.
 *
 * Capacity is a chunk count; the oldest chunk is evicted first. The reader
 * thread appends, the caller drains. One mutex guards the chunks, the
 * decoder and the command phase, and it is never held across I/O.
 *
 * When constructed with a completion marker, the phase flips back to Idle as
 * soon as that marker is appended while a command is Running (the marker may
 * straddle chunk boundaries).
 */
class OutputBuffer {
public:
    enum class Phase {
        Idle,     ///< No command in flight
        Running,  ///< Command sent, completion marker not yet seen
    };

    explicit OutputBuffer(size_t capacity, std::string completionMarker = {});

    OutputBuffer(const OutputBuffer&) = delete;
    OutputBuffer& operator=(const OutputBuffer&) = delete;

    void append(std::string chunk);
    void append_bytes(std::string_view bytes);
    // Flush a partial sequence left by the last append_bytes() (stream ended).
    void finish();

    // Snapshot joined in arrival order, optionally clearing afterwards.
    std::string drain(bool clear);
    OutputWindow window() const;
    void clear();

    void begin_command();
    void end_command();
    Phase phase() const;
    bool command_running() const { return phase() == Phase::Running; }

    size_t size() const;
    size_t capacity() const noexcept { return capacity_; }

private:
    void push_locked_(std::string chunk);
    std::string joined_locked_() const;
    void drop_all_locked_();

    const size_t      capacity_;
    const std::string marker_;

    mutable std::mutex mx_;
    std::deque<std::string> chunks_;
    Utf8Decoder decoder_;
    Phase       phase_{Phase::Idle};
    std::string markerTail_;   ///< Last marker_.size()-1 chars, for split markers
    uint64_t    base_{0};      ///< Stream offset of chunks_.front()
};

} // namespace core
} // namespace agentshell
