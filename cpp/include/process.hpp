#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace agentshell {
namespace core {

/**
 * @brief Byte-stream view of a child process, as consumed by IoPump.
 */
class Process {
public:
    virtual ~Process() = default;

    virtual bool write(std::string_view data) = 0;

    /**
     * @brief Wait up to @p wait for output.
     * @return Bytes read, an empty string when nothing arrived in time, or
     *         nullopt once the stream is closed (EOF, broken pipe, closed handle).
     */
    virtual std::optional<std::string> read_stdout(std::chrono::milliseconds wait) = 0;

    virtual void shutdown_streams() = 0;
};

} // namespace core
} // namespace agentshell
