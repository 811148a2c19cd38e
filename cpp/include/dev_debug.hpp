#pragma once

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

// Environment switches, read once when the logger is first used:
// AGENTSHELL_DEBUG=1                    enable
// AGENTSHELL_DEBUG_PATH=/tmp/as.log     log file (default agentshell_debug.log)
// AGENTSHELL_DEBUG_EXCLUDE=IO,PARSE     tags to drop
// AGENTSHELL_DEBUG_STDERR=1             mirror every line to stderr
// AGENTSHELL_DEBUG_MAX_KB=4096          rotate to <path>.1 past this size

namespace agentshell {
namespace dev {

/**
 * @brief Process-wide, thread-safe debug logger (file opened lazily).
 *
 * Lines look like `[2024-01-01T00:00:00.000000Z] [TAG] [tid=...] message`.
 * Disabled by default; enabled() is a relaxed atomic load so a disabled
 * ASHELL_DBG costs one branch.
 */
class Logger {
public:
    static Logger& instance();

    // If @p path is empty the current (or default) path is kept.
    void enable(bool on, std::string path = {});
    bool enabled() const noexcept { return enabled_.load(std::memory_order_relaxed); }

    // Comma separated list, replaces the current exclusion set.
    void exclude(const std::string& tags);
    void mirror_to_stderr(bool on) noexcept { stderr_.store(on, std::memory_order_relaxed); }
    // 0 disables rotation.
    void set_max_bytes(std::uint64_t bytes);

    std::string path() const;

    // printf-style; the message is cut at 2 KiB.
    void logf(const char* tag, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool is_excluded_(const char* tag) const;
    void open_nolock_();
    void close_nolock_();
    void rotate_nolock_();

    std::atomic<bool> enabled_{false};
    std::atomic<bool> stderr_{false};

    mutable std::mutex mx_;
    std::string path_;
    std::vector<std::string> excluded_;
    std::uint64_t maxBytes_{0};
    std::uint64_t written_{0};
    std::FILE* fh_{nullptr};
};

}} // namespace agentshell::dev

// Convenience macro (keeps callsites short)
#define ASHELL_DBG(TAG, FMT, ...) \
    do { if (::agentshell::dev::Logger::instance().enabled()) \
        ::agentshell::dev::Logger::instance().logf(TAG, FMT, ##__VA_ARGS__); } while(0)
