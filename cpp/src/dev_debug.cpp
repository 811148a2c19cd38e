#include "dev_debug.hpp"

#include <chrono>
#include <cstdarg>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <thread>

#if defined(_WIN32) && defined(_MSC_VER)
  #pragma warning(disable : 4996) // getenv, fopen
#endif

namespace agentshell {
namespace dev {

namespace {

constexpr const char* DEFAULT_PATH = "agentshell_debug.log";

bool env_flag(const char* name) {
    const char* v = std::getenv(name);
    return v && *v == '1';
}

std::vector<std::string> split_tags(const std::string& list) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == std::string::npos) comma = list.size();
        if (comma > start) out.emplace_back(list.substr(start, comma - start));
        start = comma + 1;
    }
    return out;
}

std::string utc_timestamp() {
    const auto now    = std::chrono::system_clock::now();
    const auto secs   = std::chrono::time_point_cast<std::chrono::seconds>(now);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now - secs).count();
    const std::time_t t = std::chrono::system_clock::to_time_t(secs);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char ts[64];
    std::snprintf(ts, sizeof(ts), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<long long>(micros));
    return ts;
}

} // namespace

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() {
    if (const char* p = std::getenv("AGENTSHELL_DEBUG_PATH"); p && *p) path_ = p;
    if (const char* ex = std::getenv("AGENTSHELL_DEBUG_EXCLUDE")) excluded_ = split_tags(ex);
    if (const char* kb = std::getenv("AGENTSHELL_DEBUG_MAX_KB")) {
        maxBytes_ = std::strtoull(kb, nullptr, 10) * 1024;
    }
    stderr_.store(env_flag("AGENTSHELL_DEBUG_STDERR"));

    if (env_flag("AGENTSHELL_DEBUG")) {
        enabled_.store(true);
        logf("LOGGER", "debug enabled via AGENTSHELL_DEBUG, path=%s",
             path_.empty() ? DEFAULT_PATH : path_.c_str());
    }
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lk(mx_);
    close_nolock_();
}

void Logger::enable(bool on, std::string path) {
    std::lock_guard<std::mutex> lk(mx_);
    if (!path.empty() && path != path_) {
        close_nolock_();
        path_ = std::move(path);
    }
    enabled_.store(on, std::memory_order_relaxed);
    if (!on) close_nolock_();
}

void Logger::exclude(const std::string& tags) {
    std::lock_guard<std::mutex> lk(mx_);
    excluded_ = split_tags(tags);
}

void Logger::set_max_bytes(std::uint64_t bytes) {
    std::lock_guard<std::mutex> lk(mx_);
    maxBytes_ = bytes;
}

std::string Logger::path() const {
    std::lock_guard<std::mutex> lk(mx_);
    return path_.empty() ? std::string(DEFAULT_PATH) : path_;
}

bool Logger::is_excluded_(const char* tag) const {
    if (!tag) return false;
    for (const auto& t : excluded_) {
        if (t == tag) return true;
    }
    return false;
}

void Logger::logf(const char* tag, const char* fmt, ...) {
    if (!enabled()) return;

    char body[2048];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(body, sizeof(body), fmt, ap);
    va_end(ap);

    const auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
    const std::string ts = utc_timestamp();

    std::lock_guard<std::mutex> lk(mx_);
    if (is_excluded_(tag)) return;

    if (stderr_.load(std::memory_order_relaxed)) {
        std::fprintf(stderr, "[%s] [%s] %s\n", ts.c_str(), tag ? tag : "-", body);
    }

    if (!fh_) open_nolock_();
    if (!fh_) return;
    const int n = std::fprintf(fh_, "[%s] [%s] [tid=%llu] %s\n",
                               ts.c_str(), tag ? tag : "-", static_cast<unsigned long long>(tid), body);
    std::fflush(fh_);
    if (n > 0) written_ += static_cast<std::uint64_t>(n);
    if (maxBytes_ != 0 && written_ >= maxBytes_) rotate_nolock_();
}

void Logger::open_nolock_() {
    if (fh_) return;
    if (path_.empty()) path_ = DEFAULT_PATH;
    fh_ = std::fopen(path_.c_str(), "ab");
    if (!fh_) return;
    std::fseek(fh_, 0, SEEK_END);
    const long pos = std::ftell(fh_);
    written_ = pos > 0 ? static_cast<std::uint64_t>(pos) : 0;
    std::fprintf(fh_, "----- AgentShell debug start -----\n");
    std::fflush(fh_);
}

void Logger::close_nolock_() {
    if (!fh_) return;
    std::fprintf(fh_, "----- AgentShell debug stop ------\n");
    std::fclose(fh_);
    fh_ = nullptr;
}

void Logger::rotate_nolock_() {
    close_nolock_();
    const std::string old = path_ + ".1";
    std::remove(old.c_str());
    if (std::rename(path_.c_str(), old.c_str()) != 0) {
        // Keep appending to the same file rather than losing lines.
        std::fprintf(stderr, "agentshell: cannot rotate debug log %s\n", path_.c_str());
    }
    written_ = 0;
    open_nolock_();
}

}} // namespace agentshell::dev
