#include "pipe_process.hpp"
#include "dev_debug.hpp"
#include "helpers.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

#ifndef _WIN32
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;
#else
#include <cwchar>
#include <cwctype>
#endif

namespace agentshell {
namespace core {

namespace {

constexpr size_t READ_CHUNK_SIZE = 64 * 1024;

#ifndef _WIN32
bool make_pipe(int fds[2]) {
#if defined(__linux__)
    return ::pipe2(fds, O_CLOEXEC) == 0;
#else
    if (::pipe(fds) != 0) return false;
    for (int i = 0; i < 2; ++i) {
        int f = ::fcntl(fds[i], F_GETFD, 0);
        if (f != -1) ::fcntl(fds[i], F_SETFD, f | FD_CLOEXEC);
    }
    return true;
#endif
}

void close_fd(int& fd) noexcept {
    if (fd != -1) { ::close(fd); fd = -1; }
}

// A write to a pipe whose reader is gone must fail with EPIPE rather than
// kill the host. Only a default disposition is changed.
void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction cur{};
        if (::sigaction(SIGPIPE, nullptr, &cur) == 0 && cur.sa_handler == SIG_DFL) {
            struct sigaction ign{};
            ign.sa_handler = SIG_IGN;
            ::sigemptyset(&ign.sa_mask);
            ::sigaction(SIGPIPE, &ign, nullptr);
        }
    });
}

int decode_wait_status(int status) noexcept {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}
#else
void close_handle(HANDLE& h) noexcept {
    if (h && h != INVALID_HANDLE_VALUE) ::CloseHandle(h);
    h = nullptr;
}

// CommandLineToArgvW-compatible quoting of one argument.
std::wstring quote_arg(const std::wstring& arg) {
    if (!arg.empty() && arg.find_first_of(L" \t\n\v\"") == std::wstring::npos) return arg;
    std::wstring out = L"\"";
    size_t backslashes = 0;
    for (wchar_t c : arg) {
        if (c == L'\\') { ++backslashes; continue; }
        if (c == L'"') out.append(backslashes * 2 + 1, L'\\');
        else out.append(backslashes, L'\\');
        backslashes = 0;
        out.push_back(c);
    }
    out.append(backslashes * 2, L'\\');
    out.push_back(L'"');
    return out;
}

std::wstring upper(std::wstring s) {
    std::transform(s.begin(), s.end(), s.begin(), [](wchar_t c) { return static_cast<wchar_t>(::towupper(c)); });
    return s;
}
#endif

} // namespace

PipeProcess::PipeProcess(ProcessConfig config) : config_(std::move(config)) {}

PipeProcess::~PipeProcess() {
    shutdown_streams();
    terminate(std::chrono::milliseconds(0));
    close_pipes_();
#ifdef _WIN32
    close_handle(process_info_.hProcess);
#endif
}

bool PipeProcess::start() {
    if (running_.load()) return false;
    if (!create_pipes_()) {
        ASHELL_DBG("ERROR", "pipe creation failed for '%s'", config_.program.c_str());
        return false;
    }
    if (!spawn_child_()) {
        close_pipes_();
        return false;
    }
    running_.store(true);
    return true;
}

bool PipeProcess::is_alive() noexcept {
    if (!running_.load() || exited_.load()) return false;
#ifdef _WIN32
    if (!process_info_.hProcess) return false;
    if (::WaitForSingleObject(process_info_.hProcess, 0) == WAIT_OBJECT_0) {
        DWORD code = 0;
        ::GetExitCodeProcess(process_info_.hProcess, &code);
        record_exit_(static_cast<int>(code));
        return false;
    }
    return true;
#else
    return !reap_(false);
#endif
}

void PipeProcess::record_exit_(int code) noexcept {
    exit_code_.store(code);
    exited_.store(true);
}

std::optional<int> PipeProcess::exit_code() const noexcept {
    if (!exited_.load()) return std::nullopt;
    return exit_code_.load();
}

void PipeProcess::shutdown_streams() {
    close_stdin();
    close_stdout();
}

#ifndef _WIN32

bool PipeProcess::create_pipes_() {
    if (!make_pipe(stdin_pipe_)) return false;
    if (!make_pipe(stdout_pipe_)) {
        close_fd(stdin_pipe_[0]);
        close_fd(stdin_pipe_[1]);
        return false;
    }
    return true;
}

void PipeProcess::close_pipes_() noexcept {
    std::lock_guard<std::mutex> lk(stdin_mutex_);
    close_fd(stdin_pipe_[0]);
    close_fd(stdin_pipe_[1]);
    close_fd(stdout_pipe_[0]);
    close_fd(stdout_pipe_[1]);
}

bool PipeProcess::spawn_child_() {
    ignore_sigpipe_once();

    // Everything the child needs is built before fork(); the child only
    // performs async-signal-safe calls.
    std::vector<std::string> args;
    args.reserve(config_.arguments.size() + 1);
    args.push_back(config_.program);
    args.insert(args.end(), config_.arguments.begin(), config_.arguments.end());
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> envStore;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        const auto eq = entry.find('=');
        const std::string key(entry.substr(0, eq));
        if (config_.environment.count(key)) continue;
        envStore.emplace_back(entry);
    }
    for (const auto& [k, v] : config_.environment) envStore.push_back(k + "=" + v);
    std::vector<char*> envp;
    for (auto& e : envStore) envp.push_back(e.data());
    envp.push_back(nullptr);

    const char* workDir = config_.working_directory.empty() ? nullptr : config_.working_directory.c_str();
    const int errSink = config_.merge_stderr ? -1 : ::open("/dev/null", O_WRONLY | O_CLOEXEC);

    // Reports exec()/chdir() failure; closes on successful exec.
    int execErr[2]{-1, -1};
    if (!make_pipe(execErr)) {
        if (errSink != -1) ::close(errSink);
        return false;
    }

    child_pid_ = ::fork();
    if (child_pid_ == -1) {
        ASHELL_DBG("ERROR", "fork failed errno=%d", errno);
        close_fd(execErr[0]);
        close_fd(execErr[1]);
        if (errSink != -1) ::close(errSink);
        return false;
    }

    if (child_pid_ == 0) {
        // --- Child ---
        ::setsid();

        struct sigaction dfl{};
        dfl.sa_handler = SIG_DFL;
        for (int sig = 1; sig < 32; ++sig) ::sigaction(sig, &dfl, nullptr);
        sigset_t none;
        ::sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        ::dup2(stdin_pipe_[0], STDIN_FILENO);
        ::dup2(stdout_pipe_[1], STDOUT_FILENO);
        ::dup2(config_.merge_stderr ? stdout_pipe_[1] : errSink, STDERR_FILENO);

        int err = 0;
        if (workDir && ::chdir(workDir) != 0) {
            err = errno;
        } else {
            environ = envp.data();
            ::execvp(argv[0], argv.data());
            err = errno;
        }
        ssize_t ignored = ::write(execErr[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // --- Parent ---
    close_fd(execErr[1]);
    if (errSink != -1) ::close(errSink);
    close_fd(stdin_pipe_[0]);
    close_fd(stdout_pipe_[1]);

    int childErr = 0;
    ssize_t got;
    do {
        got = ::read(execErr[0], &childErr, sizeof(childErr));
    } while (got == -1 && errno == EINTR);
    close_fd(execErr[0]);

    if (got > 0) {
        ASHELL_DBG("ERROR", "exec '%s' failed: %s", config_.program.c_str(), std::strerror(childErr));
        int status = 0;
        ::waitpid(child_pid_, &status, 0);
        record_exit_(decode_wait_status(status));
        child_pid_ = -1;
        return false;
    }

    ASHELL_DBG("LIFECYCLE", "spawned '%s' pid=%d", config_.program.c_str(), int(child_pid_));
    return true;
}

bool PipeProcess::write(std::string_view data) {
    std::lock_guard<std::mutex> lk(stdin_mutex_);
    const int fd = stdin_pipe_[1];
    if (fd == -1) return false;

    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n > 0) { p += n; left -= static_cast<size_t>(n); continue; }
        if (n == -1 && errno == EINTR) continue;
        ASHELL_DBG("IO", "stdin write failed errno=%d", errno);
        return false; // EPIPE once the shell is gone
    }
    return true;
}

std::optional<std::string> PipeProcess::read_stdout(std::chrono::milliseconds wait) {
    const int fd = stdout_pipe_[0];
    if (fd == -1) return std::nullopt;

    pollfd pfd{fd, POLLIN, 0};
    int r = ::poll(&pfd, 1, static_cast<int>(wait.count()));
    if (r == 0) return std::string{};
    if (r < 0) {
        if (errno == EINTR) return std::string{};
        return std::nullopt;
    }

    std::array<char, READ_CHUNK_SIZE> buf{};
    ssize_t got = ::read(fd, buf.data(), buf.size());
    if (got > 0) return std::string(buf.data(), static_cast<size_t>(got));
    if (got == -1 && (errno == EINTR || errno == EAGAIN)) return std::string{};
    return std::nullopt; // EOF or fatal
}

void PipeProcess::close_stdin() noexcept {
    std::lock_guard<std::mutex> lk(stdin_mutex_);
    close_fd(stdin_pipe_[1]);
}

void PipeProcess::close_stdout() noexcept {
    close_fd(stdout_pipe_[0]);
}

bool PipeProcess::reap_(bool block) noexcept {
    std::lock_guard<std::mutex> lk(wait_mutex_);
    if (exited_.load()) return true;
    if (child_pid_ <= 0) return true;

    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(child_pid_, &status, block ? 0 : WNOHANG);
    } while (r == -1 && errno == EINTR);

    if (r == child_pid_) {
        record_exit_(decode_wait_status(status));
        return true;
    }
    if (r == -1) {
        // ECHILD: reaped elsewhere; nothing left to wait for.
        record_exit_(-1);
        return true;
    }
    return false;
}

bool PipeProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (reap_(false)) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void PipeProcess::terminate(std::chrono::milliseconds grace) {
    if (child_pid_ <= 0 || exited_.load()) return;

    auto signal_group = [this](int sig) {
        if (::kill(-child_pid_, sig) != 0) ::kill(child_pid_, sig);
    };

    signal_group(SIGTERM);
    if (wait_for_exit(grace)) {
        ASHELL_DBG("LIFECYCLE", "pid=%d exited after SIGTERM", int(child_pid_));
        return;
    }

    signal_group(SIGKILL);
    if (!wait_for_exit(std::chrono::milliseconds(2000))) {
        ASHELL_DBG("ERROR", "pid=%d did not exit after SIGKILL", int(child_pid_));
        return;
    }
    ASHELL_DBG("LIFECYCLE", "pid=%d killed", int(child_pid_));
}

#else // _WIN32

bool PipeProcess::create_pipes_() {
    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    if (!::CreatePipe(&stdin_read_, &stdin_write_, &sa, 0)) return false;
    ::SetHandleInformation(stdin_write_, HANDLE_FLAG_INHERIT, 0);

    if (!::CreatePipe(&stdout_read_, &stdout_write_, &sa, 0)) {
        close_handle(stdin_read_);
        close_handle(stdin_write_);
        return false;
    }
    ::SetHandleInformation(stdout_read_, HANDLE_FLAG_INHERIT, 0);
    return true;
}

void PipeProcess::close_pipes_() noexcept {
    std::lock_guard<std::mutex> lk(stdin_mutex_);
    close_handle(stdin_read_);
    close_handle(stdin_write_);
    close_handle(stdout_read_);
    close_handle(stdout_write_);
}

std::wstring PipeProcess::build_command_line_() const {
    using helpers::win::utf8_to_wstring;
    std::wstring cmd = quote_arg(utf8_to_wstring(config_.program));
    for (const auto& a : config_.arguments) {
        cmd.push_back(L' ');
        cmd += quote_arg(utf8_to_wstring(a));
    }
    return cmd;
}

std::vector<wchar_t> PipeProcess::build_environment_block_() const {
    using helpers::win::utf8_to_wstring;

    // Upper-cased key -> "Key=Value"; keeps the block sorted and case-insensitive.
    std::map<std::wstring, std::wstring> entries;
    if (wchar_t* env = ::GetEnvironmentStringsW()) {
        for (const wchar_t* p = env; *p; p += wcslen(p) + 1) {
            std::wstring entry(p);
            const auto eq = entry.find(L'=', 1); // "=C:=C:\\" style entries start with '='
            entries[upper(entry.substr(0, eq))] = entry;
        }
        ::FreeEnvironmentStringsW(env);
    }
    for (const auto& [k, v] : config_.environment) {
        std::wstring key = utf8_to_wstring(k);
        entries[upper(key)] = key + L"=" + utf8_to_wstring(v);
    }

    std::vector<wchar_t> block;
    for (const auto& kv : entries) {
        block.insert(block.end(), kv.second.begin(), kv.second.end());
        block.push_back(L'\0');
    }
    block.push_back(L'\0');
    return block;
}

bool PipeProcess::spawn_child_() {
    using helpers::win::utf8_to_wstring;

    HANDLE errSink = nullptr;
    if (!config_.merge_stderr) {
        SECURITY_ATTRIBUTES sa{};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = TRUE;
        errSink = ::CreateFileW(L"NUL", GENERIC_WRITE, FILE_SHARE_READ | FILE_SHARE_WRITE,
                                &sa, OPEN_EXISTING, 0, nullptr);
    }

    STARTUPINFOW si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES | STARTF_USESHOWWINDOW;
    si.hStdInput  = stdin_read_;
    si.hStdOutput = stdout_write_;
    si.hStdError  = config_.merge_stderr ? stdout_write_ : errSink;
    si.wShowWindow = SW_HIDE;

    std::wstring cmdline = build_command_line_();
    std::vector<wchar_t> env = build_environment_block_();
    std::wstring cwd = utf8_to_wstring(config_.working_directory);

    const DWORD flags = CREATE_NO_WINDOW | CREATE_NEW_PROCESS_GROUP | CREATE_UNICODE_ENVIRONMENT;
    BOOL ok = ::CreateProcessW(nullptr, cmdline.data(), nullptr, nullptr, TRUE, flags,
                               env.data(), cwd.empty() ? nullptr : cwd.c_str(),
                               &si, &process_info_);
    if (errSink) close_handle(errSink);
    if (!ok) {
        ASHELL_DBG("ERROR", "CreateProcessW '%s' failed err=%lu", config_.program.c_str(), ::GetLastError());
        return false;
    }

    close_handle(process_info_.hThread);
    close_handle(stdin_read_);
    close_handle(stdout_write_);
    ASHELL_DBG("LIFECYCLE", "spawned '%s' pid=%lu", config_.program.c_str(), process_info_.dwProcessId);
    return true;
}

bool PipeProcess::write(std::string_view data) {
    std::lock_guard<std::mutex> lk(stdin_mutex_);
    if (!stdin_write_) return false;

    size_t total = 0;
    while (total < data.size()) {
        DWORD chunk = 0;
        const DWORD want = static_cast<DWORD>(std::min<size_t>(data.size() - total, 1u << 30));
        if (!::WriteFile(stdin_write_, data.data() + total, want, &chunk, nullptr)) {
            ASHELL_DBG("IO", "stdin write failed err=%lu", ::GetLastError());
            return false;
        }
        total += chunk;
    }
    return true;
}

std::optional<std::string> PipeProcess::read_stdout(std::chrono::milliseconds wait) {
    // PeekNamedPipe keeps the reader responsive to a stop request without
    // having to cancel a blocking ReadFile.
    const auto deadline = std::chrono::steady_clock::now() + wait;
    for (;;) {
        if (!stdout_read_) return std::nullopt;
        DWORD avail = 0;
        if (!::PeekNamedPipe(stdout_read_, nullptr, 0, nullptr, &avail, nullptr)) {
            return std::nullopt; // ERROR_BROKEN_PIPE: child side closed
        }
        if (avail > 0) {
            std::array<char, READ_CHUNK_SIZE> buf{};
            DWORD got = 0;
            const DWORD want = std::min<DWORD>(avail, static_cast<DWORD>(buf.size()));
            if (!::ReadFile(stdout_read_, buf.data(), want, &got, nullptr)) return std::nullopt;
            return std::string(buf.data(), got);
        }
        if (std::chrono::steady_clock::now() >= deadline) return std::string{};
        ::Sleep(10);
    }
}

void PipeProcess::close_stdin() noexcept {
    std::lock_guard<std::mutex> lk(stdin_mutex_);
    close_handle(stdin_write_);
}

void PipeProcess::close_stdout() noexcept {
    close_handle(stdout_read_);
}

bool PipeProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lk(wait_mutex_);
    if (exited_.load()) return true;
    if (!process_info_.hProcess) return true;
    if (::WaitForSingleObject(process_info_.hProcess, static_cast<DWORD>(timeout.count())) != WAIT_OBJECT_0) {
        return false;
    }
    DWORD code = 0;
    ::GetExitCodeProcess(process_info_.hProcess, &code);
    record_exit_(static_cast<int>(code));
    return true;
}

void PipeProcess::terminate(std::chrono::milliseconds grace) {
    if (!process_info_.hProcess || exited_.load()) return;
    if (wait_for_exit(grace)) return;

    ::TerminateProcess(process_info_.hProcess, 1);
    if (!wait_for_exit(std::chrono::milliseconds(2000))) {
        ASHELL_DBG("ERROR", "pid=%lu did not exit after TerminateProcess", process_info_.dwProcessId);
    }
}

#endif

std::optional<CommandOutput> run_command(const std::vector<std::string>& argv,
                                         std::chrono::milliseconds timeout,
                                         const std::map<std::string, std::string>& env) {
    if (argv.empty()) return std::nullopt;

    ProcessConfig cfg;
    cfg.program = argv.front();
    cfg.arguments.assign(argv.begin() + 1, argv.end());
    cfg.environment = env;
    cfg.merge_stderr = false;

    PipeProcess proc(std::move(cfg));
    if (!proc.start()) return std::nullopt;
    proc.close_stdin();

    CommandOutput result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        auto chunk = proc.read_stdout(std::chrono::milliseconds(20));
        if (!chunk) break;
        if (!chunk->empty()) {
            result.output += *chunk;
            continue;
        }
        if (!proc.is_alive()) {
            // Output written just before exit is still in the pipe. A
            // daemonising child may leave a grandchild holding it open, so
            // stop at the first empty read instead of waiting for EOF.
            while (auto rest = proc.read_stdout(std::chrono::milliseconds(20))) {
                if (rest->empty()) break;
                result.output += *rest;
            }
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
            break;
        }
    }

    if (result.timedOut) {
        ASHELL_DBG("TIMEOUT", "helper '%s' timed out", argv.front().c_str());
        proc.terminate(std::chrono::milliseconds(0));
    } else {
        proc.wait_for_exit(std::chrono::milliseconds(2000));
    }
    result.exitCode = proc.exit_code().value_or(-1);
    return result;
}

} // namespace core
} // namespace agentshell
