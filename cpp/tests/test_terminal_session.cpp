/**
 * @file test_terminal_session.cpp
 * @brief Tests for terminal_session.hpp against a scripted backend
 */

#include "errors.hpp"
#include "metadata.hpp"
#include "terminal_session.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace agentshell::core;

// ============================================================================
// Scripted backend
// ============================================================================

namespace {

struct SentKeys {
  std::string text;
  bool addNewline;
  bool isInternal;
};

// Shell state shared by every backend a session creates (reset builds a new one).
struct FakeShell {
  struct Reply {
    std::string output;
    std::optional<int> exitCode;  ///< nullopt: the command keeps running
  };

  std::map<std::string, Reply> replies;
  std::string screen;
  uint64_t evicted = 0;  ///< Characters dropped from the front of screen so far
  std::string cwd = "/work";
  bool running = false;
  bool alive = true;
  bool echo = false;  ///< Prefix output with the command line, like a pane does
  bool trapsInterrupt = false;  ///< Foreground program ignores C-c

  std::vector<SentKeys> sent;
  int created = 0;
  int initialized = 0;
  int closed = 0;
  int interrupts = 0;

  std::string record(int exitCode) const {
    return "\n" + std::string(metadata::kBeginMarker) + "\n{\"pid\": 100, \"exit_code\": " +
           std::to_string(exitCode) + ", \"username\": \"dev\", \"hostname\": \"box\", \"working_dir\": \"" +
           cwd + "\"}\n" + std::string(metadata::kEndMarker) + "\n";
  }

  void drop_front(size_t n) {
    n = std::min(n, screen.size());
    evicted += n;
    screen.erase(0, n);
  }

  void finish(const std::string& output, int exitCode) {
    screen += output + record(exitCode);
    running = false;
  }
};

class FakeBackend final : public TerminalBackend {
 public:
  explicit FakeBackend(std::shared_ptr<FakeShell> shell) : shell_(std::move(shell)) { ++shell_->created; }
  ~FakeBackend() override { close(); }

  BackendKind kind() const noexcept override { return BackendKind::RawPipe; }

  void initialize() override {
    if (initialized_) return;
    initialized_ = true;
    ++shell_->initialized;
    shell_->drop_front(shell_->screen.size());
    shell_->running = false;
    shell_->alive = true;
  }

  void send(std::string_view text, bool addNewline, bool isInternal) override {
    if (!is_alive()) throw NotRunningError("Cannot send keys: terminal process is not running");
    shell_->sent.push_back({std::string(text), addNewline, isInternal});
    if (isInternal) {
      auto it = shell_->replies.find(std::string(text));
      if (it != shell_->replies.end() && shell_->running) {
        if (it->second.exitCode) shell_->finish(it->second.output, *it->second.exitCode);
        else shell_->screen += it->second.output;
      }
      return;
    }

    shell_->drop_front(shell_->screen.size());
    if (shell_->echo) shell_->screen += std::string(text) + "\n";
    shell_->running = true;
    auto it = shell_->replies.find(std::string(text));
    if (it == shell_->replies.end()) {
      shell_->finish("", 0);
    } else if (it->second.exitCode) {
      shell_->finish(it->second.output, *it->second.exitCode);
    } else {
      shell_->screen += it->second.output;
    }
  }

  std::string read(bool clear) override {
    std::string out = shell_->screen;
    if (clear) shell_->drop_front(out.size());
    return out;
  }

  OutputWindow window() override { return OutputWindow{shell_->screen, shell_->evicted}; }

  void clear() override {
    shell_->drop_front(shell_->screen.size());
    shell_->running = false;
  }

  bool interrupt() override {
    if (!is_alive() || !shell_->running) return false;
    ++shell_->interrupts;
    if (!shell_->trapsInterrupt) shell_->finish("^C", 130);
    return true;
  }

  bool is_busy() override { return is_alive() && shell_->running; }
  bool is_alive() override { return initialized_ && !closed_ && shell_->alive; }

  void close() noexcept override {
    if (closed_) return;
    closed_ = true;
    ++shell_->closed;
  }

  bool initialized() const noexcept override { return initialized_; }
  bool closed() const noexcept override { return closed_; }

 private:
  std::shared_ptr<FakeShell> shell_;
  bool initialized_ = false;
  bool closed_ = false;
};

Config FastConfig() {
  Config cfg;
  cfg.pollIntervalSeconds = 0.01;
  cfg.noOutputTimeoutSeconds = 0.2;
  cfg.hardTimeoutSeconds = 5.0;
  return cfg;
}

std::unique_ptr<TerminalSession> MakeSession(const std::shared_ptr<FakeShell>& shell,
                                             Config cfg = FastConfig()) {
  return std::make_unique<TerminalSession>(
      std::make_unique<FakeBackend>(shell),
      [shell] { return std::make_unique<FakeBackend>(shell); },
      "/work", cfg);
}

Action Cmd(std::string command, std::optional<double> timeout = std::nullopt) {
  Action a;
  a.command = std::move(command);
  a.timeout = timeout;
  return a;
}

Action Input(std::string keys) {
  Action a;
  a.command = std::move(keys);
  a.isInput = true;
  return a;
}

Action Reset(std::string command = {}) {
  Action a;
  a.command = std::move(command);
  a.reset = true;
  return a;
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

// ============================================================================
// Validation and lifecycle
// ============================================================================

TEST_CASE("reset with is_input is rejected before any I/O", "[session]") {
  auto shell = std::make_shared<FakeShell>();
  auto session = MakeSession(shell);

  Action bad = Reset("ls");
  bad.isInput = true;
  REQUIRE_THROWS_AS(session->execute(bad), ValidationError);
  REQUIRE(shell->initialized == 0);
  REQUIRE(shell->sent.empty());
  REQUIRE(session->state() == TerminalSession::State::Uninitialized);
}

TEST_CASE("first execute initializes lazily", "[session]") {
  auto shell = std::make_shared<FakeShell>();
  auto session = MakeSession(shell);
  REQUIRE(session->state() == TerminalSession::State::Uninitialized);

  shell->replies["echo hi"] = {"hi", 0};
  Observation obs = session->execute(Cmd("echo hi"));
  REQUIRE(shell->initialized == 1);
  REQUIRE(session->state() == TerminalSession::State::Ready);
  REQUIRE(obs.text == "hi");
  REQUIRE(obs.exitCode == std::optional<int>(0));
  REQUIRE(obs.status == CommandStatus::Completed);
  REQUIRE(obs.commandLabel == "echo hi");
  REQUIRE(obs.workingDir == std::optional<std::string>("/work"));
  REQUIRE(obs.record.has_value());
  REQUIRE(obs.record->username == "dev");
}

TEST_CASE("close is idempotent and later calls fail", "[session]") {
  auto shell = std::make_shared<FakeShell>();
  auto session = MakeSession(shell);
  session->execute(Cmd("true"));

  session->close();
  session->close();
  REQUIRE(shell->closed == 1);
  REQUIRE(session->state() == TerminalSession::State::Closed);
  REQUIRE_THROWS_AS(session->execute(Cmd("true")), NotRunningError);
  REQUIRE_FALSE(session->interrupt());
  REQUIRE_FALSE(session->is_busy());
}

// ============================================================================
// Completion and working directory
// ============================================================================

TEST_CASE("working directory follows the completion record", "[session]") {
  auto shell = std::make_shared<FakeShell>();
  auto session = MakeSession(shell);
  session->execute(Cmd("true"));
  REQUIRE(session->current_dir() == std::optional<std::string>("/work"));

  shell->cwd = "/work/sub";
  Observation obs = session->execute(Cmd("cd sub"));
  REQUIRE(obs.workingDir == std::optional<std::string>("/work/sub"));
  REQUIRE(session->current_dir() == std::optional<std::string>("/work/sub"));
  REQUIRE(session->work_dir() == "/work");
}

TEST_CASE("non-zero exit codes are reported", "[session]") {
  auto shell = std::make_shared<FakeShell>();
  shell->replies["false"] = {"", 1};
  auto session = MakeSession(shell);
  Observation obs = session->execute(Cmd("false"));
  REQUIRE(obs.exitCode == std::optional<int>(1));
  REQUIRE(obs.text.empty());
}

TEST_CASE("echoed command line is removed from the output", "[session]") {
  auto shell = std::make_shared<FakeShell>();
  shell->echo = true;
  shell->replies["echo hi"] = {"hi", 0};
  auto session = MakeSession(shell);
  Observation obs = session->execute(Cmd("echo hi"));
  REQUIRE(obs.text == "hi");
}

TEST_CASE("CRLF output is normalised", "[session]") {
  auto shell = std::make_shared<FakeShell>();
  shell->replies["dir"] = {"a\r\nb\r\n", 0};
  auto session = MakeSession(shell);
  REQUIRE(session->execute(Cmd("dir")).text == "a\nb");
}

// ============================================================================
// Timeouts and continuation
// ============================================================================

TEST_CASE("silent command times out and keeps running", "[session]") {
  auto shell = std::make_shared<FakeShell>();
  shell->replies["slow"] = {"part1\n", std::nullopt};
  auto session = MakeSession(shell);

  Observation first = session->execute(Cmd("slow", 0.1));
  REQUIRE(first.status == CommandStatus::NoOutputTimeout);
  REQUIRE_FALSE(first.exitCode.has_value());
  REQUIRE(Contains(first.text, "part1"));
  REQUIRE(Contains(first.text, "no new output after 0.1 seconds"));
  REQUIRE(session->state() == TerminalSession::State::Busy);
  REQUIRE(session->is_busy());

  SECTION("empty command returns only new output") {
    shell->finish("part2", 0);
    Observation next = session->execute(Cmd(""));
    REQUIRE(next.status == CommandStatus::Completed);
    REQUIRE(next.text == "part2");
    REQUIRE(next.exitCode == std::optional<int>(0));
    REQUIRE(next.commandLabel == "slow");
    REQUIRE(session->state() == TerminalSession::State::Ready);
  }

  SECTION("continuation survives eviction of seen output") {
    shell->screen += "part2\npart3\n";
    shell->drop_front(6);  // "part1\n" slid out of the window
    shell->finish("part4", 0);
    Observation next = session->execute(Cmd(""));
    REQUIRE(next.status == CommandStatus::Completed);
    REQUIRE(next.text == "part2\npart3\npart4");
  }

  SECTION("continuation after a partial eviction") {
    shell->screen += "part2\n";
    shell->drop_front(3);  // only "par" is gone, "t1\n" was already returned
    shell->finish("part3", 0);
    Observation next = session->execute(Cmd(""));
    REQUIRE(next.text == "part2\npart3");
  }

  SECTION("a new command is refused while the old one runs") {
    const size_t sentBefore = shell->sent.size();
    Observation guard = session->execute(Cmd("ls"));
    REQUIRE(guard.status == CommandStatus::Running);
    REQUIRE(Contains(guard.text, "NOT executed"));
    REQUIRE(Contains(guard.text, "\"slow\""));
    REQUIRE(shell->sent.size() == sentBefore);
  }

  SECTION("input reaches the running program") {
    shell->replies["y"] = {"answered", 0};
    Observation obs = session->execute(Input("y"));
    REQUIRE(shell->sent.back().text == "y");
    REQUIRE(shell->sent.back().isInternal);
    REQUIRE(shell->sent.back().addNewline);
    REQUIRE(obs.status == CommandStatus::Completed);
    REQUIRE(obs.text == "answered");
    REQUIRE(obs.commandLabel == "y");
  }

  SECTION("control keys go out without a newline") {
    session->execute(Input("C-d"));
    REQUIRE(shell->sent.back().text == "C-d");
    REQUIRE_FALSE(shell->sent.back().addNewline);
  }

  SECTION("C-c interrupts it") {
    Observation obs = session->execute(Cmd("C-c"));
    REQUIRE(shell->interrupts == 1);
    REQUIRE(obs.status == CommandStatus::Completed);
    REQUIRE(obs.exitCode == std::optional<int>(130));
    REQUIRE(obs.commandLabel == "C-c");
  }

  SECTION("an ignored interrupt leaves the command running") {
    shell->trapsInterrupt = true;
    Observation obs = session->execute(Cmd("C-c", 0.1));
    REQUIRE(shell->interrupts == 1);
    REQUIRE(obs.status == CommandStatus::NoOutputTimeout);
    REQUIRE(session->is_busy());

    const size_t sentBefore = shell->sent.size();
    Observation guard = session->execute(Cmd("echo X"));
    REQUIRE(guard.status == CommandStatus::Running);
    REQUIRE(shell->sent.size() == sentBefore);

    shell->finish("late", 0);
    Observation rest = session->execute(Cmd(""));
    REQUIRE(rest.status == CommandStatus::Completed);
    REQUIRE(rest.text == "late");
  }

  SECTION("interrupt() from the caller") {
    REQUIRE(session->interrupt());
    REQUIRE(shell->interrupts == 1);
    Observation obs = session->execute(Cmd(""));
    REQUIRE(obs.exitCode == std::optional<int>(130));
  }
}

TEST_CASE("hard timeout caps a chatty command", "[session]") {
  auto shell = std::make_shared<FakeShell>();
  shell->replies["chatty"] = {"tick\n", std::nullopt};
  Config cfg = FastConfig();
  cfg.noOutputTimeoutSeconds = 10.0;
  cfg.hardTimeoutSeconds = 0.2;
  auto session = MakeSession(shell, cfg);

  Observation obs = session->execute(Cmd("chatty"));
  REQUIRE(obs.status == CommandStatus::HardTimeout);
  REQUIRE(Contains(obs.text, "timed out after 0.2 seconds"));
}

TEST_CASE("shell exit during a command is reported", "[session]") {
  auto shell = std::make_shared<FakeShell>();
  shell->replies["exit"] = {"bye\n", std::nullopt};
  auto session = MakeSession(shell);

  session->execute(Cmd("true"));
  shell->alive = false;
  REQUIRE_THROWS_AS(session->execute(Cmd("exit")), NotRunningError);
  REQUIRE(session->state() == TerminalSession::State::Ready);

  SECTION("reset brings it back") {
    Observation obs = session->execute(Reset());
    REQUIRE(obs.commandLabel == "[RESET]");
    shell->replies["echo back"] = {"back", 0};
    REQUIRE(session->execute(Cmd("echo back")).text == "back");
  }
}

TEST_CASE("process dying while polled ends the command", "[session]") {
  auto shell = std::make_shared<FakeShell>();
  shell->replies["slow"] = {"partial\n", std::nullopt};
  auto session = MakeSession(shell);
  session->execute(Cmd("slow", 0.05));

  shell->alive = false;
  Observation obs = session->execute(Cmd(""));
  REQUIRE(obs.status == CommandStatus::Completed);
  REQUIRE_FALSE(obs.exitCode.has_value());
  REQUIRE(Contains(obs.text, "shell process has exited"));
  REQUIRE(shell->closed == 1);
}

// ============================================================================
// Nothing running
// ============================================================================

TEST_CASE("requests that need a running command fail softly when idle", "[session]") {
  auto shell = std::make_shared<FakeShell>();
  auto session = MakeSession(shell);

  Observation poll = session->execute(Cmd(""));
  REQUIRE(poll.text == "ERROR: No previous running command to retrieve logs from.");
  REQUIRE_FALSE(poll.exitCode.has_value());

  Observation input = session->execute(Input("y"));
  REQUIRE(input.text == "ERROR: No previous running command to interact with.");

  Observation ctrl = session->execute(Cmd("C-c"));
  REQUIRE(Contains(ctrl.text, "No previous running command"));

  REQUIRE_FALSE(session->interrupt());
  REQUIRE(shell->interrupts == 0);
  REQUIRE(shell->sent.empty());
}

// ============================================================================
// Reset
// ============================================================================

TEST_CASE("reset replaces the shell", "[session]") {
  auto shell = std::make_shared<FakeShell>();
  auto session = MakeSession(shell);
  shell->cwd = "/elsewhere";
  session->execute(Cmd("cd /elsewhere"));
  REQUIRE(session->current_dir() == std::optional<std::string>("/elsewhere"));

  SECTION("without a command") {
    Observation obs = session->execute(Reset());
    REQUIRE(obs.commandLabel == "[RESET]");
    REQUIRE(Contains(obs.text, "Terminal session has been reset"));
    REQUIRE(obs.status == CommandStatus::Completed);
    REQUIRE(obs.workingDir == std::optional<std::string>("/work"));
    REQUIRE(shell->created == 2);
    REQUIRE(shell->closed == 1);
    REQUIRE(session->current_dir() == std::optional<std::string>("/work"));
  }

  SECTION("with a command") {
    shell->cwd = "/work";
    shell->replies["echo again"] = {"again", 0};
    Observation obs = session->execute(Reset("echo again"));
    REQUIRE(obs.commandLabel == "[RESET] echo again");
    REQUIRE(obs.text.rfind(TerminalSession::RESET_NOTICE, 0) == 0);
    REQUIRE(Contains(obs.text, "again"));
    REQUIRE(obs.exitCode == std::optional<int>(0));
  }

  SECTION("while a command is still running") {
    shell->replies["slow"] = {"", std::nullopt};
    session->execute(Cmd("slow", 0.05));
    REQUIRE(session->is_busy());
    session->execute(Reset());
    REQUIRE_FALSE(session->is_busy());
    REQUIRE(session->state() == TerminalSession::State::Ready);
  }
}

// ============================================================================
// Output shaping
// ============================================================================

TEST_CASE("long output keeps head and tail", "[session]") {
  auto shell = std::make_shared<FakeShell>();
  shell->replies["big"] = {std::string(500, 'a') + std::string(500, 'z'), 0};
  Config cfg = FastConfig();
  cfg.maxOutputChars = 100;
  auto session = MakeSession(shell, cfg);

  Observation obs = session->execute(Cmd("big"));
  REQUIRE(Contains(obs.text, "Observation truncated"));
  REQUIRE(obs.text.front() == 'a');
  REQUIRE(obs.text.back() == 'z');
  REQUIRE(obs.text.size() <= 100 + std::string(TerminalSession::TRUNCATION_NOTICE).size());
}

TEST_CASE("truncate_middle never splits a character", "[session]") {
  REQUIRE(truncate_middle("short", 100) == "short");

  std::string text;
  for (int i = 0; i < 50; ++i) text += "\xC3\xA9";  // 100 bytes of U+00E9
  const std::string out = truncate_middle(text, 11);
  const std::string notice = TerminalSession::TRUNCATION_NOTICE;
  const size_t at = out.find(notice);
  REQUIRE(at != std::string::npos);
  REQUIRE(at % 2 == 0);
  REQUIRE((out.size() - at - notice.size()) % 2 == 0);
}
