/**
 * @file test_backend_factory.cpp
 * @brief Tests for backend_factory.hpp and terminal_backend.hpp helpers
 */

#include "backend_factory.hpp"
#include "terminal_backend.hpp"

#include <catch2/catch.hpp>

#include <string>

using namespace agentshell::core;

// ============================================================================
// select_backend
// ============================================================================

TEST_CASE("select_backend honours a forced choice", "[factory]") {
  HostProbe windows;
  windows.platformShellHost = true;
  REQUIRE(select_backend(BackendChoice::RawPipe, windows) == BackendKind::RawPipe);
  REQUIRE(select_backend(BackendChoice::Multiplexer, HostProbe{}) == BackendKind::Multiplexer);
  REQUIRE(select_backend(BackendChoice::PlatformShell, HostProbe{}) == BackendKind::PlatformShell);
}

TEST_CASE("select_backend auto order", "[factory]") {
  HostProbe bare;
  REQUIRE(select_backend(BackendChoice::Auto, bare) == BackendKind::RawPipe);

  HostProbe withTmux;
  withTmux.multiplexerFound = true;
  withTmux.multiplexerPath = "/usr/bin/tmux";
  REQUIRE(select_backend(BackendChoice::Auto, withTmux) == BackendKind::Multiplexer);

  HostProbe windows = withTmux;
  windows.platformShellHost = true;
  REQUIRE(select_backend(BackendChoice::Auto, windows) == BackendKind::PlatformShell);
}

TEST_CASE("make_backend builds the requested kind without starting it", "[factory]") {
  BackendOptions opts;
  opts.workDir = "/tmp";
  for (auto kind : {BackendKind::Multiplexer, BackendKind::RawPipe, BackendKind::PlatformShell}) {
    auto backend = make_backend(kind, opts);
    REQUIRE(backend != nullptr);
    REQUIRE(backend->kind() == kind);
    REQUIRE_FALSE(backend->initialized());
    REQUIRE_FALSE(backend->is_alive());
    REQUIRE_FALSE(backend->is_busy());
  }
}

TEST_CASE("create_backend reports the forced kind", "[factory]") {
  BackendOptions opts;
  opts.config.backend = BackendChoice::RawPipe;
  BackendKind kind = BackendKind::Multiplexer;
  auto backend = create_backend(opts, &kind);
  REQUIRE(kind == BackendKind::RawPipe);
  REQUIRE(backend->kind() == BackendKind::RawPipe);
}

TEST_CASE("BackendKind names", "[factory]") {
  REQUIRE(std::string(to_string(BackendKind::Multiplexer)) == "multiplexer");
  REQUIRE(std::string(to_string(BackendKind::RawPipe)) == "raw_pipe");
  REQUIRE(std::string(to_string(BackendKind::PlatformShell)) == "platform_shell");
}

// ============================================================================
// find_executable
// ============================================================================

#ifndef _WIN32
TEST_CASE("find_executable resolves names on PATH", "[factory]") {
  auto sh = find_executable("sh");
  REQUIRE(sh.has_value());
  REQUIRE(sh->find("sh") != std::string::npos);

  REQUIRE(find_executable("/bin/sh") == std::optional<std::string>("/bin/sh"));
  REQUIRE_FALSE(find_executable("agentshell-no-such-binary").has_value());
  REQUIRE_FALSE(find_executable("").has_value());
  // A directory is never executable.
  REQUIRE_FALSE(find_executable("/tmp").has_value());
}
#endif

// ============================================================================
// Key helpers
// ============================================================================

TEST_CASE("is_interrupt_key accepts the interrupt spellings only", "[factory]") {
  REQUIRE(is_interrupt_key("C-c"));
  REQUIRE(is_interrupt_key("C-C"));
  REQUIRE(is_interrupt_key("\x03"));
  REQUIRE_FALSE(is_interrupt_key("C-d"));
  REQUIRE_FALSE(is_interrupt_key("ctrl-c"));
  REQUIRE_FALSE(is_interrupt_key(""));
}

TEST_CASE("control_key_byte maps C-<letter>", "[factory]") {
  REQUIRE(control_key_byte("C-d") == std::optional<char>('\x04'));
  REQUIRE(control_key_byte("C-Z") == std::optional<char>('\x1a'));
  REQUIRE_FALSE(control_key_byte("C-1").has_value());
  REQUIRE_FALSE(control_key_byte("C-dd").has_value());
  REQUIRE_FALSE(control_key_byte("d").has_value());
}
