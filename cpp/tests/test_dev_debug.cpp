/**
 * @file test_dev_debug.cpp
 * @brief Tests for the debug file logger
 */

#include "dev_debug.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using agentshell::dev::Logger;
namespace fs = std::filesystem;

namespace {

std::string Slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

struct LoggerScope {
  fs::path path;
  explicit LoggerScope(const std::string& name)
      : path(fs::temp_directory_path() / name) {
    std::error_code ec;
    fs::remove(path, ec);
    fs::remove(path.string() + ".1", ec);
    Logger::instance().exclude("");
    Logger::instance().set_max_bytes(0);
    Logger::instance().enable(true, path.string());
  }
  ~LoggerScope() {
    Logger::instance().enable(false);
    Logger::instance().exclude("");
    Logger::instance().set_max_bytes(0);
    std::error_code ec;
    fs::remove(path, ec);
    fs::remove(path.string() + ".1", ec);
  }
};

}  // namespace

// ============================================================================
// Logger
// ============================================================================

TEST_CASE("logger writes tagged lines to the chosen path", "[logger]") {
  LoggerScope scope("agentshell-logger-basic.log");
  REQUIRE(Logger::instance().enabled());
  REQUIRE(Logger::instance().path() == scope.path.string());

  ASHELL_DBG("LIFECYCLE", "started pid=%d", 42);
  Logger::instance().enable(false);

  const std::string text = Slurp(scope.path);
  REQUIRE(text.find("[LIFECYCLE]") != std::string::npos);
  REQUIRE(text.find("started pid=42") != std::string::npos);
  REQUIRE(text.find("[tid=") != std::string::npos);
}

TEST_CASE("logger drops excluded tags", "[logger]") {
  LoggerScope scope("agentshell-logger-exclude.log");
  Logger::instance().exclude("IO,PARSE");

  ASHELL_DBG("IO", "chunk %s", "dropped");
  ASHELL_DBG("PARSE", "record %s", "dropped");
  ASHELL_DBG("RESET", "kept %s", "line");
  Logger::instance().enable(false);

  const std::string text = Slurp(scope.path);
  REQUIRE(text.find("dropped") == std::string::npos);
  REQUIRE(text.find("kept line") != std::string::npos);
}

TEST_CASE("disabled logger writes nothing", "[logger]") {
  LoggerScope scope("agentshell-logger-off.log");
  Logger::instance().enable(false);
  ASHELL_DBG("IO", "never %d", 1);
  REQUIRE_FALSE(fs::exists(scope.path));
}

TEST_CASE("logger rotates past the size limit", "[logger]") {
  LoggerScope scope("agentshell-logger-rotate.log");
  Logger::instance().set_max_bytes(512);

  const std::string filler(100, 'x');
  for (int i = 0; i < 20; ++i) {
    ASHELL_DBG("IO", "%d %s", i, filler.c_str());
  }
  Logger::instance().enable(false);

  REQUIRE(fs::exists(scope.path.string() + ".1"));
  REQUIRE(fs::file_size(scope.path.string() + ".1") >= 512);
  const std::string both = Slurp(scope.path.string() + ".1") + Slurp(scope.path);
  REQUIRE(both.find("19 " + filler) != std::string::npos);
}
