#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>
#include <spdlog/spdlog.h>

#include "mcpserver/config/server_config.hpp"

using mcpserver::config::ParseArguments;
using mcpserver::config::ResolveLogDirectory;
using mcpserver::config::ServerConfig;
using mcpserver::config::SetupLogger;
using mcpserver::config::Usage;

TEST_CASE("ParseArguments defaults", "[Config]") {
  auto config = ParseArguments({"mcp_stdio_server"});

  REQUIRE(config.log_directory.empty());
  REQUIRE_FALSE(config.log_level.has_value());
  REQUIRE_FALSE(config.log_to_stderr);
  REQUIRE_FALSE(config.show_help);
}

TEST_CASE("ParseArguments recognized flags", "[Config]") {
  auto config = ParseArguments(
      {"mcp_stdio_server", "--log-dir=/tmp/logs", "--log-level=debug",
       "--log-stderr"});

  REQUIRE(config.log_directory == std::filesystem::path("/tmp/logs"));
  REQUIRE(config.log_level == spdlog::level::debug);
  REQUIRE(config.log_to_stderr);

  REQUIRE(ParseArguments({"prog", "--help"}).show_help);
  REQUIRE(ParseArguments({"prog", "-h"}).show_help);
  REQUIRE(
      ParseArguments({"prog", "--log-level=off"}).log_level ==
      spdlog::level::off);
}

TEST_CASE("ParseArguments rejects bad input", "[Config]") {
  REQUIRE_THROWS_AS(
      ParseArguments({"prog", "--verbose"}), std::invalid_argument);
  REQUIRE_THROWS_AS(
      ParseArguments({"prog", "--log-level=loud"}), std::invalid_argument);
  REQUIRE_THROWS_AS(
      ParseArguments({"prog", "--log-dir="}), std::invalid_argument);
}

TEST_CASE("Usage names every flag", "[Config]") {
  auto usage = Usage("mcp_stdio_server");

  REQUIRE(usage.find("mcp_stdio_server") != std::string::npos);
  REQUIRE(usage.find("--log-dir") != std::string::npos);
  REQUIRE(usage.find("--log-level") != std::string::npos);
  REQUIRE(usage.find("--log-stderr") != std::string::npos);
}

TEST_CASE("ResolveLogDirectory", "[Config]") {
  SECTION("Explicit directory wins") {
    ServerConfig config;
    config.log_directory = "/var/tmp/mcp";
    REQUIRE(
        ResolveLogDirectory(config) == std::filesystem::path("/var/tmp/mcp"));
  }

  SECTION("Default lives under HOME") {
    ::setenv("HOME", "/home/tester", 1);
    REQUIRE(
        ResolveLogDirectory(ServerConfig{}) ==
        std::filesystem::path("/home/tester/.mcpserver/logs"));
  }
}

TEST_CASE("SetupLogger writes to a file in the log directory", "[Config]") {
  auto directory =
      std::filesystem::temp_directory_path() / "mcpserver_config_test";
  std::filesystem::remove_all(directory);

  ServerConfig config;
  config.log_directory = directory;
  config.log_level = spdlog::level::warn;

  auto logger = SetupLogger(config);
  REQUIRE(logger->name() == mcpserver::config::kLoggerName);
  REQUIRE(logger->level() == spdlog::level::warn);
  REQUIRE(spdlog::get(mcpserver::config::kLoggerName) == logger);

  logger->warn("written by test");
  logger->flush();

  REQUIRE(std::filesystem::is_directory(directory));
  REQUIRE_FALSE(std::filesystem::is_empty(directory));

  spdlog::drop(mcpserver::config::kLoggerName);
  logger.reset();
  std::filesystem::remove_all(directory);
}
