#include "mcpserver/config/server_config.hpp"

#include <cstdlib>
#include <stdexcept>

#include <fmt/core.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mcpserver::config {

namespace {

constexpr std::string_view kLogDirPrefix = "--log-dir=";
constexpr std::string_view kLogLevelPrefix = "--log-level=";

auto ParseLevel(std::string_view name) -> spdlog::level::level_enum {
  auto level = spdlog::level::from_str(std::string(name));
  // from_str answers "off" for anything it does not know.
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument(
        fmt::format("Unknown log level: {}", std::string(name)));
  }
  return level;
}

}  // namespace

auto ParseArguments(const std::vector<std::string>& args) -> ServerConfig {
  ServerConfig config;

  for (std::size_t i = 1; i < args.size(); ++i) {
    std::string_view arg = args[i];

    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
    } else if (arg == "--log-stderr") {
      config.log_to_stderr = true;
    } else if (arg.starts_with(kLogDirPrefix)) {
      auto value = arg.substr(kLogDirPrefix.size());
      if (value.empty()) {
        throw std::invalid_argument("--log-dir requires a path");
      }
      config.log_directory = std::filesystem::path(value);
    } else if (arg.starts_with(kLogLevelPrefix)) {
      config.log_level = ParseLevel(arg.substr(kLogLevelPrefix.size()));
    } else {
      throw std::invalid_argument(
          fmt::format("Unknown argument: {}", std::string(arg)));
    }
  }

  return config;
}

auto Usage(const std::string& program) -> std::string {
  return fmt::format(
      "Usage: {} [--log-dir=<path>] [--log-level=<level>] [--log-stderr]\n"
      "\n"
      "Serves MCP JSON-RPC messages, one per line, on stdin/stdout.\n"
      "\n"
      "  --log-dir=<path>     directory for {} (default $HOME/.mcpserver/logs)\n"
      "  --log-level=<level>  trace, debug, info, warn, error, critical, off\n"
      "  --log-stderr         also write log lines to stderr\n"
      "\n"
      "SPDLOG_LEVEL is honoured when --log-level is not given.\n",
      program, kLogFileName);
}

auto ResolveLogDirectory(const ServerConfig& config) -> std::filesystem::path {
  if (!config.log_directory.empty()) {
    return config.log_directory;
  }

  const char* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    throw std::runtime_error(
        "Failed to get user home directory; pass --log-dir=<path>");
  }
  return std::filesystem::path(home) / ".mcpserver" / "logs";
}

auto SetupLogger(const ServerConfig& config)
    -> std::shared_ptr<spdlog::logger> {
  auto directory = ResolveLogDirectory(config);

  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    throw std::runtime_error(fmt::format(
        "Failed to create log directory {}: {}", directory.string(),
        ec.message()));
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::daily_file_sink_mt>(
      (directory / kLogFileName).string(), 0, 0));
  if (config.log_to_stderr) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }

  auto logger =
      std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_level(spdlog::level::info);
  logger->flush_on(spdlog::level::debug);

  spdlog::drop(kLoggerName);
  spdlog::register_logger(logger);
  spdlog::cfg::load_env_levels();

  if (config.log_level.has_value()) {
    logger->set_level(*config.log_level);
  }

  return logger;
}

}  // namespace mcpserver::config
