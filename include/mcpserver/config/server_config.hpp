#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace mcpserver::config {

constexpr const char* kLogFileName = "mcp_stdio_server.log";

constexpr const char* kLoggerName = "mcpserver";

struct ServerConfig {
  // Empty means the default under $HOME.
  std::filesystem::path log_directory;
  // Set only when --log-level was given; otherwise SPDLOG_LEVEL or info.
  std::optional<spdlog::level::level_enum> log_level;
  bool log_to_stderr = false;
  bool show_help = false;
};

/**
 * @brief Parses the command line.
 *
 * Accepted: --log-dir=<path>, --log-level=<level>, --log-stderr, --help.
 *
 * @param args All arguments including the program name.
 * @throws std::invalid_argument on an unknown argument or bad level.
 */
auto ParseArguments(const std::vector<std::string>& args) -> ServerConfig;

auto Usage(const std::string& program) -> std::string;

/**
 * @brief Resolves where log files go.
 *
 * @throws std::runtime_error if no directory was configured and HOME is unset.
 */
auto ResolveLogDirectory(const ServerConfig& config) -> std::filesystem::path;

/**
 * @brief Builds the process logger: a daily rotating file, optionally
 * mirrored to stderr. Standard output is never used; it carries the protocol.
 *
 * The logger is registered under kLoggerName so SPDLOG_LEVEL applies to it.
 */
auto SetupLogger(const ServerConfig& config) -> std::shared_ptr<spdlog::logger>;

}  // namespace mcpserver::config
