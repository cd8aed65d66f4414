#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <mcpserver/config/server_config.hpp>
#include <mcpserver/mcp/handlers.hpp>
#include <mcpserver/mcp/server_context.hpp>
#include <mcpserver/server/server.hpp>
#include <mcpserver/transport/stdio_transport.hpp>
#include <spdlog/spdlog.h>

using mcpserver::server::Server;
using mcpserver::transport::StdioTransport;

/**
 * @brief MCP server over standard input/output.
 *
 * Reads one JSON-RPC message per line from stdin and writes responses to
 * stdout. Diagnostics go to a log file, never to stdout.
 */

namespace {

constexpr int kExitFault = 1;
constexpr int kExitUsage = 2;

auto RunServer(
    asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger,
    const mcpserver::mcp::ServerContext& context,
    const mcpserver::mcp::Catalog& catalog, int& exit_code)
    -> asio::awaitable<void> {
  auto transport = std::make_unique<StdioTransport>(
      executor, STDIN_FILENO, STDOUT_FILENO, logger);
  Server server(std::move(transport), logger);
  mcpserver::mcp::RegisterHandlers(
      server.GetDispatcher(), context, catalog, logger);

  auto result = co_await server.Run();
  if (!result) {
    logger->error("Server exited with error: {}", result.error().Message());
    exit_code = kExitFault;
    co_return;
  }

  logger->info("Server exited successfully");
  exit_code = EXIT_SUCCESS;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  std::vector<std::string> args(argv, argv + argc);

  mcpserver::config::ServerConfig config;
  try {
    config = mcpserver::config::ParseArguments(args);
  } catch (const std::invalid_argument& ex) {
    std::cerr << ex.what() << "\n" << mcpserver::config::Usage(args.at(0));
    return kExitUsage;
  }

  if (config.show_help) {
    std::cerr << mcpserver::config::Usage(args.at(0));
    return EXIT_SUCCESS;
  }

  std::shared_ptr<spdlog::logger> logger;
  try {
    logger = mcpserver::config::SetupLogger(config);
  } catch (const std::exception& ex) {
    std::cerr << "Failed to set up logging: " << ex.what() << "\n";
    return kExitFault;
  }

  const auto context = mcpserver::mcp::MakeDefaultServerContext();
  const auto catalog = mcpserver::mcp::MakeDefaultCatalog();

  logger->info("Starting MCP stdio server process");
  logger->info(
      "Server info: {} {}", context.server_info.name,
      context.server_info.version);

  // A closed stdout must surface as a write error instead of a signal.
  std::signal(SIGPIPE, SIG_IGN);

  int exit_code = kExitFault;
  try {
    asio::io_context io_context;
    asio::co_spawn(
        io_context,
        RunServer(
            io_context.get_executor(), logger, context, catalog, exit_code),
        [](std::exception_ptr eptr) {
          if (eptr) {
            std::rethrow_exception(eptr);
          }
        });
    io_context.run();
  } catch (const std::exception& ex) {
    logger->error("Server error: {}", ex.what());
    exit_code = kExitFault;
  }

  logger->flush();
  return exit_code;
}
