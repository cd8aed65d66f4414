#include "mcpserver/mcp/server_context.hpp"

namespace mcpserver::mcp {

auto MakeDefaultServerContext() -> ServerContext {
  return ServerContext{
      .server_info =
          Implementation{
              .name = std::string(kServerName),
              .version = std::string(kServerVersion)},
      .capabilities =
          ServerCapabilities{
              .tools = nlohmann::json::object(),
              .resources = nlohmann::json::object(),
              .prompts = nlohmann::json::object()},
      .instructions = std::nullopt};
}

}  // namespace mcpserver::mcp
