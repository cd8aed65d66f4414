#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "mcpserver/mcp/types.hpp"

namespace mcpserver::mcp {

constexpr std::string_view kProtocolVersion = "2024-11-05";

constexpr std::string_view kServerName = "mcpserver-stdio";

constexpr std::string_view kServerVersion = "0.1.1";

// Identity and capabilities advertised at initialize. Built once at startup
// and only ever read afterwards.
struct ServerContext {
  Implementation server_info;
  ServerCapabilities capabilities;
  std::optional<std::string> instructions;
};

// Advertises tools, resources and prompts with empty option objects.
auto MakeDefaultServerContext() -> ServerContext;

}  // namespace mcpserver::mcp
