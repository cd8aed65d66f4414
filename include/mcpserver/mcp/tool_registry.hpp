#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "mcpserver/mcp/types.hpp"

namespace mcpserver::mcp {

// A tool body receives the call's "arguments" value.
using ToolHandler =
    std::function<CallToolResult(const nlohmann::json& arguments)>;

/**
 * @brief The tools this server can run, in registration order.
 *
 * Execute never fails at the protocol level: unknown tools and tools that
 * throw both come back as a CallToolResult with is_error set.
 */
class ToolRegistry {
 public:
  void Register(Tool tool, ToolHandler handler);

  [[nodiscard]] auto Tools() const noexcept -> const std::vector<Tool>& {
    return tools_;
  }

  [[nodiscard]] auto HasTool(const std::string& name) const -> bool;

  [[nodiscard]] auto Execute(
      const std::string& name, const nlohmann::json& arguments) const
      -> CallToolResult;

 private:
  std::vector<Tool> tools_;
  std::map<std::string, ToolHandler> handlers_;
};

}  // namespace mcpserver::mcp
