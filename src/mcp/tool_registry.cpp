#include "mcpserver/mcp/tool_registry.hpp"

#include <algorithm>
#include <stdexcept>

namespace mcpserver::mcp {

void ToolRegistry::Register(Tool tool, ToolHandler handler) {
  if (!handler) {
    throw std::invalid_argument("Tool '" + tool.name + "' has no handler");
  }

  auto existing = std::ranges::find(tools_, tool.name, &Tool::name);
  if (existing != tools_.end()) {
    *existing = tool;
  } else {
    tools_.push_back(tool);
  }
  handlers_[tool.name] = std::move(handler);
}

auto ToolRegistry::HasTool(const std::string& name) const -> bool {
  return handlers_.contains(name);
}

auto ToolRegistry::Execute(
    const std::string& name, const nlohmann::json& arguments) const
    -> CallToolResult {
  auto it = handlers_.find(name);
  if (it == handlers_.end()) {
    return CallToolResult{
        .content = {ContentPart::Text(
            "Error: Tool '" + name + "' not implemented by this server.")},
        .is_error = true};
  }

  try {
    return it->second(arguments);
  } catch (const std::exception& e) {
    return CallToolResult{
        .content = {ContentPart::Text(
            "Error: Tool '" + name + "' failed: " + e.what())},
        .is_error = true};
  }
}

}  // namespace mcpserver::mcp
