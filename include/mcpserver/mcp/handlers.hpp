#pragma once

#include <expected>
#include <memory>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "mcpserver/endpoint/dispatcher.hpp"
#include "mcpserver/error/error.hpp"
#include "mcpserver/mcp/server_context.hpp"
#include "mcpserver/mcp/tool_registry.hpp"
#include "mcpserver/mcp/types.hpp"

namespace mcpserver::mcp {

constexpr std::string_view kDummyToolName = "dummy_tool_from_rust";

// Everything the list and call methods serve.
struct Catalog {
  ToolRegistry tools;
  std::vector<Resource> resources;
  std::vector<Prompt> prompts;
};

// One placeholder tool, resource and prompt.
auto MakeDefaultCatalog() -> Catalog;

auto HandleInitialize(
    const InitializeParams& params, const ServerContext& context,
    spdlog::logger& logger) -> std::expected<InitializeResult, error::RpcError>;

// A null params value means the client sent none; defaults are used.
auto HandleInitialized(const nlohmann::json& params, spdlog::logger& logger)
    -> std::expected<void, error::RpcError>;

auto HandleCancelRequest(const nlohmann::json& params, spdlog::logger& logger)
    -> std::expected<void, error::RpcError>;

auto HandleListTools(const Catalog& catalog, spdlog::logger& logger)
    -> ListToolsResult;

auto HandleListResources(const Catalog& catalog, spdlog::logger& logger)
    -> ListResourcesResult;

auto HandleListPrompts(const Catalog& catalog, spdlog::logger& logger)
    -> ListPromptsResult;

auto HandleCallTool(
    const CallToolParams& params, const Catalog& catalog,
    spdlog::logger& logger) -> CallToolResult;

/**
 * @brief Binds the MCP methods and notifications to a dispatcher.
 *
 * context and catalog are captured by reference and must outlive the
 * dispatcher.
 */
void RegisterHandlers(
    endpoint::Dispatcher& dispatcher, const ServerContext& context,
    const Catalog& catalog, std::shared_ptr<spdlog::logger> logger = nullptr);

}  // namespace mcpserver::mcp
