#include "mcpserver/mcp/handlers.hpp"

#include <string>

#include "mcpserver/endpoint/typed_handlers.hpp"

namespace mcpserver::mcp {

using endpoint::ParamsRequirement;
using error::RpcError;
using error::RpcErrorCode;

auto MakeDefaultCatalog() -> Catalog {
  Catalog catalog;

  catalog.tools.Register(
      Tool{
          .name = std::string(kDummyToolName),
          .description = "A simple test tool.",
          .input_schema =
              {{"type", "object"}, {"properties", nlohmann::json::object()}}},
      [](const nlohmann::json& arguments) {
        return CallToolResult{
            .content = {ContentPart::Text(
                std::string(kDummyToolName) +
                " executed successfully. Received args: " + arguments.dump())},
            .is_error = std::nullopt};
      });

  catalog.resources.push_back(Resource{
      .uri = "mcp://dummy/resource/1",
      .name = "Dummy Resource",
      .description = "A test resource"});

  catalog.prompts.push_back(Prompt{
      .name = "dummy_prompt",
      .description = "A test prompt",
      .arguments = std::nullopt});

  return catalog;
}

auto HandleInitialize(
    const InitializeParams& params, const ServerContext& context,
    spdlog::logger& logger) -> std::expected<InitializeResult, RpcError> {
  logger.info(
      "Handling initialize request: client={} {}, version={}",
      params.client_info.name, params.client_info.version,
      params.protocol_version);

  // A mismatch is not fatal; the client decides whether it can continue
  // with the version we answer with.
  if (params.protocol_version != kProtocolVersion) {
    logger.warn(
        "Client requested protocol version {}, but server uses {}",
        params.protocol_version, kProtocolVersion);
  }

  return InitializeResult{
      .protocol_version = std::string(kProtocolVersion),
      .capabilities = context.capabilities,
      .server_info = context.server_info,
      .instructions = context.instructions};
}

auto HandleInitialized(const nlohmann::json& params, spdlog::logger& logger)
    -> std::expected<void, RpcError> {
  if (params.is_null()) {
    logger.warn("'initialized' notification received without params");
  } else {
    try {
      static_cast<void>(params.get<InitializedParams>());
    } catch (const nlohmann::json::exception& ex) {
      return RpcError::UnexpectedFromCode(
          RpcErrorCode::kInvalidParams,
          std::string("Failed to parse 'initialized' params: ") + ex.what());
    }
  }

  logger.info("Client sent 'initialized'; connection ready");
  return {};
}

auto HandleCancelRequest(const nlohmann::json& params, spdlog::logger& logger)
    -> std::expected<void, RpcError> {
  logger.warn(
      "Received '$/cancelRequest' ({}), but cancellation is not implemented",
      params.dump());
  return {};
}

auto HandleListTools(const Catalog& catalog, spdlog::logger& logger)
    -> ListToolsResult {
  logger.info("Handling tools/list request");
  return ListToolsResult{.tools = catalog.tools.Tools()};
}

auto HandleListResources(const Catalog& catalog, spdlog::logger& logger)
    -> ListResourcesResult {
  logger.info("Handling resources/list request");
  return ListResourcesResult{.resources = catalog.resources};
}

auto HandleListPrompts(const Catalog& catalog, spdlog::logger& logger)
    -> ListPromptsResult {
  logger.info("Handling prompts/list request");
  return ListPromptsResult{.prompts = catalog.prompts};
}

auto HandleCallTool(
    const CallToolParams& params, const Catalog& catalog,
    spdlog::logger& logger) -> CallToolResult {
  logger.info("Handling tools/call request for tool: {}", params.name);
  logger.debug("Tool call arguments: {}", params.arguments.dump());

  if (!catalog.tools.HasTool(params.name)) {
    logger.warn("Received call for unknown tool: {}", params.name);
  }
  return catalog.tools.Execute(params.name, params.arguments);
}

void RegisterHandlers(
    endpoint::Dispatcher& dispatcher, const ServerContext& context,
    const Catalog& catalog, std::shared_ptr<spdlog::logger> logger) {
  if (!logger) {
    logger = spdlog::default_logger();
  }

  endpoint::RegisterTypedMethodCall<InitializeParams, InitializeResult>(
      dispatcher, "initialize",
      [&context, logger](const InitializeParams& params) {
        return HandleInitialize(params, context, *logger);
      },
      ParamsRequirement::kRequired);

  endpoint::RegisterTypedMethodCall<nlohmann::json, ListToolsResult>(
      dispatcher, "tools/list",
      [&catalog, logger](const nlohmann::json&)
          -> std::expected<ListToolsResult, RpcError> {
        return HandleListTools(catalog, *logger);
      },
      ParamsRequirement::kOptional);

  endpoint::RegisterTypedMethodCall<nlohmann::json, ListResourcesResult>(
      dispatcher, "resources/list",
      [&catalog, logger](const nlohmann::json&)
          -> std::expected<ListResourcesResult, RpcError> {
        return HandleListResources(catalog, *logger);
      },
      ParamsRequirement::kOptional);

  endpoint::RegisterTypedMethodCall<nlohmann::json, ListPromptsResult>(
      dispatcher, "prompts/list",
      [&catalog, logger](const nlohmann::json&)
          -> std::expected<ListPromptsResult, RpcError> {
        return HandleListPrompts(catalog, *logger);
      },
      ParamsRequirement::kOptional);

  endpoint::RegisterTypedMethodCall<CallToolParams, CallToolResult>(
      dispatcher, "tools/call",
      [&catalog, logger](const CallToolParams& params)
          -> std::expected<CallToolResult, RpcError> {
        return HandleCallTool(params, catalog, *logger);
      },
      ParamsRequirement::kRequired);

  endpoint::RegisterTypedNotification<nlohmann::json>(
      dispatcher, "initialized", [logger](const nlohmann::json& params) {
        return HandleInitialized(params, *logger);
      });

  endpoint::RegisterTypedNotification<nlohmann::json>(
      dispatcher, "$/cancelRequest", [logger](const nlohmann::json& params) {
        return HandleCancelRequest(params, *logger);
      });
}

}  // namespace mcpserver::mcp
