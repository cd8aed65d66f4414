#include "mcpserver/mcp/types.hpp"

namespace mcpserver::mcp {

namespace {

template <typename T>
void SetIfPresent(
    nlohmann::json& j, const char* key, const std::optional<T>& value) {
  if (value.has_value()) {
    j[key] = *value;
  }
}

}  // namespace

void to_json(nlohmann::json& j, const Implementation& value) {
  j = {{"name", value.name}, {"version", value.version}};
}

void from_json(const nlohmann::json& j, Implementation& value) {
  j.at("name").get_to(value.name);
  j.at("version").get_to(value.version);
}

void to_json(nlohmann::json& j, const ServerCapabilities& value) {
  j = nlohmann::json::object();
  SetIfPresent(j, "tools", value.tools);
  SetIfPresent(j, "resources", value.resources);
  SetIfPresent(j, "prompts", value.prompts);
}

void from_json(const nlohmann::json& j, ClientCapabilities& value) {
  j.get_to(value.entries);
}

void from_json(const nlohmann::json& j, InitializeParams& value) {
  j.at("protocolVersion").get_to(value.protocol_version);
  j.at("capabilities").get_to(value.capabilities);
  j.at("clientInfo").get_to(value.client_info);
}

void to_json(nlohmann::json& j, const InitializeResult& value) {
  j = {
      {"protocolVersion", value.protocol_version},
      {"capabilities", value.capabilities},
      {"serverInfo", value.server_info}};
  SetIfPresent(j, "instructions", value.instructions);
}

void from_json(const nlohmann::json& j, InitializedParams& /*value*/) {
  // No members, but the params must still be an object.
  static_cast<void>(j.get<nlohmann::json::object_t>());
}

void to_json(nlohmann::json& j, const Tool& value) {
  j = {{"name", value.name}};
  SetIfPresent(j, "description", value.description);
  j["inputSchema"] = value.input_schema;
}

void to_json(nlohmann::json& j, const Resource& value) {
  j = {{"uri", value.uri}, {"name", value.name}};
  SetIfPresent(j, "description", value.description);
}

void to_json(nlohmann::json& j, const PromptArgument& value) {
  j = {{"name", value.name}};
  SetIfPresent(j, "description", value.description);
  j["required"] = value.required;
}

void to_json(nlohmann::json& j, const Prompt& value) {
  j = {{"name", value.name}};
  SetIfPresent(j, "description", value.description);
  SetIfPresent(j, "arguments", value.arguments);
}

void to_json(nlohmann::json& j, const ListToolsResult& value) {
  j = {{"tools", value.tools}};
}

void to_json(nlohmann::json& j, const ListResourcesResult& value) {
  j = {{"resources", value.resources}};
}

void to_json(nlohmann::json& j, const ListPromptsResult& value) {
  j = {{"prompts", value.prompts}};
}

void from_json(const nlohmann::json& j, CallToolParams& value) {
  j.at("name").get_to(value.name);
  value.arguments = j.at("arguments");
}

void to_json(nlohmann::json& j, const ContentPart& value) {
  j = {{"type", value.type}};
  SetIfPresent(j, "text", value.text);
}

void to_json(nlohmann::json& j, const CallToolResult& value) {
  j = {{"content", value.content}};
  SetIfPresent(j, "isError", value.is_error);
}

}  // namespace mcpserver::mcp
