#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcpserver::mcp {

// ---------------------------------------------------------------------------
// Handshake
// ---------------------------------------------------------------------------

struct Implementation {
  std::string name;
  std::string version;
};

struct ServerCapabilities {
  std::optional<nlohmann::json> tools;
  std::optional<nlohmann::json> resources;
  std::optional<nlohmann::json> prompts;
};

// Accepted as an object and otherwise not interpreted yet.
struct ClientCapabilities {
  nlohmann::json::object_t entries;
};

struct InitializeParams {
  std::string protocol_version;
  ClientCapabilities capabilities;
  Implementation client_info;
};

struct InitializeResult {
  std::string protocol_version;
  ServerCapabilities capabilities;
  Implementation server_info;
  std::optional<std::string> instructions;
};

// The protocol defines no members yet.
struct InitializedParams {};

// ---------------------------------------------------------------------------
// Catalogue entries
// ---------------------------------------------------------------------------

struct Tool {
  std::string name;
  std::optional<std::string> description;
  nlohmann::json input_schema;
};

struct Resource {
  std::string uri;
  std::string name;
  std::optional<std::string> description;
};

struct PromptArgument {
  std::string name;
  std::optional<std::string> description;
  bool required = false;
};

struct Prompt {
  std::string name;
  std::optional<std::string> description;
  std::optional<std::vector<PromptArgument>> arguments;
};

struct ListToolsResult {
  std::vector<Tool> tools;
};

struct ListResourcesResult {
  std::vector<Resource> resources;
};

struct ListPromptsResult {
  std::vector<Prompt> prompts;
};

// ---------------------------------------------------------------------------
// Tool invocation
// ---------------------------------------------------------------------------

struct CallToolParams {
  std::string name;
  nlohmann::json arguments;
};

struct ContentPart {
  std::string type;
  std::optional<std::string> text;

  static auto Text(std::string text) -> ContentPart {
    return {"text", std::move(text)};
  }
};

struct CallToolResult {
  std::vector<ContentPart> content;
  std::optional<bool> is_error;
};

void to_json(nlohmann::json& j, const Implementation& value);
void from_json(const nlohmann::json& j, Implementation& value);

void to_json(nlohmann::json& j, const ServerCapabilities& value);

void from_json(const nlohmann::json& j, ClientCapabilities& value);

void from_json(const nlohmann::json& j, InitializeParams& value);

void to_json(nlohmann::json& j, const InitializeResult& value);

void from_json(const nlohmann::json& j, InitializedParams& value);

void to_json(nlohmann::json& j, const Tool& value);
void to_json(nlohmann::json& j, const Resource& value);
void to_json(nlohmann::json& j, const PromptArgument& value);
void to_json(nlohmann::json& j, const Prompt& value);

void to_json(nlohmann::json& j, const ListToolsResult& value);
void to_json(nlohmann::json& j, const ListResourcesResult& value);
void to_json(nlohmann::json& j, const ListPromptsResult& value);

void from_json(const nlohmann::json& j, CallToolParams& value);

void to_json(nlohmann::json& j, const ContentPart& value);
void to_json(nlohmann::json& j, const CallToolResult& value);

}  // namespace mcpserver::mcp
