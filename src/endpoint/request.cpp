#include "mcpserver/endpoint/request.hpp"

namespace mcpserver::endpoint {

using error::RpcError;
using error::RpcErrorCode;

namespace {

struct MessageFields {
  std::string method;
  std::optional<nlohmann::json> params;
};

// Checks the parts shared by requests and notifications.
auto DecodeCommonFields(const nlohmann::json& json_obj)
    -> std::expected<MessageFields, RpcError> {
  if (!json_obj.is_object()) {
    return RpcError::UnexpectedFromCode(
        RpcErrorCode::kInvalidRequest, "Message must be a JSON object");
  }

  auto version = json_obj.find("jsonrpc");
  if (version == json_obj.end() || !version->is_string() ||
      version->get<std::string>() != kJsonRpcVersion) {
    return RpcError::UnexpectedFromCode(
        RpcErrorCode::kInvalidRequest, "Missing or invalid 'jsonrpc' version");
  }

  auto method = json_obj.find("method");
  if (method == json_obj.end() || !method->is_string()) {
    return RpcError::UnexpectedFromCode(
        RpcErrorCode::kInvalidRequest, "Missing or invalid 'method'");
  }

  // An explicit null is the same as leaving params out.
  std::optional<nlohmann::json> params;
  auto params_it = json_obj.find("params");
  if (params_it != json_obj.end() && !params_it->is_null()) {
    params = *params_it;
  }

  return MessageFields{method->get<std::string>(), std::move(params)};
}

}  // namespace

Request::Request(
    std::string method, std::optional<nlohmann::json> params, RequestId id)
    : method_(std::move(method)),
      params_(std::move(params)),
      id_(std::move(id)) {
}

auto Request::FromJson(const nlohmann::json& json_obj)
    -> std::expected<Request, error::RpcError> {
  if (!json_obj.is_object() || !json_obj.contains("id")) {
    return RpcError::UnexpectedFromCode(
        RpcErrorCode::kInvalidRequest, "Missing 'id'");
  }

  auto fields = DecodeCommonFields(json_obj);
  if (!fields) {
    return std::unexpected(fields.error());
  }

  return Request(
      std::move(fields->method), std::move(fields->params), json_obj.at("id"));
}

auto Request::ToJson() const -> nlohmann::json {
  nlohmann::json json_obj;
  json_obj["jsonrpc"] = kJsonRpcVersion;
  json_obj["id"] = id_;
  json_obj["method"] = method_;

  if (params_.has_value()) {
    json_obj["params"] = params_.value();
  }

  return json_obj;
}

Notification::Notification(
    std::string method, std::optional<nlohmann::json> params)
    : method_(std::move(method)), params_(std::move(params)) {
}

auto Notification::FromJson(const nlohmann::json& json_obj)
    -> std::expected<Notification, error::RpcError> {
  if (json_obj.is_object() && json_obj.contains("id")) {
    return RpcError::UnexpectedFromCode(
        RpcErrorCode::kInvalidRequest, "Notification must not carry an 'id'");
  }

  auto fields = DecodeCommonFields(json_obj);
  if (!fields) {
    return std::unexpected(fields.error());
  }

  return Notification(std::move(fields->method), std::move(fields->params));
}

auto Notification::ToJson() const -> nlohmann::json {
  nlohmann::json json_obj;
  json_obj["jsonrpc"] = kJsonRpcVersion;
  json_obj["method"] = method_;

  if (params_.has_value()) {
    json_obj["params"] = params_.value();
  }

  return json_obj;
}

}  // namespace mcpserver::endpoint
