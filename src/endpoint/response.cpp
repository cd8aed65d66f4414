#include "mcpserver/endpoint/response.hpp"

#include <stdexcept>

namespace mcpserver::endpoint {

auto Response::FromJson(const nlohmann::json& json)
    -> std::expected<Response, error::RpcError> {
  Response r{json};
  if (auto result = r.ValidateResponse(); !result) {
    return std::unexpected(result.error());
  }
  return r;
}

auto Response::CreateSuccess(const nlohmann::json& result, const RequestId& id)
    -> Response {
  return Response{nlohmann::json{
      {"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}}};
}

auto Response::CreateError(RpcErrorCode code, const RequestId& id)
    -> Response {
  return CreateError(RpcError::FromCode(code), id);
}

auto Response::CreateError(const RpcError& error, const RequestId& id)
    -> Response {
  return Response{nlohmann::json{
      {"jsonrpc", kJsonRpcVersion}, {"id", id}, {"error", error.to_json()}}};
}

auto Response::IsSuccess() const -> bool {
  return response_.contains("result");
}

auto Response::GetResult() const -> const nlohmann::json& {
  if (!IsSuccess()) {
    throw std::runtime_error("Response is not a success response");
  }
  return response_.at("result");
}

auto Response::GetError() const -> const nlohmann::json& {
  if (IsSuccess()) {
    throw std::runtime_error("Response is not an error response");
  }
  return response_.at("error");
}

auto Response::GetId() const -> const RequestId& {
  return response_.at("id");
}

auto Response::ValidateResponse() const
    -> std::expected<void, error::RpcError> {
  if (!response_.is_object()) {
    return RpcError::UnexpectedFromCode(
        RpcErrorCode::kInvalidRequest, "Response must be a JSON object");
  }

  if (!response_.contains("jsonrpc") ||
      response_["jsonrpc"] != kJsonRpcVersion) {
    return RpcError::UnexpectedFromCode(
        RpcErrorCode::kInvalidRequest, "Invalid JSON-RPC version");
  }

  if (!response_.contains("id")) {
    return RpcError::UnexpectedFromCode(
        RpcErrorCode::kInvalidRequest, "Response must contain an 'id' field");
  }

  if (!response_.contains("result") && !response_.contains("error")) {
    return RpcError::UnexpectedFromCode(
        RpcErrorCode::kInvalidRequest,
        "Response must contain either 'result' or 'error' field");
  }

  if (response_.contains("result") && response_.contains("error")) {
    return RpcError::UnexpectedFromCode(
        RpcErrorCode::kInvalidRequest,
        "Response cannot contain both 'result' and 'error' fields");
  }

  if (response_.contains("error")) {
    const auto& error = response_["error"];
    if (!error.is_object() || !error.contains("code") ||
        !error["code"].is_number_integer() || !error.contains("message") ||
        !error["message"].is_string()) {
      return RpcError::UnexpectedFromCode(
          RpcErrorCode::kInvalidRequest,
          "Error object must contain integer 'code' and string 'message'");
    }
  }

  return {};
}

}  // namespace mcpserver::endpoint
