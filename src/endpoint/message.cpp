#include "mcpserver/endpoint/message.hpp"

#include <string>

namespace mcpserver::endpoint {

using error::RpcError;
using error::RpcErrorCode;

auto ClassifyMessage(std::string_view line) -> ClassifiedMessage {
  nlohmann::json root;
  try {
    root = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error& ex) {
    return MalformedMessage{
        .kind = MalformedKind::kUnparseable,
        .id = nullptr,
        .error = RpcError::FromCode(
            RpcErrorCode::kParseError,
            std::string("Parse error: ") + ex.what())};
  }

  const bool has_id = root.is_object() && root.contains("id");
  const bool has_method = root.is_object() && root.contains("method");

  if (has_id) {
    auto request = Request::FromJson(root);
    if (!request) {
      return MalformedMessage{
          .kind = MalformedKind::kBadRequest,
          .id = root["id"],
          .error = RpcError::FromCode(
              RpcErrorCode::kInvalidParams,
              "Malformed request: " + std::string(request.error().Message()))};
    }
    return std::move(request.value());
  }

  if (has_method) {
    auto notification = Notification::FromJson(root);
    if (!notification) {
      return MalformedMessage{
          .kind = MalformedKind::kBadNotification,
          .id = nullptr,
          .error = RpcError::FromCode(
              RpcErrorCode::kInvalidRequest,
              "Malformed notification: " +
                  std::string(notification.error().Message()))};
    }
    return std::move(notification.value());
  }

  return MalformedMessage{
      .kind = MalformedKind::kNotRpc,
      .id = nullptr,
      .error = RpcError::FromCode(
          RpcErrorCode::kInvalidRequest,
          "Message has neither 'id' nor 'method'")};
}

}  // namespace mcpserver::endpoint
