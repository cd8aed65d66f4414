#pragma once

#include <expected>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "mcpserver/endpoint/types.hpp"
#include "mcpserver/error/error.hpp"

namespace mcpserver::endpoint {

// A method call that expects exactly one correlated response.
class Request {
 public:
  Request(
      std::string method, std::optional<nlohmann::json> params, RequestId id);

  static auto FromJson(const nlohmann::json& json_obj)
      -> std::expected<Request, error::RpcError>;

  [[nodiscard]] auto GetMethod() const -> const std::string& {
    return method_;
  }

  [[nodiscard]] auto GetParams() const -> const std::optional<nlohmann::json>& {
    return params_;
  }

  [[nodiscard]] auto GetId() const -> const RequestId& {
    return id_;
  }

  [[nodiscard]] auto ToJson() const -> nlohmann::json;

 private:
  std::string method_;
  std::optional<nlohmann::json> params_;
  RequestId id_;
};

// A fire-and-forget message: no id, never answered.
class Notification {
 public:
  explicit Notification(
      std::string method, std::optional<nlohmann::json> params = std::nullopt);

  static auto FromJson(const nlohmann::json& json_obj)
      -> std::expected<Notification, error::RpcError>;

  [[nodiscard]] auto GetMethod() const -> const std::string& {
    return method_;
  }

  [[nodiscard]] auto GetParams() const -> const std::optional<nlohmann::json>& {
    return params_;
  }

  [[nodiscard]] auto ToJson() const -> nlohmann::json;

 private:
  std::string method_;
  std::optional<nlohmann::json> params_;
};

}  // namespace mcpserver::endpoint
