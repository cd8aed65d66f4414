#pragma once

#include <expected>

#include <nlohmann/json.hpp>

#include "mcpserver/endpoint/types.hpp"
#include "mcpserver/error/error.hpp"

namespace mcpserver::endpoint {

using error::RpcError;
using error::RpcErrorCode;

class Response {
 public:
  Response() = default;
  Response(const Response&) = default;
  Response(Response&& other) = default;
  auto operator=(const Response&) -> Response& = default;
  auto operator=(Response&& other) noexcept -> Response& = default;

  ~Response() = default;

  static auto FromJson(const nlohmann::json& json)
      -> std::expected<Response, error::RpcError>;

  static auto CreateSuccess(const nlohmann::json& result, const RequestId& id)
      -> Response;

  static auto CreateError(RpcErrorCode code, const RequestId& id = nullptr)
      -> Response;

  static auto CreateError(const RpcError& error, const RequestId& id = nullptr)
      -> Response;

  [[nodiscard]] auto IsSuccess() const -> bool;

  [[nodiscard]] auto GetResult() const -> const nlohmann::json&;

  [[nodiscard]] auto GetError() const -> const nlohmann::json&;

  [[nodiscard]] auto GetId() const -> const RequestId&;

  [[nodiscard]] auto ToJson() const -> const nlohmann::json& {
    return response_;
  }

 private:
  explicit Response(nlohmann::json response) : response_(std::move(response)) {
  }

  [[nodiscard]] auto ValidateResponse() const
      -> std::expected<void, error::RpcError>;

  nlohmann::json response_;
};

}  // namespace mcpserver::endpoint

namespace nlohmann {
template <>
struct adl_serializer<mcpserver::endpoint::Response> {
  static void to_json(json& j, const mcpserver::endpoint::Response& r) {
    j = r.ToJson();
  }
};
}  // namespace nlohmann
