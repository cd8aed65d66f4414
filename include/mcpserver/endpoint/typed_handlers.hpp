#pragma once

/**
 * @file typed_handlers.hpp
 * @brief Adapters from typed C++ functions to the dispatcher's JSON handlers.
 *
 * A typed handler decodes the raw params into ParamsType with nlohmann's
 * from_json, calls the wrapped function and encodes its ResultType with
 * to_json. A params value that does not have the expected shape is reported
 * as kInvalidParams carrying the decoder's message; the dispatcher turns that
 * into a -32602 response.
 *
 * Handlers are held by shared_ptr in the registered lambdas so that the
 * function object outlives any coroutine frame that refers to it.
 */

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "mcpserver/endpoint/dispatcher.hpp"
#include "mcpserver/error/error.hpp"

namespace mcpserver::endpoint {

template <typename ParamsType, typename ResultType>
class TypedMethodHandler {
 public:
  using Function = std::function<std::expected<ResultType, error::RpcError>(
      const ParamsType&)>;

  explicit TypedMethodHandler(Function handler) : handler_(std::move(handler)) {
  }

  auto operator()(std::optional<nlohmann::json> params)
      -> asio::awaitable<std::expected<nlohmann::json, error::RpcError>> {
    ParamsType typed_params{};
    try {
      if (params.has_value()) {
        typed_params = params.value().template get<ParamsType>();
      }
    } catch (const nlohmann::json::exception& ex) {
      co_return error::RpcError::UnexpectedFromCode(
          error::RpcErrorCode::kInvalidParams, ex.what());
    }

    auto result = handler_(typed_params);
    if (!result) {
      co_return std::unexpected(result.error());
    }
    co_return nlohmann::json(*result);
  }

 private:
  Function handler_;
};

template <typename ParamsType>
class TypedNotificationHandler {
 public:
  using Function =
      std::function<std::expected<void, error::RpcError>(const ParamsType&)>;

  explicit TypedNotificationHandler(Function handler)
      : handler_(std::move(handler)) {
  }

  auto operator()(std::optional<nlohmann::json> params)
      -> asio::awaitable<std::expected<void, error::RpcError>> {
    ParamsType typed_params{};
    try {
      if (params.has_value()) {
        typed_params = params.value().template get<ParamsType>();
      }
    } catch (const nlohmann::json::exception& ex) {
      co_return error::RpcError::UnexpectedFromCode(
          error::RpcErrorCode::kInvalidParams,
          std::string("Failed to parse parameters: ") + ex.what());
    }

    co_return handler_(typed_params);
  }

 private:
  Function handler_;
};

template <typename ParamsType, typename ResultType>
void RegisterTypedMethodCall(
    Dispatcher& dispatcher, const std::string& method,
    typename TypedMethodHandler<ParamsType, ResultType>::Function handler,
    ParamsRequirement requirement = ParamsRequirement::kRequired) {
  auto typed_handler =
      std::make_shared<TypedMethodHandler<ParamsType, ResultType>>(
          std::move(handler));

  dispatcher.RegisterMethodCall(
      method,
      [handler = std::move(typed_handler)](
          const std::optional<nlohmann::json>& params) {
        return (*handler)(params);
      },
      requirement);
}

template <typename ParamsType>
void RegisterTypedNotification(
    Dispatcher& dispatcher, const std::string& method,
    typename TypedNotificationHandler<ParamsType>::Function handler) {
  auto typed_handler = std::make_shared<TypedNotificationHandler<ParamsType>>(
      std::move(handler));

  dispatcher.RegisterNotification(
      method, [handler = std::move(typed_handler)](
                  const std::optional<nlohmann::json>& params) {
        return (*handler)(params);
      });
}

}  // namespace mcpserver::endpoint
