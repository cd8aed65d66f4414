#include "mcpserver/endpoint/dispatcher.hpp"

#include <string>

namespace mcpserver::endpoint {

using error::RpcError;
using error::RpcErrorCode;

namespace {

auto InvalidParams(const std::string& method, std::string_view detail)
    -> RpcError {
  return RpcError::FromCode(
      RpcErrorCode::kInvalidParams,
      "Invalid params for " + method + ": " + std::string(detail));
}

auto InternalError(const std::string& method, std::string_view detail)
    -> RpcError {
  return RpcError::FromCode(
      RpcErrorCode::kInternalError,
      "Internal error during " + method + ": " + std::string(detail));
}

}  // namespace

Dispatcher::Dispatcher(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

void Dispatcher::RegisterMethodCall(
    const std::string& method, const MethodCallHandler& handler,
    ParamsRequirement params) {
  method_handlers_[method] = MethodEntry{handler, params};
}

void Dispatcher::RegisterNotification(
    const std::string& method, const NotificationHandler& handler) {
  notification_handlers_[method] = handler;
}

auto Dispatcher::HasMethodCall(const std::string& method) const -> bool {
  return method_handlers_.contains(method);
}

auto Dispatcher::HasNotification(const std::string& method) const -> bool {
  return notification_handlers_.contains(method);
}

auto Dispatcher::Dispatch(const ClassifiedMessage& message)
    -> asio::awaitable<std::optional<Response>> {
  if (const auto* request = std::get_if<Request>(&message)) {
    co_return co_await DispatchMethodCall(*request);
  }

  if (const auto* notification = std::get_if<Notification>(&message)) {
    co_await DispatchNotification(*notification);
    co_return std::nullopt;
  }

  co_return HandleMalformed(std::get<MalformedMessage>(message));
}

auto Dispatcher::DispatchMethodCall(const Request& request)
    -> asio::awaitable<Response> {
  const auto& method = request.GetMethod();
  logger_->info(
      "Dispatcher received request: id={}, method={}",
      request.GetId().dump(), method);
  logger_->debug("Dispatcher request details: {}", request.ToJson().dump());

  auto it = method_handlers_.find(method);
  if (it == method_handlers_.end()) {
    logger_->warn("Dispatcher has no handler for request method: {}", method);
    co_return Response::CreateError(
        RpcError::FromCode(
            RpcErrorCode::kMethodNotFound, "Method not found: " + method),
        request.GetId());
  }

  const auto& entry = it->second;
  if (entry.params == ParamsRequirement::kRequired &&
      !request.GetParams().has_value()) {
    logger_->error("Dispatcher request {} is missing params", method);
    co_return Response::CreateError(
        InvalidParams(method, "missing params field"), request.GetId());
  }

  std::expected<nlohmann::json, RpcError> result;
  try {
    result = co_await entry.handler(request.GetParams());
  } catch (const std::exception& ex) {
    logger_->error("Dispatcher handler for {} threw: {}", method, ex.what());
    result = std::unexpected(InternalError(method, ex.what()));
  }

  if (result) {
    co_return Response::CreateSuccess(*result, request.GetId());
  }

  const auto& failure = result.error();
  logger_->error(
      "Dispatcher handler for {} failed: {}", method, failure.Message());
  if (failure.Code() == RpcErrorCode::kInvalidParams) {
    co_return Response::CreateError(
        InvalidParams(method, failure.Message()), request.GetId());
  }
  co_return Response::CreateError(
      InternalError(method, failure.Message()), request.GetId());
}

auto Dispatcher::DispatchNotification(const Notification& notification)
    -> asio::awaitable<void> {
  const auto& method = notification.GetMethod();
  logger_->info("Dispatcher received notification: method={}", method);
  logger_->debug(
      "Dispatcher notification details: {}", notification.ToJson().dump());

  auto it = notification_handlers_.find(method);
  if (it == notification_handlers_.end()) {
    logger_->warn("Dispatcher has no handler for notification: {}", method);
    co_return;
  }

  try {
    auto result = co_await it->second(notification.GetParams());
    if (!result) {
      logger_->error(
          "Dispatcher notification handler for {} failed: {}", method,
          result.error().Message());
    }
  } catch (const std::exception& ex) {
    logger_->error(
        "Dispatcher notification handler for {} threw: {}", method, ex.what());
  }
}

auto Dispatcher::HandleMalformed(const MalformedMessage& message)
    -> std::optional<Response> {
  logger_->error(
      "Dispatcher received malformed message: {}", message.error.Message());
  if (!message.RequiresResponse()) {
    return std::nullopt;
  }
  return Response::CreateError(message.error, message.id);
}

}  // namespace mcpserver::endpoint
