#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "mcpserver/endpoint/message.hpp"
#include "mcpserver/endpoint/request.hpp"
#include "mcpserver/endpoint/response.hpp"
#include "mcpserver/error/error.hpp"

namespace mcpserver::endpoint {

enum class ParamsRequirement {
  kOptional,
  kRequired,
};

/**
 * @brief Routes classified messages to the handlers registered by method name.
 *
 * Every request yields exactly one response and every notification yields
 * none. Handler failures are contained here: they become error responses for
 * requests and log lines for notifications.
 */
class Dispatcher {
 public:
  using MethodCallHandler = std::function<
      asio::awaitable<std::expected<nlohmann::json, error::RpcError>>(
          const std::optional<nlohmann::json>&)>;
  using NotificationHandler =
      std::function<asio::awaitable<std::expected<void, error::RpcError>>(
          const std::optional<nlohmann::json>&)>;

  explicit Dispatcher(std::shared_ptr<spdlog::logger> logger = nullptr);

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher(Dispatcher&&) = delete;
  auto operator=(const Dispatcher&) -> Dispatcher& = delete;
  auto operator=(Dispatcher&&) -> Dispatcher& = delete;
  virtual ~Dispatcher() = default;

  void RegisterMethodCall(
      const std::string& method, const MethodCallHandler& handler,
      ParamsRequirement params = ParamsRequirement::kOptional);

  void RegisterNotification(
      const std::string& method, const NotificationHandler& handler);

  [[nodiscard]] auto HasMethodCall(const std::string& method) const -> bool;

  [[nodiscard]] auto HasNotification(const std::string& method) const -> bool;

  /// @brief Handles one classified message; a value is returned only when a
  /// response must be written.
  auto Dispatch(const ClassifiedMessage& message)
      -> asio::awaitable<std::optional<Response>>;

  auto DispatchMethodCall(const Request& request) -> asio::awaitable<Response>;

  auto DispatchNotification(const Notification& notification)
      -> asio::awaitable<void>;

 private:
  struct MethodEntry {
    MethodCallHandler handler;
    ParamsRequirement params;
  };

  auto HandleMalformed(const MalformedMessage& message)
      -> std::optional<Response>;

  std::unordered_map<std::string, MethodEntry> method_handlers_;

  std::unordered_map<std::string, NotificationHandler> notification_handlers_;

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace mcpserver::endpoint
