#pragma once

#include <expected>
#include <memory>
#include <string_view>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "mcpserver/endpoint/dispatcher.hpp"
#include "mcpserver/endpoint/response_writer.hpp"
#include "mcpserver/error/error.hpp"
#include "mcpserver/transport/transport.hpp"

namespace mcpserver::server {

enum class ServerState {
  kIdle,
  kReadingLine,
  kClassifying,
  kDispatching,
  kWriting,
  kShutdownClean,
  kShutdownFault,
};

auto ToString(ServerState state) -> std::string_view;

/**
 * @brief A JSON-RPC server that serves one stream until it ends.
 *
 * Reads a line, classifies it, dispatches it and, for requests, writes the
 * response before reading the next line. Errors inside a single message never
 * stop the loop; only a failed read or write does.
 */
class Server {
 public:
  /**
   * @brief Constructs a Server over the given transport.
   *
   * @param transport The line channel to serve.
   * @param logger Sink for diagnostics; the default logger when null.
   */
  explicit Server(
      std::unique_ptr<transport::Transport> transport,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  Server(const Server &) = delete;
  Server(Server &&) = delete;
  auto operator=(const Server &) -> Server & = delete;
  auto operator=(Server &&) -> Server & = delete;

  ~Server() = default;

  /// @brief Handler table; register methods before calling Run().
  auto GetDispatcher() -> endpoint::Dispatcher & {
    return dispatcher_;
  }

  /**
   * @brief Serves messages until the input ends or the transport fails.
   *
   * @return Nothing on a clean end of input, the transport error otherwise.
   */
  auto Run() -> asio::awaitable<std::expected<void, error::RpcError>>;

  [[nodiscard]] auto GetState() const -> ServerState {
    return state_;
  }

  [[nodiscard]] auto MessagesProcessed() const -> std::size_t {
    return messages_processed_;
  }

 private:
  void TransitionTo(ServerState state);

  auto Fail(error::RpcError error)
      -> asio::awaitable<std::expected<void, error::RpcError>>;

  std::unique_ptr<transport::Transport> transport_;

  std::shared_ptr<spdlog::logger> logger_;

  endpoint::Dispatcher dispatcher_;

  endpoint::ResponseWriter writer_;

  ServerState state_{ServerState::kIdle};

  std::size_t messages_processed_{0};
};

}  // namespace mcpserver::server
