#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "mcpserver/error/error.hpp"

namespace mcpserver::transport {

/**
 * @brief A single ordered, line-oriented duplex channel.
 *
 * Each message travels as one line. Any error returned from SendMessage or
 * ReceiveMessage means the channel is unusable and the caller should stop.
 */
class Transport {
 public:
  explicit Transport(
      asio::any_io_executor executor,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      : logger_(logger ? std::move(logger) : spdlog::default_logger()),
        executor_(std::move(executor)) {
  }

  Transport(const Transport &) = delete;
  Transport(Transport &&) = delete;

  auto operator=(const Transport &) -> Transport & = delete;
  auto operator=(Transport &&) -> Transport & = delete;

  virtual ~Transport() = default;

  virtual auto Start()
      -> asio::awaitable<std::expected<void, error::RpcError>> = 0;

  virtual auto Close()
      -> asio::awaitable<std::expected<void, error::RpcError>> = 0;

  /// @brief Writes one message followed by a single line terminator and
  /// completes once the bytes have been handed to the operating system.
  virtual auto SendMessage(std::string message)
      -> asio::awaitable<std::expected<void, error::RpcError>> = 0;

  /// @brief Waits for the next non-blank line.
  /// @return The line without its terminator, or std::nullopt once the peer
  /// has closed the stream.
  virtual auto ReceiveMessage() -> asio::awaitable<
      std::expected<std::optional<std::string>, error::RpcError>> = 0;

  [[nodiscard]] auto GetExecutor() const -> asio::any_io_executor {
    return executor_;
  }

 protected:
  auto Logger() -> std::shared_ptr<spdlog::logger> {
    return logger_;
  }

 private:
  std::shared_ptr<spdlog::logger> logger_;
  asio::any_io_executor executor_;
};

}  // namespace mcpserver::transport
