#pragma once

#include <array>
#include <expected>
#include <memory>
#include <optional>
#include <string>

#include <asio.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <unistd.h>

#include "mcpserver/error/error.hpp"
#include "mcpserver/transport/line_framer.hpp"
#include "mcpserver/transport/transport.hpp"

namespace mcpserver::transport {

/**
 * @brief Newline-delimited transport over a pair of POSIX descriptors.
 *
 * Defaults to the process standard input and output. The descriptors are
 * duplicated on construction, so closing the transport never closes the
 * caller's originals.
 */
class StdioTransport : public Transport {
 public:
  explicit StdioTransport(
      asio::any_io_executor executor, int input_fd = STDIN_FILENO,
      int output_fd = STDOUT_FILENO,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  ~StdioTransport() override;

  StdioTransport(const StdioTransport&) = delete;
  auto operator=(const StdioTransport&) -> StdioTransport& = delete;

  StdioTransport(StdioTransport&&) = delete;
  auto operator=(StdioTransport&&) -> StdioTransport& = delete;

  auto Start()
      -> asio::awaitable<std::expected<void, error::RpcError>> override;

  auto Close()
      -> asio::awaitable<std::expected<void, error::RpcError>> override;

  auto SendMessage(std::string message)
      -> asio::awaitable<std::expected<void, error::RpcError>> override;

  auto ReceiveMessage() -> asio::awaitable<
      std::expected<std::optional<std::string>, error::RpcError>> override;

 private:
  void CloseDescriptors();

  asio::posix::stream_descriptor input_;
  asio::posix::stream_descriptor output_;
  LineFramer framer_;
  bool is_started_{false};
  bool is_closed_{false};
  bool input_exhausted_{false};

  std::array<char, 4096> read_buffer_{};
};

}  // namespace mcpserver::transport
