#pragma once

#include <expected>
#include <memory>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "mcpserver/endpoint/response.hpp"
#include "mcpserver/error/error.hpp"
#include "mcpserver/transport/transport.hpp"

namespace mcpserver::endpoint {

/**
 * @brief Serializes responses as compact single-line JSON and writes them.
 *
 * A failed write is returned as a transport error; the stream is not usable
 * afterwards.
 */
class ResponseWriter {
 public:
  explicit ResponseWriter(
      transport::Transport& transport,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto Write(const Response& response)
      -> asio::awaitable<std::expected<void, error::RpcError>>;

  static auto Serialize(const Response& response) -> std::string;

 private:
  transport::Transport& transport_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace mcpserver::endpoint
