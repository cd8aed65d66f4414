#include "mcpserver/endpoint/response_writer.hpp"

#include <string>

namespace mcpserver::endpoint {

ResponseWriter::ResponseWriter(
    transport::Transport& transport, std::shared_ptr<spdlog::logger> logger)
    : transport_(transport),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

auto ResponseWriter::Write(const Response& response)
    -> asio::awaitable<std::expected<void, error::RpcError>> {
  auto message = Serialize(response);
  logger_->debug("ResponseWriter sending raw json: {}", message);

  auto sent = co_await transport_.SendMessage(std::move(message));
  if (!sent) {
    logger_->error(
        "ResponseWriter failed to write response for id {}: {}",
        response.GetId().dump(), sent.error().Message());
    co_return sent;
  }

  logger_->info(
      "ResponseWriter sent {} response for id: {}",
      response.IsSuccess() ? "success" : "error", response.GetId().dump());
  co_return sent;
}

auto ResponseWriter::Serialize(const Response& response) -> std::string {
  // Compact output never contains a raw newline; bad UTF-8 is replaced
  // rather than thrown on.
  return response.ToJson().dump(
      -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace mcpserver::endpoint
