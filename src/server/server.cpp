#include "mcpserver/server/server.hpp"

#include <stdexcept>

#include "mcpserver/endpoint/message.hpp"

namespace mcpserver::server {

auto ToString(ServerState state) -> std::string_view {
  switch (state) {
    case ServerState::kIdle:
      return "idle";
    case ServerState::kReadingLine:
      return "reading-line";
    case ServerState::kClassifying:
      return "classifying";
    case ServerState::kDispatching:
      return "dispatching";
    case ServerState::kWriting:
      return "writing";
    case ServerState::kShutdownClean:
      return "shutdown-clean";
    case ServerState::kShutdownFault:
      return "shutdown-fault";
  }
  return "unknown";
}

Server::Server(
    std::unique_ptr<transport::Transport> transport,
    std::shared_ptr<spdlog::logger> logger)
    : transport_(std::move(transport)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      dispatcher_(logger_),
      writer_(
          transport_ ? *transport_
                     : throw std::invalid_argument("Transport is not set"),
          logger_) {
  logger_->info("Server initialized with transport");
}

auto Server::Run() -> asio::awaitable<std::expected<void, error::RpcError>> {
  if (state_ != ServerState::kIdle) {
    co_return error::RpcError::UnexpectedFromCode(
        error::RpcErrorCode::kInternalError, "Server has already run");
  }

  logger_->info("Server starting");
  auto started = co_await transport_->Start();
  if (!started) {
    co_return co_await Fail(started.error());
  }

  while (true) {
    TransitionTo(ServerState::kReadingLine);
    auto line = co_await transport_->ReceiveMessage();
    if (!line) {
      co_return co_await Fail(line.error());
    }
    if (!line->has_value()) {
      break;
    }

    TransitionTo(ServerState::kClassifying);
    auto message = endpoint::ClassifyMessage(**line);

    TransitionTo(ServerState::kDispatching);
    auto response = co_await dispatcher_.Dispatch(message);
    ++messages_processed_;

    if (response.has_value()) {
      TransitionTo(ServerState::kWriting);
      auto written = co_await writer_.Write(*response);
      if (!written) {
        co_return co_await Fail(written.error());
      }
    }
  }

  logger_->info(
      "Server reached end of input after {} messages", messages_processed_);
  auto closed = co_await transport_->Close();
  if (!closed) {
    logger_->warn(
        "Server failed to close transport: {}", closed.error().Message());
  }
  TransitionTo(ServerState::kShutdownClean);
  logger_->info("Server shut down cleanly");
  co_return error::Ok();
}

void Server::TransitionTo(ServerState state) {
  logger_->trace("Server state {} -> {}", ToString(state_), ToString(state));
  state_ = state;
}

auto Server::Fail(error::RpcError error)
    -> asio::awaitable<std::expected<void, error::RpcError>> {
  logger_->error(
      "Server stopping on transport failure in state {}: {}",
      ToString(state_), error.Message());
  auto closed = co_await transport_->Close();
  if (!closed) {
    logger_->warn(
        "Server failed to close transport: {}", closed.error().Message());
  }
  TransitionTo(ServerState::kShutdownFault);
  co_return std::unexpected(std::move(error));
}

}  // namespace mcpserver::server
