#include "mcpserver/transport/stdio_transport.hpp"

#include <cerrno>
#include <system_error>

#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>
#include <spdlog/spdlog.h>

namespace mcpserver::transport {

using error::Ok;
using error::RpcError;
using error::RpcErrorCode;

namespace {

auto DuplicateDescriptor(int fd) -> int {
  int copy = ::dup(fd);
  if (copy < 0) {
    throw std::system_error(
        errno, std::generic_category(), "Failed to duplicate descriptor");
  }
  return copy;
}

}  // namespace

StdioTransport::StdioTransport(
    asio::any_io_executor executor, int input_fd, int output_fd,
    std::shared_ptr<spdlog::logger> logger)
    : Transport(std::move(executor), std::move(logger)),
      input_(GetExecutor(), DuplicateDescriptor(input_fd)),
      output_(GetExecutor(), DuplicateDescriptor(output_fd)) {
}

StdioTransport::~StdioTransport() {
  if (!is_closed_) {
    CloseDescriptors();
  }
}

auto StdioTransport::Start()
    -> asio::awaitable<std::expected<void, error::RpcError>> {
  if (is_started_) {
    Logger()->debug("StdioTransport already started");
    co_return RpcError::UnexpectedFromCode(
        RpcErrorCode::kTransportError, "StdioTransport already started");
  }

  if (is_closed_) {
    Logger()->error("StdioTransport cannot start a closed transport");
    co_return RpcError::UnexpectedFromCode(
        RpcErrorCode::kTransportError, "Cannot start a closed transport");
  }

  is_started_ = true;
  Logger()->debug("StdioTransport started");
  co_return Ok();
}

auto StdioTransport::Close()
    -> asio::awaitable<std::expected<void, error::RpcError>> {
  if (is_closed_) {
    Logger()->debug("StdioTransport already closed");
    co_return Ok();
  }

  CloseDescriptors();
  Logger()->info("StdioTransport closed");
  co_return Ok();
}

auto StdioTransport::SendMessage(std::string message)
    -> asio::awaitable<std::expected<void, error::RpcError>> {
  if (is_closed_ || !is_started_) {
    co_return RpcError::UnexpectedFromCode(
        RpcErrorCode::kTransportError,
        "Attempt to send message on a transport that is not open");
  }

  if (message.find('\n') != std::string::npos) {
    co_return RpcError::UnexpectedFromCode(
        RpcErrorCode::kTransportError,
        "Message contains an embedded line terminator");
  }

  Logger()->debug("StdioTransport sending message: {}", message);
  message.push_back('\n');

  std::error_code ec;
  co_await asio::async_write(
      output_, asio::buffer(message),
      asio::redirect_error(asio::use_awaitable, ec));
  if (ec) {
    Logger()->error("StdioTransport error sending message: {}", ec.message());
    co_return RpcError::UnexpectedFromCode(
        RpcErrorCode::kTransportError, "Write error: " + ec.message());
  }

  co_return Ok();
}

auto StdioTransport::ReceiveMessage() -> asio::awaitable<
    std::expected<std::optional<std::string>, error::RpcError>> {
  if (is_closed_ || !is_started_) {
    co_return RpcError::UnexpectedFromCode(
        RpcErrorCode::kTransportError,
        "Attempt to receive message on a transport that is not open");
  }

  while (true) {
    if (auto line = framer_.NextLine()) {
      Logger()->trace("StdioTransport received line: {}", *line);
      co_return line;
    }

    if (input_exhausted_) {
      auto rest = framer_.TakeRemainder();
      if (rest) {
        Logger()->trace("StdioTransport received final line: {}", *rest);
      } else {
        Logger()->debug("StdioTransport reached end of input");
      }
      co_return rest;
    }

    std::error_code ec;
    std::size_t bytes_read = co_await input_.async_read_some(
        asio::buffer(read_buffer_),
        asio::redirect_error(asio::use_awaitable, ec));

    if (ec == asio::error::eof) {
      input_exhausted_ = true;
      continue;
    }
    if (ec) {
      Logger()->error(
          "StdioTransport error receiving message: {}", ec.message());
      co_return RpcError::UnexpectedFromCode(
          RpcErrorCode::kTransportError, "Read error: " + ec.message());
    }

    framer_.Append(std::string_view(read_buffer_.data(), bytes_read));
  }
}

void StdioTransport::CloseDescriptors() {
  is_closed_ = true;

  std::error_code ec;
  input_.close(ec);
  if (ec) {
    Logger()->warn("StdioTransport error closing input: {}", ec.message());
  }
  output_.close(ec);
  if (ec) {
    Logger()->warn("StdioTransport error closing output: {}", ec.message());
  }
}

}  // namespace mcpserver::transport
