#include <array>
#include <csignal>
#include <string>

#include <asio.hpp>
#include <catch2/catch_test_macros.hpp>
#include <unistd.h>

#include "mcpserver/transport/stdio_transport.hpp"

#include "../common/test_utils.hpp"

using mcpserver::error::RpcErrorCode;
using mcpserver::test::MakeNullLogger;
using mcpserver::test::RunAwaitable;
using mcpserver::transport::StdioTransport;

namespace {

// Owns both ends of an anonymous pipe.
class Pipe {
 public:
  Pipe() {
    REQUIRE(::pipe(fds_.data()) == 0);
  }

  ~Pipe() {
    CloseRead();
    CloseWrite();
  }

  Pipe(const Pipe&) = delete;
  auto operator=(const Pipe&) -> Pipe& = delete;

  [[nodiscard]] auto ReadEnd() const -> int {
    return fds_[0];
  }

  [[nodiscard]] auto WriteEnd() const -> int {
    return fds_[1];
  }

  void Write(const std::string& data) const {
    REQUIRE(
        ::write(fds_[1], data.data(), data.size()) ==
        static_cast<ssize_t>(data.size()));
  }

  auto ReadAll() -> std::string {
    CloseWrite();
    std::string out;
    std::array<char, 256> buffer{};
    ssize_t n = 0;
    while ((n = ::read(fds_[0], buffer.data(), buffer.size())) > 0) {
      out.append(buffer.data(), static_cast<std::size_t>(n));
    }
    return out;
  }

  void CloseRead() {
    if (fds_[0] >= 0) {
      ::close(fds_[0]);
      fds_[0] = -1;
    }
  }

  void CloseWrite() {
    if (fds_[1] >= 0) {
      ::close(fds_[1]);
      fds_[1] = -1;
    }
  }

 private:
  std::array<int, 2> fds_{-1, -1};
};

}  // namespace

TEST_CASE(
    "StdioTransport reads newline-delimited messages", "[StdioTransport]") {
  asio::io_context io_ctx;
  Pipe input;
  Pipe output;

  input.Write("{\"a\":1}\r\n\n  \n{\"b\":2}\n{\"c\":3}");
  input.CloseWrite();

  StdioTransport transport(
      io_ctx.get_executor(), input.ReadEnd(), output.WriteEnd(),
      MakeNullLogger());
  REQUIRE(RunAwaitable(io_ctx, transport.Start()).has_value());

  auto first = RunAwaitable(io_ctx, transport.ReceiveMessage());
  REQUIRE(first.has_value());
  REQUIRE(first->value() == "{\"a\":1}");

  auto second = RunAwaitable(io_ctx, transport.ReceiveMessage());
  REQUIRE(second->value() == "{\"b\":2}");

  auto last = RunAwaitable(io_ctx, transport.ReceiveMessage());
  REQUIRE(last->value() == "{\"c\":3}");

  auto eof = RunAwaitable(io_ctx, transport.ReceiveMessage());
  REQUIRE(eof.has_value());
  REQUIRE_FALSE(eof->has_value());

  REQUIRE(RunAwaitable(io_ctx, transport.Close()).has_value());
}

TEST_CASE("StdioTransport writes one line per message", "[StdioTransport]") {
  asio::io_context io_ctx;
  Pipe input;
  Pipe output;

  {
    StdioTransport transport(
        io_ctx.get_executor(), input.ReadEnd(), output.WriteEnd(),
        MakeNullLogger());
    REQUIRE(RunAwaitable(io_ctx, transport.Start()).has_value());

    auto sent_1 = RunAwaitable(io_ctx, transport.SendMessage("{\"id\":1}"));
    REQUIRE(sent_1.has_value());
    auto sent_2 = RunAwaitable(io_ctx, transport.SendMessage("{\"id\":2}"));
    REQUIRE(sent_2.has_value());

    auto embedded = RunAwaitable(io_ctx, transport.SendMessage("a\nb"));
    REQUIRE_FALSE(embedded.has_value());
    REQUIRE(embedded.error().Code() == RpcErrorCode::kTransportError);

    REQUIRE(RunAwaitable(io_ctx, transport.Close()).has_value());
  }

  REQUIRE(output.ReadAll() == "{\"id\":1}\n{\"id\":2}\n");
}

TEST_CASE("StdioTransport requires Start before use", "[StdioTransport]") {
  asio::io_context io_ctx;
  Pipe input;
  Pipe output;

  StdioTransport transport(
      io_ctx.get_executor(), input.ReadEnd(), output.WriteEnd(),
      MakeNullLogger());

  auto received = RunAwaitable(io_ctx, transport.ReceiveMessage());
  REQUIRE_FALSE(received.has_value());

  auto sent = RunAwaitable(io_ctx, transport.SendMessage("{}"));
  REQUIRE_FALSE(sent.has_value());

  REQUIRE(RunAwaitable(io_ctx, transport.Start()).has_value());
  REQUIRE_FALSE(RunAwaitable(io_ctx, transport.Start()).has_value());
}

TEST_CASE("StdioTransport reports a broken output pipe", "[StdioTransport]") {
  asio::io_context io_ctx;
  Pipe input;
  Pipe output;
  output.CloseRead();
  std::signal(SIGPIPE, SIG_IGN);

  StdioTransport transport(
      io_ctx.get_executor(), input.ReadEnd(), output.WriteEnd(),
      MakeNullLogger());
  REQUIRE(RunAwaitable(io_ctx, transport.Start()).has_value());

  auto sent = RunAwaitable(io_ctx, transport.SendMessage("{}"));
  REQUIRE_FALSE(sent.has_value());
  REQUIRE(sent.error().Code() == RpcErrorCode::kTransportError);
}
