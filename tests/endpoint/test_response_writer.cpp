#include <asio.hpp>
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "mcpserver/endpoint/response_writer.hpp"

#include "../common/mock_transport.hpp"
#include "../common/test_utils.hpp"

using mcpserver::endpoint::Response;
using mcpserver::endpoint::ResponseWriter;
using mcpserver::error::RpcErrorCode;
using mcpserver::test::MakeNullLogger;
using mcpserver::test::MockTransport;
using mcpserver::test::RunAwaitable;

TEST_CASE(
    "ResponseWriter writes compact single-line JSON", "[ResponseWriter]") {
  asio::io_context io_ctx;
  auto logger = MakeNullLogger();
  MockTransport transport(io_ctx.get_executor(), {}, logger);
  REQUIRE(RunAwaitable(io_ctx, transport.Start()).has_value());

  ResponseWriter writer(transport, logger);

  SECTION("Success response") {
    auto response = Response::CreateSuccess(
        {{"text", "line one\nline two"}, {"list", {1, 2}}}, 5);
    auto written = RunAwaitable(io_ctx, writer.Write(response));

    REQUIRE(written.has_value());
    REQUIRE(transport.GetSentMessages().size() == 1);
    const auto& line = transport.GetLastSentMessage();
    REQUIRE(line.find('\n') == std::string::npos);

    auto json = nlohmann::json::parse(line);
    REQUIRE(json["id"] == 5);
    REQUIRE(json["result"]["text"] == "line one\nline two");
  }

  SECTION("Invalid UTF-8 in a result is replaced instead of thrown") {
    auto response = Response::CreateSuccess(std::string("bad \xff byte"), 1);
    auto written = RunAwaitable(io_ctx, writer.Write(response));

    REQUIRE(written.has_value());
    REQUIRE_NOTHROW(nlohmann::json::parse(transport.GetLastSentMessage()));
  }
}

TEST_CASE("ResponseWriter reports transport failures", "[ResponseWriter]") {
  asio::io_context io_ctx;
  auto logger = MakeNullLogger();
  MockTransport transport(io_ctx.get_executor(), {}, logger);
  REQUIRE(RunAwaitable(io_ctx, transport.Start()).has_value());
  transport.FailWritesAfter(0);

  ResponseWriter writer(transport, logger);
  auto response = Response::CreateError(RpcErrorCode::kInternalError, 1);
  auto written = RunAwaitable(io_ctx, writer.Write(response));

  REQUIRE_FALSE(written.has_value());
  REQUIRE(written.error().Code() == RpcErrorCode::kTransportError);
  REQUIRE(transport.GetSentMessages().empty());
}
