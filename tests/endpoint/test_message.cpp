#include <variant>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlohmann/json.hpp>

#include "mcpserver/endpoint/message.hpp"

using mcpserver::endpoint::ClassifyMessage;
using mcpserver::endpoint::MalformedKind;
using mcpserver::endpoint::MalformedMessage;
using mcpserver::endpoint::Notification;
using mcpserver::endpoint::Request;
using mcpserver::error::RpcErrorCode;

TEST_CASE("ClassifyMessage recognizes requests", "[Message]") {
  auto message =
      ClassifyMessage(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");

  REQUIRE(std::holds_alternative<Request>(message));
  const auto& request = std::get<Request>(message);
  REQUIRE(request.GetMethod() == "tools/list");
  REQUIRE(request.GetId() == 1);
  REQUIRE_FALSE(request.GetParams().has_value());
}

TEST_CASE("ClassifyMessage recognizes notifications", "[Message]") {
  auto message = ClassifyMessage(
      R"({"jsonrpc":"2.0","method":"initialized","params":{}})");

  REQUIRE(std::holds_alternative<Notification>(message));
  REQUIRE(std::get<Notification>(message).GetMethod() == "initialized");
}

TEST_CASE("ClassifyMessage gives id priority over method", "[Message]") {
  auto message =
      ClassifyMessage(R"({"jsonrpc":"2.0","method":"initialized","id":"x"})");

  REQUIRE(std::holds_alternative<Request>(message));
  REQUIRE(std::get<Request>(message).GetId() == "x");
}

TEST_CASE("ClassifyMessage reports malformed input", "[Message]") {
  SECTION("Text that is not JSON") {
    auto message = ClassifyMessage("not json at all");

    REQUIRE(std::holds_alternative<MalformedMessage>(message));
    const auto& malformed = std::get<MalformedMessage>(message);
    REQUIRE(malformed.kind == MalformedKind::kUnparseable);
    REQUIRE(malformed.id.is_null());
    REQUIRE(malformed.error.Code() == RpcErrorCode::kParseError);
    REQUIRE(malformed.RequiresResponse());
    REQUIRE_THAT(
        std::string(malformed.error.Message()),
        Catch::Matchers::StartsWith("Parse error"));
  }

  SECTION("Truncated JSON") {
    auto message = ClassifyMessage(R"({"jsonrpc":"2.0","id":1,)");
    REQUIRE(
        std::get<MalformedMessage>(message).kind ==
        MalformedKind::kUnparseable);
  }

  SECTION("Request that fails to decode keeps its id") {
    auto message = ClassifyMessage(R"({"jsonrpc":"2.0","id":9})");

    const auto& malformed = std::get<MalformedMessage>(message);
    REQUIRE(malformed.kind == MalformedKind::kBadRequest);
    REQUIRE(malformed.id == 9);
    REQUIRE(malformed.error.Code() == RpcErrorCode::kInvalidParams);
    REQUIRE(malformed.RequiresResponse());
  }

  SECTION("Request with a non-string method") {
    auto message = ClassifyMessage(R"({"jsonrpc":"2.0","id":"a","method":7})");

    const auto& malformed = std::get<MalformedMessage>(message);
    REQUIRE(malformed.kind == MalformedKind::kBadRequest);
    REQUIRE(malformed.id == "a");
  }

  SECTION("Notification that fails to decode is not answered") {
    auto message =
        ClassifyMessage(R"({"jsonrpc":"1.0","method":"initialized"})");

    const auto& malformed = std::get<MalformedMessage>(message);
    REQUIRE(malformed.kind == MalformedKind::kBadNotification);
    REQUIRE_FALSE(malformed.RequiresResponse());
  }

  SECTION("Object with neither id nor method") {
    auto message = ClassifyMessage(R"({"jsonrpc":"2.0","result":1})");

    const auto& malformed = std::get<MalformedMessage>(message);
    REQUIRE(malformed.kind == MalformedKind::kNotRpc);
    REQUIRE_FALSE(malformed.RequiresResponse());
  }

  SECTION("JSON that is not an object") {
    for (const auto* line : {"[1,2,3]", "42", R"("id")", "null"}) {
      auto message = ClassifyMessage(line);
      REQUIRE(
          std::get<MalformedMessage>(message).kind == MalformedKind::kNotRpc);
    }
  }
}
