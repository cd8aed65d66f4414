#pragma once

#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "mcpserver/endpoint/request.hpp"
#include "mcpserver/endpoint/types.hpp"
#include "mcpserver/error/error.hpp"

namespace mcpserver::endpoint {

enum class MalformedKind {
  // The line is not JSON at all; answered with id null.
  kUnparseable,
  // Has an id but does not decode as a request; answered with that id.
  kBadRequest,
  // Has a method and no id but does not decode; logged only.
  kBadNotification,
  // Neither id nor method; nothing to correlate a reply with.
  kNotRpc,
};

struct MalformedMessage {
  MalformedKind kind;
  RequestId id;
  error::RpcError error;

  [[nodiscard]] auto RequiresResponse() const -> bool {
    return kind == MalformedKind::kUnparseable ||
           kind == MalformedKind::kBadRequest;
  }
};

using ClassifiedMessage = std::variant<Request, Notification, MalformedMessage>;

/**
 * @brief Decides what a single line of input is.
 *
 * A message with an "id" member is always a request, even when it also has a
 * "method". A message with a "method" and no "id" is a notification. Anything
 * else, including text that is not JSON, is malformed.
 *
 * @param line One non-blank line without its terminator.
 */
auto ClassifyMessage(std::string_view line) -> ClassifiedMessage;

}  // namespace mcpserver::endpoint
