#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

namespace mcpserver::endpoint {

constexpr std::string_view kJsonRpcVersion = "2.0";

// Request ids are opaque and echoed back exactly as received, so they are
// kept as raw JSON values rather than narrowed to a number or string.
using RequestId = nlohmann::json;

}  // namespace mcpserver::endpoint
