#pragma once

#include <memory>
#include <utility>

#include <asio.hpp>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

namespace mcpserver::test {

// Runs a coroutine to completion on the given context and hands back its
// result; exceptions thrown inside, including failed REQUIREs, are rethrown.
template <typename T>
auto RunAwaitable(asio::io_context& io_ctx, asio::awaitable<T> awaitable)
    -> T {
  auto future =
      asio::co_spawn(io_ctx, std::move(awaitable), asio::use_future);
  io_ctx.run();
  io_ctx.restart();
  return future.get();
}

// Keeps test output clean while still exercising every log call.
inline auto MakeNullLogger() -> std::shared_ptr<spdlog::logger> {
  auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>("test_logger", sink);
  logger->set_level(spdlog::level::trace);
  return logger;
}

}  // namespace mcpserver::test
