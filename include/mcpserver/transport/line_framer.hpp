#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mcpserver::transport {

/**
 * @brief Splits a byte stream into newline-terminated lines.
 *
 * Bytes are appended as they arrive; complete lines are handed out without
 * their "\n" or "\r\n" terminator. Lines that contain only whitespace are
 * dropped.
 */
class LineFramer {
 public:
  void Append(std::string_view data);

  /// @brief Returns the next complete non-blank line, if one is buffered.
  auto NextLine() -> std::optional<std::string>;

  /// @brief Takes whatever follows the last terminator once the stream has
  /// ended; blank leftovers are discarded.
  auto TakeRemainder() -> std::optional<std::string>;

  [[nodiscard]] auto BufferedBytes() const -> std::size_t {
    return buffer_.size() - read_pos_;
  }

  static auto IsBlank(std::string_view line) -> bool;

 private:
  void Compact();

  std::string buffer_;
  std::size_t read_pos_{0};
};

}  // namespace mcpserver::transport
