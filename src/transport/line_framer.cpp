#include "mcpserver/transport/line_framer.hpp"

#include <algorithm>
#include <cctype>

namespace mcpserver::transport {

namespace {

auto StripCarriageReturn(std::string_view line) -> std::string_view {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return line;
}

}  // namespace

void LineFramer::Append(std::string_view data) {
  Compact();
  buffer_.append(data);
}

auto LineFramer::NextLine() -> std::optional<std::string> {
  while (true) {
    auto newline = buffer_.find('\n', read_pos_);
    if (newline == std::string::npos) {
      return std::nullopt;
    }

    auto line = StripCarriageReturn(
        std::string_view(buffer_).substr(read_pos_, newline - read_pos_));
    read_pos_ = newline + 1;

    if (!IsBlank(line)) {
      return std::string(line);
    }
  }
}

auto LineFramer::TakeRemainder() -> std::optional<std::string> {
  auto rest = StripCarriageReturn(std::string_view(buffer_).substr(read_pos_));
  std::optional<std::string> line;
  if (!IsBlank(rest)) {
    line = std::string(rest);
  }
  buffer_.clear();
  read_pos_ = 0;
  return line;
}

auto LineFramer::IsBlank(std::string_view line) -> bool {
  return std::ranges::all_of(line, [](unsigned char c) {
    return std::isspace(c) != 0;
  });
}

void LineFramer::Compact() {
  if (read_pos_ > 0) {
    buffer_.erase(0, read_pos_);
    read_pos_ = 0;
  }
}

}  // namespace mcpserver::transport
