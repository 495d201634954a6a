#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace opsrelay::utf8 {

[[nodiscard]] constexpr auto is_continuation(char c) noexcept -> bool {
  return (static_cast<unsigned char>(c) & 0xC0U) == 0x80U;
}

// Sequence length announced by a lead byte, 0 for anything that is not one.
[[nodiscard]] constexpr auto sequence_length(char lead) noexcept
    -> std::size_t {
  const auto b = static_cast<unsigned char>(lead);
  if (b < 0x80U) {
    return 1;
  }
  if ((b & 0xE0U) == 0xC0U) {
    return 2;
  }
  if ((b & 0xF0U) == 0xE0U) {
    return 3;
  }
  if ((b & 0xF8U) == 0xF0U) {
    return 4;
  }
  return 0;
}

/// Largest position <= `pos` that does not split a code point.
[[nodiscard]] constexpr auto floor_boundary(std::string_view text,
                                            std::size_t pos) noexcept
    -> std::size_t {
  if (pos >= text.size()) {
    return text.size();
  }
  std::size_t cut = pos;
  // A code point has at most three continuation bytes.
  while (cut > 0 && pos - cut < 3 && is_continuation(text[cut])) {
    --cut;
  }
  return is_continuation(text[cut]) ? pos : cut;
}

/// Length of the prefix of `text` that ends on a code point boundary. Only a
/// truncated trailing sequence is held back; malformed bytes pass through.
[[nodiscard]] constexpr auto complete_prefix(std::string_view text) noexcept
    -> std::size_t {
  const std::size_t n = text.size();
  for (std::size_t back = 1; back <= 4 && back <= n; ++back) {
    const char c = text[n - back];
    if (is_continuation(c)) {
      continue;
    }
    const auto len = sequence_length(c);
    return len > back ? n - back : n;
  }
  return n;
}

/// Joins raw reads so every piece handed on ends on a code point boundary.
class ChunkJoiner {
public:
  /// Returns the complete part of `pending + chunk`, keeping any trailing
  /// partial sequence for the next call.
  [[nodiscard]] auto push(std::string_view chunk) -> std::string {
    pending_.append(chunk);
    const auto keep_from = complete_prefix(pending_);
    std::string out = pending_.substr(0, keep_from);
    pending_.erase(0, keep_from);
    return out;
  }

  /// Whatever is still held back, for end of stream.
  [[nodiscard]] auto flush() -> std::string {
    return std::exchange(pending_, {});
  }

private:
  std::string pending_;
};

} // namespace opsrelay::utf8
