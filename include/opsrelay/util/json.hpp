#pragma once

#include "opsrelay/core/error.hpp"

#include <glaze/json.hpp>

#include <string>
#include <string_view>

namespace opsrelay {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

/// Reads a glaze-reflected struct, ignoring unknown keys.
template <typename T>
[[nodiscard]] auto read_json_as(std::string_view input) -> Result<T> {
  T value{};
  constexpr auto kOpts =
      glz::opts{.null_terminated = false, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

template <typename T>
[[nodiscard]] auto write_json_as(const T &value) -> Result<std::string> {
  std::string buffer;
  if (auto ec = glz::write_json(value, buffer); ec) {
    return fail(Error::ProtocolError);
  }
  return ok(std::move(buffer));
}

} // namespace opsrelay
