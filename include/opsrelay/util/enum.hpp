#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <array>
#include <cctype>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace opsrelay {

template <typename T>
[[nodiscard]] auto parse(std::string_view s) noexcept -> T;

template <typename E>
[[nodiscard]] inline auto enum_to_string(E value) -> std::string {
  return std::string{to_string_view(value)};
}

namespace util {

[[nodiscard]] inline auto normalize_enum_token(std::string_view token)
    -> std::string {
  auto alnum_lower =
      token | std::views::filter([](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
      }) |
      std::views::transform([](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      });
  return std::string(alnum_lower.begin(), alnum_lower.end());
}

[[nodiscard]] inline auto enum_name_to_snake_case(std::string_view name)
    -> std::string {
  std::string out;
  out.reserve(name.size() * 2);

  for (auto [i, ch] : name | std::views::enumerate) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isupper(uch) != 0 && i > 0) {
      const bool prev_lower =
          std::islower(static_cast<unsigned char>(name[i - 1])) != 0;
      const bool next_lower =
          (static_cast<std::size_t>(i) + 1 < name.size()) &&
          std::islower(static_cast<unsigned char>(name[i + 1])) != 0;
      if (prev_lower || next_lower) {
        out.push_back('_');
      }
    }
    out.push_back(static_cast<char>(std::tolower(uch)));
  }

  return out;
}

template <typename E>
[[nodiscard]] inline auto
enum_to_snake_case_view(E value, std::string_view fallback = "unknown") noexcept
    -> std::string_view {
  using descriptors = boost::describe::describe_enumerators<E>;
  constexpr std::size_t kCount = boost::mp11::mp_size<descriptors>::value;

  static const auto table = [] {
    std::array<std::pair<E, std::string>, kCount> out{};
    std::size_t i = 0;
    boost::mp11::mp_for_each<descriptors>([&](auto descriptor) {
      out[i++] = {descriptor.value, enum_name_to_snake_case(descriptor.name)};
    });
    return out;
  }();

  for (const auto &[enum_value, text] : table) {
    if (enum_value == value) {
      return text;
    }
  }

  return fallback;
}

/// Strict parse: nullopt when `input` names no enumerator.
template <typename E>
[[nodiscard]] inline auto try_parse_enum(std::string_view input) noexcept
    -> std::optional<E> {
  const auto normalized_input = normalize_enum_token(input);
  std::optional<E> out;
  boost::mp11::mp_for_each<boost::describe::describe_enumerators<E>>(
      [&](auto descriptor) {
        if (normalized_input == normalize_enum_token(descriptor.name)) {
          out = descriptor.value;
        }
      });
  return out;
}

template <typename E>
[[nodiscard]] inline auto parse_enum(std::string_view input,
                                     E default_value) noexcept -> E {
  return try_parse_enum<E>(input).value_or(default_value);
}

} // namespace util

#define OPSRELAY_DEFINE_ENUM_SERDE(EnumType, DefaultValue)                     \
  [[nodiscard]] inline auto to_string_view(EnumType value) noexcept            \
      -> std::string_view {                                                    \
    return ::opsrelay::util::enum_to_snake_case_view(value);                   \
  }                                                                            \
  template <>                                                                  \
  [[nodiscard]] inline auto parse<EnumType>(std::string_view s) noexcept       \
      -> EnumType {                                                            \
    return ::opsrelay::util::parse_enum(s, DefaultValue);                      \
  }

} // namespace opsrelay
