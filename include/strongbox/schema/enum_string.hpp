#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace strongbox::schema {

template <typename Enum, std::size_t N>
using enum_names_t = std::array<std::pair<std::string_view, Enum>, N>;

/// Look up the enumerator registered under `name`.
template <typename Enum, std::size_t N>
constexpr std::optional<Enum> enum_from_name(
    const std::string_view name,
    const enum_names_t<Enum, N>& names) {
  for (const auto& [candidate, value] : names) {
    if (candidate == name) {
      return value;
    }
  }
  return std::nullopt;
}

/// Look up the name registered for `value`.
template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> enum_name(
    const Enum value,
    const enum_names_t<Enum, N>& names) {
  for (const auto& [name, candidate] : names) {
    if (candidate == value) {
      return name;
    }
  }
  return std::nullopt;
}

}  // namespace strongbox::schema
