#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace remit::schema {

/// Fixed table of command-line / log names for an enum. Each name and each
/// value appears once.
template <typename Enum, std::size_t N>
using enum_names_t = std::array<std::pair<std::string_view, Enum>, N>;

/// Enum value for an exact (case-sensitive) `name`.
template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(const std::string_view name,
                                          const enum_names_t<Enum, N>& names) {
  for (const auto& [candidate, value] : names) {
    if (candidate == name) {
      return value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_names_t<Enum, N>& names) {
  for (const auto& [name, candidate] : names) {
    if (candidate == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// Name used in logs; "unknown" for a value missing from `names`.
template <typename Enum, std::size_t N>
constexpr std::string_view name_of(const Enum value,
                                   const enum_names_t<Enum, N>& names) {
  return to_string(value, names).value_or("unknown");
}

/// Parse an enum that publishes its table through a specialization.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view name) {
  static_cast<void>(name);
  return std::nullopt;
}

}  // namespace remit::schema
