#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace snapkeep::schema {

// Lookup helpers over constexpr (key, enum) tables. Key is a std::string_view
// for display names and a char for single-letter unit symbols.
template <typename Key, typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const Key value,
    const std::array<std::pair<Key, Enum>, N>& mappings) {
  for (const auto& [key, enum_value] : mappings) {
    if (key == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Key, typename Enum, std::size_t N>
constexpr std::optional<Key> to_string(
    const Enum value,
    const std::array<std::pair<Key, Enum>, N>& mappings) {
  for (const auto& [key, enum_value] : mappings) {
    if (enum_value == value) {
      return key;
    }
  }
  return std::nullopt;
}

}  // namespace snapkeep::schema
