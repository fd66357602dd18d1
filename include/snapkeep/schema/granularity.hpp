#pragma once

#include <snapkeep/schema/enum_string.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: granularity.
// Retention workflow: the five fixed time scales a policy can keep snapshots
// at. The set is closed; each value doubles as an index into policy counts.
namespace snapkeep::schema {

enum class granularity_t : uint8_t {
  hourly = 0,
  daily = 1,
  weekly = 2,
  monthly = 3,
  yearly = 4,
};

inline constexpr auto kGranularityCount = std::size_t{5};

inline constexpr auto kGranularities = std::array{
    granularity_t::hourly, granularity_t::daily, granularity_t::weekly,
    granularity_t::monthly, granularity_t::yearly};

inline constexpr auto kGranularityMappings = std::array{
    std::pair<std::string_view, granularity_t>{"hourly",
                                               granularity_t::hourly},
    std::pair<std::string_view, granularity_t>{"daily", granularity_t::daily},
    std::pair<std::string_view, granularity_t>{"weekly",
                                               granularity_t::weekly},
    std::pair<std::string_view, granularity_t>{"monthly",
                                               granularity_t::monthly},
    std::pair<std::string_view, granularity_t>{"yearly",
                                               granularity_t::yearly},
};

inline constexpr auto kGranularityUnits = std::array{
    std::pair<char, granularity_t>{'h', granularity_t::hourly},
    std::pair<char, granularity_t>{'d', granularity_t::daily},
    std::pair<char, granularity_t>{'w', granularity_t::weekly},
    std::pair<char, granularity_t>{'m', granularity_t::monthly},
    std::pair<char, granularity_t>{'y', granularity_t::yearly},
};

constexpr std::size_t to_index(const granularity_t value) {
  return static_cast<std::size_t>(value);
}

inline constexpr std::string_view to_string(const granularity_t value) {
  return to_string(value, kGranularityMappings).value_or("unknown");
}

inline constexpr std::optional<granularity_t> try_from_unit(const char unit) {
  return from_string(unit, kGranularityUnits);
}

inline constexpr char to_unit(const granularity_t value) {
  return to_string(value, kGranularityUnits).value_or('?');
}

}  // namespace snapkeep::schema
