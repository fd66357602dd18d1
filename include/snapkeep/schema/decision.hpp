#pragma once

#include <snapkeep/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace snapkeep::schema {

enum class decision_t : uint8_t { keep = 0, destroy = 1 };

inline constexpr auto kDecisionMappings = std::array{
    std::pair<std::string_view, decision_t>{"keep", decision_t::keep},
    std::pair<std::string_view, decision_t>{"destroy", decision_t::destroy},
};

inline constexpr std::string_view to_string(const decision_t value) {
  return to_string(value, kDecisionMappings).value_or("unknown");
}

}  // namespace snapkeep::schema
