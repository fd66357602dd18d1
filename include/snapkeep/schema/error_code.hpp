#pragma once

#include <snapkeep/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace snapkeep::schema {

enum class error_code_t : uint32_t {
  invalid_policy = 1,
  catalog_error = 2,
  subsystem_error = 3,
  safety_violation = 4,
  invalid_argument = 5,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code_t>{"invalid_policy",
                                              error_code_t::invalid_policy},
    std::pair<std::string_view, error_code_t>{"catalog_error",
                                              error_code_t::catalog_error},
    std::pair<std::string_view, error_code_t>{"subsystem_error",
                                              error_code_t::subsystem_error},
    std::pair<std::string_view, error_code_t>{"safety_violation",
                                              error_code_t::safety_violation},
    std::pair<std::string_view, error_code_t>{"invalid_argument",
                                              error_code_t::invalid_argument},
};

inline constexpr std::string_view to_string(const error_code_t value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

}  // namespace snapkeep::schema
