#pragma once

#include <snapkeep/schema/granularity.hpp>

#include <array>
#include <cstdint>

// Schema type: retention policy.
// Retention workflow: how many buckets to keep per granularity, as parsed from
// the dataset property (`h24d30w8m6y1`). A zero count disables the
// granularity.
namespace snapkeep::schema {

inline constexpr auto kMaxPolicyCount = uint32_t{1'000'000};

struct retention_policy_t final {
  std::array<uint32_t, kGranularityCount> counts{};

  friend bool operator==(const retention_policy_t&,
                         const retention_policy_t&) = default;
};

inline constexpr uint32_t count_of(const retention_policy_t& policy,
                                   const granularity_t granularity) {
  return policy.counts[to_index(granularity)];
}

inline constexpr bool retains_nothing(const retention_policy_t& policy) {
  for (const auto count : policy.counts) {
    if (count != 0) {
      return false;
    }
  }
  return true;
}

}  // namespace snapkeep::schema
