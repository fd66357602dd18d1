#pragma once

#include <snapkeep/schema/decision.hpp>
#include <snapkeep/schema/granularity.hpp>
#include <snapkeep/schema/snapshot.hpp>

#include <array>
#include <bitset>
#include <cstddef>
#include <vector>

// Schema type: classification.
// Retention workflow: keep/destroy verdict for every snapshot of one dataset,
// newest first, with the granularities whose window kept each snapshot.
namespace snapkeep::schema {

using granularity_set_t = std::bitset<kGranularityCount>;

struct classified_snapshot_t final {
  snapshot_t snapshot;
  decision_t decision{decision_t::destroy};
  granularity_set_t kept_by;
};

struct classification_t final {
  std::vector<classified_snapshot_t> entries;
  std::array<std::size_t, kGranularityCount> kept_per_granularity{};
  std::size_t future_dated{};
};

}  // namespace snapkeep::schema
