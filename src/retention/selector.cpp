#include <snapkeep/retention/bucket.hpp>
#include <snapkeep/retention/selector.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <optional>
#include <utility>

namespace snapkeep::retention {

namespace {

bool newer_first(const schema::snapshot_t& a, const schema::snapshot_t& b) {
  if (a.created_at != b.created_at) {
    return a.created_at > b.created_at;
  }
  return a.identifier > b.identifier;
}

// Marks the representatives of the newest `limit` buckets and returns how
// many snapshots were marked.
std::size_t select_representatives(
    std::vector<schema::classified_snapshot_t>& entries,
    const schema::granularity_t granularity,
    const uint32_t limit) {
  auto last_bucket = std::optional<bucket_index_t>{};
  auto kept = std::size_t{0};
  for (auto& entry : entries) {
    if (entry.snapshot.is_protected) {
      continue;
    }
    const auto bucket = bucket_index(granularity, entry.snapshot.created_at);
    if (last_bucket == bucket) {
      continue;
    }
    if (kept == limit) {
      break;
    }
    last_bucket = bucket;
    entry.kept_by.set(schema::to_index(granularity));
    ++kept;
  }
  return kept;
}

}  // namespace

schema::classification_t classify(std::vector<schema::snapshot_t> snapshots,
                                  const schema::retention_policy_t& policy,
                                  const schema::timestamp_t& now) {
  std::ranges::sort(snapshots, newer_first);

  auto classification = schema::classification_t{};
  classification.entries.reserve(snapshots.size());
  for (auto& snapshot : snapshots) {
    if (snapshot.created_at > now) {
      ++classification.future_dated;
    }
    classification.entries.push_back(
        schema::classified_snapshot_t{.snapshot = std::move(snapshot)});
  }

  for (const auto granularity : schema::kGranularities) {
    const auto limit = schema::count_of(policy, granularity);
    if (limit == 0) {
      continue;
    }
    classification.kept_per_granularity[schema::to_index(granularity)] =
        select_representatives(classification.entries, granularity, limit);
  }

  for (auto& entry : classification.entries) {
    entry.decision = entry.snapshot.is_protected || entry.kept_by.any()
                         ? schema::decision_t::keep
                         : schema::decision_t::destroy;
    spdlog::debug("{} {} kept_by={}", schema::to_string(entry.decision),
                  entry.snapshot.identifier, entry.kept_by.to_string());
  }
  return classification;
}

std::size_t count_decisions(const schema::classification_t& classification,
                            const schema::decision_t decision) {
  return static_cast<std::size_t>(std::ranges::count_if(
      classification.entries,
      [decision](const schema::classified_snapshot_t& entry) {
        return entry.decision == decision;
      }));
}

}  // namespace snapkeep::retention
