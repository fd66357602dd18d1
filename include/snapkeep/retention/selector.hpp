#pragma once

#include <snapkeep/schema/classification.hpp>
#include <snapkeep/schema/retention_policy.hpp>
#include <snapkeep/schema/snapshot.hpp>

#include <cstddef>
#include <vector>

namespace snapkeep::retention {

/// Decide which snapshots of one dataset survive under `policy`.
///
/// For each enabled granularity the newest snapshot of every bucket is the
/// bucket's representative; representatives of the `count` most recent
/// buckets are kept. A snapshot is kept iff it is protected or kept by at
/// least one granularity. Protected snapshots do not occupy bucket slots.
///
/// The result covers every input snapshot exactly once, newest first (ties
/// ordered by identifier, descending). `now` is only used to count
/// future-dated snapshots; it never changes a decision.
schema::classification_t classify(std::vector<schema::snapshot_t> snapshots,
                                  const schema::retention_policy_t& policy,
                                  const schema::timestamp_t& now);

std::size_t count_decisions(const schema::classification_t& classification,
                            schema::decision_t decision);

}  // namespace snapkeep::retention
