#pragma once

#include <snapkeep/schema/granularity.hpp>
#include <snapkeep/schema/primitives.hpp>

#include <cstdint>

namespace snapkeep::retention {

using bucket_index_t = int64_t;

/// Index of the UTC calendar bucket of `granularity` containing `timestamp`.
///
/// Buckets are half-open: a timestamp on a boundary belongs to the bucket it
/// starts. Weeks start on Monday 00:00 UTC. Indices grow with time, so
/// walking snapshots newest first yields non-increasing indices.
bucket_index_t bucket_index(schema::granularity_t granularity,
                            const schema::timestamp_t& timestamp);

/// Inclusive lower bound of the bucket containing `timestamp`.
schema::timestamp_t bucket_start(schema::granularity_t granularity,
                                 const schema::timestamp_t& timestamp);

}  // namespace snapkeep::retention
