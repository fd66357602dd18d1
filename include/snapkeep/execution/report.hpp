#pragma once

#include <snapkeep/schema/classification.hpp>
#include <snapkeep/schema/primitives.hpp>
#include <snapkeep/schema/run_report.hpp>

#include <string>

namespace snapkeep::execution {

inline constexpr auto kExitSuccess = 0;
inline constexpr auto kExitFailure = 1;
inline constexpr auto kExitSafetyViolation = 2;
inline constexpr auto kExitUsage = 111;

/// Binary units with one decimal (`512 B`, `1.5 KiB`, `3.0 GiB`).
std::string format_bytes(schema::byte_count_t bytes);

/// Unit letters of the granularities in `set`, in h, d, w, m, y order, or `-`.
std::string format_granularities(const schema::granularity_set_t& set);

/// Human-readable status listing of every classified dataset in `report`.
std::string render_status(const schema::run_report_t& report);

/// One `snapshot: <id>` or `destroy: <id>` line per mutation in `report`.
std::string render_changes(const schema::run_report_t& report);

/// One `error: ...` line per recorded failure.
std::string render_failures(const schema::run_report_t& report);

/// 0 without failures, 2 when a safety violation was recorded, 1 otherwise.
int exit_code(const schema::run_report_t& report);

}  // namespace snapkeep::execution
