#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace snapkeep::schema {

using timestamp_t = std::chrono::sys_seconds;
using byte_count_t = uint64_t;

/// User property holding the retention policy on a dataset and the
/// protection marker on a snapshot.
inline constexpr auto kSnapkeepProperty =
    std::string_view{"at.rollc.at:snapkeep"};

/// `zfs -H` prints this for an unset property; set on a snapshot it marks the
/// snapshot as protected.
inline constexpr auto kUnsetValue = std::string_view{"-"};

inline constexpr auto kSnapshotSuffix = std::string_view{"-autosnap"};

struct snapshot_name_t final {
  std::string_view dataset;
  std::string_view tag;
};

/// Split `dataset@tag`. Returns std::nullopt unless there is exactly one '@'
/// with a non-empty name on both sides.
std::optional<snapshot_name_t> try_split_snapshot_name(
    std::string_view identifier);

timestamp_t make_timestamp(int64_t seconds_since_epoch);
std::optional<timestamp_t> try_parse_epoch_seconds(std::string_view text);
std::optional<byte_count_t> try_parse_byte_count(std::string_view text);

/// RFC 3339, second precision, UTC (`2021-10-02T09:59:00Z`).
std::string format_timestamp(const timestamp_t& timestamp);

/// `<dataset>@<format_timestamp(now)>-autosnap`
std::string make_snapshot_name(std::string_view dataset,
                               const timestamp_t& now);

}  // namespace snapkeep::schema
