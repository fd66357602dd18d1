#pragma once
#include <snapkeep/schema/dataset.hpp>
#include <snapkeep/schema/primitives.hpp>
#include <snapkeep/schema/snapshot.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace snapkeep::storage {

/// Command interface of the storage subsystem, specialized per backend tag.
///
/// Every call is blocking. Failures are reported through `error` and the
/// return value; nothing here throws or retries.
template <typename Library>
struct storage {
  /// Every filesystem and volume with its retention property (absent when
  /// unset).
  std::optional<std::vector<schema::dataset_t>> list_datasets(
      std::string& error) const;

  /// Read one property. On success `value` is std::nullopt when unset.
  bool get_property(std::string_view target,
                    std::string_view key,
                    std::optional<std::string>& value,
                    std::string& error) const;

  bool set_property(std::string_view target,
                    std::string_view key,
                    std::string_view value,
                    std::string& error) const;

  /// Direct snapshots of `dataset` with creation time, used size and their
  /// own retention property.
  std::optional<std::vector<schema::raw_snapshot_record_t>> list_snapshots(
      std::string_view dataset,
      std::string& error) const;

  /// Create `<dataset>@<now>-autosnap` and return its identifier.
  std::optional<std::string> create_snapshot(std::string_view dataset,
                                             const schema::timestamp_t& now,
                                             std::string& error) const;

  /// Destroy one snapshot. Must refuse anything that is not a snapshot name.
  bool destroy_snapshot(std::string_view identifier, std::string& error) const;
};

/// Construct a concrete storage backend driving the given command.
template <typename Library>
storage<Library> make_storage(const std::string_view& command);

}  // namespace snapkeep::storage
