#pragma once
#include <snapkeep/storage/storage.hpp>
#include <snapkeep/storage/zfs/command.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace snapkeep::storage {

struct zfs_storage_tag {};

/// Storage backed by the zfs(8) command line tool in scripted (`-H -p`) mode.
template <>
struct storage<zfs_storage_tag> final {
  std::string binary{"zfs"};

  std::optional<std::vector<schema::dataset_t>> list_datasets(
      std::string& error) const;
  bool get_property(std::string_view target,
                    std::string_view key,
                    std::optional<std::string>& value,
                    std::string& error) const;
  bool set_property(std::string_view target,
                    std::string_view key,
                    std::string_view value,
                    std::string& error) const;
  std::optional<std::vector<schema::raw_snapshot_record_t>> list_snapshots(
      std::string_view dataset,
      std::string& error) const;
  std::optional<std::string> create_snapshot(std::string_view dataset,
                                             const schema::timestamp_t& now,
                                             std::string& error) const;
  bool destroy_snapshot(std::string_view identifier, std::string& error) const;
};

template <>
storage<zfs_storage_tag> make_storage<zfs_storage_tag>(
    const std::string_view& command);

}  // namespace snapkeep::storage
