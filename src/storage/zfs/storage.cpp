#include <snapkeep/storage/zfs/storage.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace snapkeep::storage {

namespace {

std::optional<zfs::rows_t> read_rows(const std::string& binary,
                                     std::vector<std::string> args,
                                     const std::size_t columns,
                                     std::string& error) {
  const auto action = args.front();
  args.insert(std::begin(args), binary);
  auto result = zfs::run_command(args);
  if (result.exit_code != 0) {
    error = fmt::format("zfs {} failed with exit status {}", action,
                        result.exit_code);
    return std::nullopt;
  }
  auto rows = zfs::split_rows(result.output);
  for (const auto& row : rows) {
    if (row.size() != columns) {
      error = fmt::format("zfs {} returned {} column(s), expected {}", action,
                          row.size(), columns);
      return std::nullopt;
    }
  }
  return rows;
}

bool execute(const std::string& binary,
             std::vector<std::string> args,
             std::string& error) {
  const auto action = args.front();
  args.insert(std::begin(args), binary);
  auto result = zfs::run_command(args);
  if (result.exit_code != 0) {
    error = fmt::format("zfs {} failed with exit status {}", action,
                        result.exit_code);
    return false;
  }
  return true;
}

std::optional<std::string> property_value(std::string value) {
  if (value == schema::kUnsetValue) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

template <>
storage<zfs_storage_tag> make_storage<zfs_storage_tag>(
    const std::string_view& command) {
  auto store = storage<zfs_storage_tag>{};
  store.binary = std::string{command};
  spdlog::debug("Using zfs command '{}'", store.binary);
  return store;
}

std::optional<std::vector<schema::dataset_t>>
storage<zfs_storage_tag>::list_datasets(std::string& error) const {
  // zfs get -H -p -t filesystem,volume -o name,value at.rollc.at:snapkeep
  auto rows = read_rows(binary,
                        {"get", "-H", "-p", "-t", "filesystem,volume", "-o",
                         "name,value", std::string{schema::kSnapkeepProperty}},
                        2, error);
  if (!rows) {
    return std::nullopt;
  }
  auto datasets = std::vector<schema::dataset_t>{};
  datasets.reserve(rows->size());
  for (auto& row : *rows) {
    datasets.push_back(schema::dataset_t{
        .name = std::move(row[0]), .policy = property_value(std::move(row[1]))});
  }
  return datasets;
}

bool storage<zfs_storage_tag>::get_property(const std::string_view target,
                                            const std::string_view key,
                                            std::optional<std::string>& value,
                                            std::string& error) const {
  auto rows = read_rows(binary,
                        {"get", "-H", "-p", "-o", "value", std::string{key},
                         std::string{target}},
                        1, error);
  if (!rows) {
    return false;
  }
  if (rows->size() != 1) {
    error = fmt::format("zfs get {} returned {} row(s) for '{}'", key,
                        rows->size(), target);
    return false;
  }
  value = property_value(std::move(rows->front()[0]));
  return true;
}

bool storage<zfs_storage_tag>::set_property(const std::string_view target,
                                            const std::string_view key,
                                            const std::string_view value,
                                            std::string& error) const {
  return execute(binary,
                 {"set", fmt::format("{}={}", key, value), std::string{target}},
                 error);
}

std::optional<std::vector<schema::raw_snapshot_record_t>>
storage<zfs_storage_tag>::list_snapshots(const std::string_view dataset,
                                         std::string& error) const {
  // zfs list -H -p -t snapshot -d 1 -o name,creation,used,at.rollc.at:snapkeep
  auto rows = read_rows(
      binary,
      {"list", "-H", "-p", "-t", "snapshot", "-d", "1", "-o",
       fmt::format("name,creation,used,{}", schema::kSnapkeepProperty),
       std::string{dataset}},
      4, error);
  if (!rows) {
    return std::nullopt;
  }
  auto records = std::vector<schema::raw_snapshot_record_t>{};
  records.reserve(rows->size());
  for (auto& row : *rows) {
    records.push_back(schema::raw_snapshot_record_t{
        .identifier = std::move(row[0]),
        .created_at = std::move(row[1]),
        .used = std::move(row[2]),
        .retention = std::move(row[3])});
  }
  return records;
}

std::optional<std::string> storage<zfs_storage_tag>::create_snapshot(
    const std::string_view dataset,
    const schema::timestamp_t& now,
    std::string& error) const {
  auto name = schema::make_snapshot_name(dataset, now);
  if (!execute(binary, {"snapshot", name}, error)) {
    return std::nullopt;
  }
  return name;
}

bool storage<zfs_storage_tag>::destroy_snapshot(
    const std::string_view identifier,
    std::string& error) const {
  // zfs destroy removes datasets as readily as snapshots; only ever hand it
  // something shaped like a snapshot name.
  if (!schema::try_split_snapshot_name(identifier)) {
    error = fmt::format("refusing to destroy '{}': not a snapshot", identifier);
    spdlog::critical("{}", error);
    return false;
  }
  return execute(binary, {"destroy", std::string{identifier}}, error);
}

}  // namespace snapkeep::storage
