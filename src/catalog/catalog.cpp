#include <snapkeep/catalog/catalog.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <unordered_set>

namespace snapkeep::catalog {

std::optional<catalog_t> build_catalog(
    const std::string_view dataset,
    const std::vector<schema::raw_snapshot_record_t>& records,
    std::string& error) {
  auto catalog = catalog_t{.dataset = std::string{dataset}, .snapshots = {}};
  catalog.snapshots.reserve(records.size());
  auto identifiers = std::unordered_set<std::string>{};

  for (const auto& record : records) {
    auto name = schema::try_split_snapshot_name(record.identifier);
    if (!name || name->dataset != dataset) {
      error = fmt::format("'{}' is not a snapshot of '{}'", record.identifier,
                          dataset);
      return std::nullopt;
    }
    if (!identifiers.insert(record.identifier).second) {
      error = fmt::format("snapshot '{}' listed twice", record.identifier);
      return std::nullopt;
    }

    auto created_at = schema::try_parse_epoch_seconds(record.created_at);
    if (!created_at) {
      error = fmt::format("unparseable creation time '{}' for '{}'",
                          record.created_at, record.identifier);
      return std::nullopt;
    }

    auto used_bytes = schema::byte_count_t{};
    if (record.used != schema::kUnsetValue) {
      auto parsed = schema::try_parse_byte_count(record.used);
      if (!parsed) {
        error = fmt::format("unparseable used size '{}' for '{}'",
                            record.used, record.identifier);
        return std::nullopt;
      }
      used_bytes = *parsed;
    }

    catalog.snapshots.push_back(schema::snapshot_t{
        .identifier = record.identifier,
        .created_at = *created_at,
        .used_bytes = used_bytes,
        .is_protected = record.retention == schema::kUnsetValue});
  }
  return catalog;
}

const schema::snapshot_t* find_snapshot(const catalog_t& catalog,
                                        const std::string_view identifier) {
  auto it = std::ranges::find_if(
      catalog.snapshots, [identifier](const schema::snapshot_t& snapshot) {
        return snapshot.identifier == identifier;
      });
  if (it == std::end(catalog.snapshots)) {
    return nullptr;
  }
  return &*it;
}

}  // namespace snapkeep::catalog
