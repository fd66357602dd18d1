#pragma once

#include <snapkeep/schema/snapshot.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace snapkeep::catalog {

/// Validated snapshots of a single dataset, in the order storage listed them.
struct catalog_t final {
  std::string dataset;
  std::vector<schema::snapshot_t> snapshots;
};

/// Normalize raw storage rows into a catalog for `dataset`.
///
/// Fails (std::nullopt, reason in `error`) when a creation time or used size
/// does not parse, when an identifier is not `<dataset>@<tag>`, or when an
/// identifier appears twice. A snapshot is protected iff its own retention
/// property is exactly `-`.
std::optional<catalog_t> build_catalog(
    std::string_view dataset,
    const std::vector<schema::raw_snapshot_record_t>& records,
    std::string& error);

/// Snapshot with the given identifier, or nullptr.
const schema::snapshot_t* find_snapshot(const catalog_t& catalog,
                                        std::string_view identifier);

}  // namespace snapkeep::catalog
