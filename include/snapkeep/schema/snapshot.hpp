#pragma once

#include <snapkeep/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: snapshot.
// Retention workflow: one point-in-time capture of a dataset as reported by
// storage. `identifier` is the full `dataset@tag` name and is never
// interpreted by the retention logic.
namespace snapkeep::schema {

struct snapshot_t final {
  std::string identifier;
  timestamp_t created_at{};
  byte_count_t used_bytes{};
  bool is_protected{};
};

/// Unvalidated snapshot row as listed by the storage subsystem.
struct raw_snapshot_record_t final {
  std::string identifier;
  std::string created_at;
  std::string used;
  std::optional<std::string> retention;
};

}  // namespace snapkeep::schema
