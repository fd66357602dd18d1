#include <snapkeep/execution/guard.hpp>
#include <snapkeep/schema/primitives.hpp>
#include <spdlog/fmt/fmt.h>

#include <optional>
#include <string_view>

namespace snapkeep::execution {

namespace {

// Characters that turn a destroy argument into a dataset path, a range or a
// list, or that break `zfs -H` row parsing.
std::optional<std::string_view> describe_forbidden_tag_char(const char c) {
  switch (c) {
    case '/':
      return "'/' (dataset path)";
    case '%':
      return "'%' (snapshot range)";
    case ',':
      return "',' (snapshot list)";
    case '\t':
      return "tab";
    case '\n':
      return "newline";
    case '\r':
      return "carriage return";
    default:
      return std::nullopt;
  }
}

}  // namespace

bool is_plain_snapshot_name(const std::string_view identifier,
                            std::string& error) {
  auto name = schema::try_split_snapshot_name(identifier);
  if (!name) {
    error = fmt::format("'{}' is not a snapshot name", identifier);
    return false;
  }
  for (const auto c : name->tag) {
    if (auto forbidden = describe_forbidden_tag_char(c)) {
      error = fmt::format("'{}' has a forbidden {} in its snapshot tag",
                          identifier, *forbidden);
      return false;
    }
  }
  return true;
}

bool check_destroy_target(const catalog::catalog_t& catalog,
                          const std::string_view identifier,
                          std::string& error) {
  if (!is_plain_snapshot_name(identifier, error)) {
    return false;
  }
  if (schema::try_split_snapshot_name(identifier)->dataset !=
      catalog.dataset) {
    error = fmt::format("'{}' does not belong to managed dataset '{}'",
                        identifier, catalog.dataset);
    return false;
  }
  const auto* snapshot = catalog::find_snapshot(catalog, identifier);
  if (snapshot == nullptr) {
    error = fmt::format("'{}' was not listed as a snapshot of '{}'",
                        identifier, catalog.dataset);
    return false;
  }
  if (snapshot->is_protected) {
    error = fmt::format("'{}' is protected", identifier);
    return false;
  }
  return true;
}

}  // namespace snapkeep::execution
