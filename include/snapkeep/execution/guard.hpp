#pragma once

#include <snapkeep/catalog/catalog.hpp>

#include <string>
#include <string_view>

namespace snapkeep::execution {

/// Check the shape of a snapshot name on its own:
/// exactly one '@', non-empty dataset and tag, and no range (`%`), list
/// (`,`), path (`/`), tab or line break characters in the tag. Spaces are
/// valid in zfs names.
bool is_plain_snapshot_name(std::string_view identifier, std::string& error);

/// Final check in front of every destroy request, independent of how the
/// snapshot was classified. `identifier` must be a plain snapshot name of
/// `catalog.dataset` and an unprotected member of the catalog.
bool check_destroy_target(const catalog::catalog_t& catalog,
                          std::string_view identifier,
                          std::string& error);

}  // namespace snapkeep::execution
