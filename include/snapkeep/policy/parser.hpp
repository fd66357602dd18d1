#pragma once

#include <snapkeep/schema/retention_policy.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace snapkeep::policy {

/// Parse a retention policy such as `h24d30w8m6y1`.
///
/// The text is a run of `<unit><count>` pairs with no separators; units are
/// `h d w m y`, each at most once, in any order. Missing units count 0 and
/// the empty string is a valid all-zero policy. On failure returns
/// std::nullopt and writes the reason to `error`.
std::optional<schema::retention_policy_t> try_parse_policy(
    std::string_view text,
    std::string& error);

/// Canonical text form: units in h, d, w, m, y order, zero counts omitted.
std::string format_policy(const schema::retention_policy_t& policy);

}  // namespace snapkeep::policy
