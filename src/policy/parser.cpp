#include <snapkeep/policy/parser.hpp>
#include <spdlog/fmt/fmt.h>

#include <array>
#include <charconv>
#include <system_error>

namespace snapkeep::policy {

namespace {

bool is_digit(const char c) {
  return c >= '0' && c <= '9';
}

}  // namespace

std::optional<schema::retention_policy_t> try_parse_policy(
    const std::string_view text,
    std::string& error) {
  auto policy = schema::retention_policy_t{};
  auto seen = std::array<bool, schema::kGranularityCount>{};

  auto offset = size_t{0};
  while (offset < text.size()) {
    const auto unit = text[offset];
    const auto granularity = schema::try_from_unit(unit);
    if (!granularity) {
      error = fmt::format("unknown unit '{}' at offset {}", unit, offset);
      return std::nullopt;
    }
    const auto index = schema::to_index(*granularity);
    if (seen[index]) {
      error = fmt::format("unit '{}' repeated at offset {}", unit, offset);
      return std::nullopt;
    }
    seen[index] = true;

    const auto digits_begin = ++offset;
    while (offset < text.size() && is_digit(text[offset])) {
      ++offset;
    }
    if (digits_begin == offset) {
      error = fmt::format("missing count for unit '{}' at offset {}", unit,
                          digits_begin);
      return std::nullopt;
    }

    auto count = uint32_t{};
    auto [ptr, ec] = std::from_chars(text.data() + digits_begin,
                                     text.data() + offset, count);
    if (ec != std::errc{} || count > schema::kMaxPolicyCount) {
      error = fmt::format("count for unit '{}' exceeds {}", unit,
                          schema::kMaxPolicyCount);
      return std::nullopt;
    }
    policy.counts[index] = count;
  }
  return policy;
}

std::string format_policy(const schema::retention_policy_t& policy) {
  auto out = std::string{};
  for (const auto granularity : schema::kGranularities) {
    const auto count = schema::count_of(policy, granularity);
    if (count == 0) {
      continue;
    }
    out.push_back(schema::to_unit(granularity));
    out += std::to_string(count);
  }
  return out;
}

}  // namespace snapkeep::policy
