#include <snapkeep/schema/primitives.hpp>
#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <system_error>

namespace snapkeep::schema {

namespace {

template <typename T>
std::optional<T> try_parse_decimal(const std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  auto value = T{};
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

// Four-digit RFC 3339 years only: 0001-01-01T00:00:00Z to
// 9999-12-31T23:59:59Z. Calendar arithmetic on anything wider overflows.
constexpr auto kEarliestTimestamp =
    timestamp_t{std::chrono::sys_days{std::chrono::year{1} / 1 / 1}};
constexpr auto kLatestTimestamp =
    timestamp_t{std::chrono::sys_days{std::chrono::year{10000} / 1 / 1}} -
    std::chrono::seconds{1};

}  // namespace

std::optional<snapshot_name_t> try_split_snapshot_name(
    const std::string_view identifier) {
  const auto at = identifier.find('@');
  if (at == std::string_view::npos || at == 0 ||
      at + 1 >= identifier.size()) {
    return std::nullopt;
  }
  if (identifier.find('@', at + 1) != std::string_view::npos) {
    return std::nullopt;
  }
  return snapshot_name_t{.dataset = identifier.substr(0, at),
                         .tag = identifier.substr(at + 1)};
}

timestamp_t make_timestamp(const int64_t seconds_since_epoch) {
  return timestamp_t{std::chrono::seconds{seconds_since_epoch}};
}

std::optional<timestamp_t> try_parse_epoch_seconds(
    const std::string_view text) {
  auto seconds = try_parse_decimal<int64_t>(text);
  if (!seconds) {
    return std::nullopt;
  }
  const auto timestamp = make_timestamp(*seconds);
  if (timestamp < kEarliestTimestamp || timestamp > kLatestTimestamp) {
    return std::nullopt;
  }
  return timestamp;
}

std::optional<byte_count_t> try_parse_byte_count(const std::string_view text) {
  return try_parse_decimal<byte_count_t>(text);
}

std::string format_timestamp(const timestamp_t& timestamp) {
  const auto day = std::chrono::floor<std::chrono::days>(timestamp);
  const auto date = std::chrono::year_month_day{day};
  const auto time = std::chrono::hh_mm_ss{timestamp - day};
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z",
                     static_cast<int>(date.year()),
                     static_cast<unsigned>(date.month()),
                     static_cast<unsigned>(date.day()), time.hours().count(),
                     time.minutes().count(), time.seconds().count());
}

std::string make_snapshot_name(const std::string_view dataset,
                               const timestamp_t& now) {
  return fmt::format("{}@{}{}", dataset, format_timestamp(now),
                     kSnapshotSuffix);
}

}  // namespace snapkeep::schema
