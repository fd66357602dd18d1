#pragma once

#include <snapkeep/schema/primitives.hpp>
#include <snapkeep/schema/snapshot.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace snapkeep::testing {

inline snapkeep::schema::timestamp_t make_time(const int year,
                                               const unsigned month,
                                               const unsigned day,
                                               const int hour = 0,
                                               const int minute = 0,
                                               const int second = 0) {
  const auto date = std::chrono::year_month_day{
      std::chrono::year{year}, std::chrono::month{month},
      std::chrono::day{day}};
  return std::chrono::sys_days{date} + std::chrono::hours{hour} +
         std::chrono::minutes{minute} + std::chrono::seconds{second};
}

inline snapkeep::schema::snapshot_t make_snapshot(
    const std::string_view identifier,
    const snapkeep::schema::timestamp_t& created_at,
    const bool is_protected = false,
    const snapkeep::schema::byte_count_t used_bytes = 0) {
  return snapkeep::schema::snapshot_t{.identifier = std::string{identifier},
                                      .created_at = created_at,
                                      .used_bytes = used_bytes,
                                      .is_protected = is_protected};
}

inline std::string epoch_text(const snapkeep::schema::timestamp_t& timestamp) {
  return std::to_string(timestamp.time_since_epoch().count());
}

inline snapkeep::schema::raw_snapshot_record_t make_record(
    const std::string_view identifier,
    const snapkeep::schema::timestamp_t& created_at,
    const std::string_view retention = "h1",
    const std::string_view used = "0") {
  return snapkeep::schema::raw_snapshot_record_t{
      .identifier = std::string{identifier},
      .created_at = epoch_text(created_at),
      .used = std::string{used},
      .retention = std::string{retention}};
}

inline std::string make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace snapkeep::testing
