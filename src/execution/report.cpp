#include <snapkeep/execution/report.hpp>
#include <snapkeep/policy/parser.hpp>
#include <snapkeep/retention/bucket.hpp>
#include <snapkeep/retention/selector.hpp>
#include <spdlog/fmt/fmt.h>

#include <array>
#include <iterator>
#include <optional>
#include <string_view>

namespace snapkeep::execution {

namespace {

struct totals_t final {
  std::size_t count{};
  schema::byte_count_t bytes{};
};

totals_t sum_used(const schema::classification_t& classification,
                  const schema::decision_t decision) {
  auto totals = totals_t{};
  for (const auto& entry : classification.entries) {
    if (entry.decision == decision) {
      ++totals.count;
      totals.bytes += entry.snapshot.used_bytes;
    }
  }
  return totals;
}

// Start of the oldest bucket kept for `granularity`, i.e. how far back its
// window currently reaches.
std::optional<schema::timestamp_t> window_start(
    const schema::classification_t& classification,
    const schema::granularity_t granularity) {
  auto start = std::optional<schema::timestamp_t>{};
  for (const auto& entry : classification.entries) {
    if (entry.kept_by.test(schema::to_index(granularity))) {
      start = retention::bucket_start(granularity, entry.snapshot.created_at);
    }
  }
  return start;
}

void render_dataset(const schema::dataset_report_t& dataset,
                    std::string& out) {
  const auto& classification = *dataset.classification;
  auto inserter = std::back_inserter(out);

  auto total_bytes = schema::byte_count_t{};
  for (const auto& entry : classification.entries) {
    total_bytes += entry.snapshot.used_bytes;
  }

  fmt::format_to(inserter, "dataset: {}\n", dataset.dataset);
  if (schema::retains_nothing(*dataset.policy)) {
    fmt::format_to(inserter, "policy: {} (protected snapshots only)\n",
                   schema::kUnsetValue);
  } else {
    fmt::format_to(inserter, "policy: {}\n",
                   policy::format_policy(*dataset.policy));
  }
  fmt::format_to(inserter, "snapshots: {}\t{}\n",
                 classification.entries.size(), format_bytes(total_bytes));
  for (const auto granularity : schema::kGranularities) {
    const auto limit = schema::count_of(*dataset.policy, granularity);
    if (limit == 0) {
      continue;
    }
    fmt::format_to(
        inserter, "{}: {}/{}", schema::to_string(granularity),
        classification.kept_per_granularity[schema::to_index(granularity)],
        limit);
    if (auto start = window_start(classification, granularity)) {
      fmt::format_to(inserter, " since {}", schema::format_timestamp(*start));
    }
    out.push_back('\n');
  }

  const auto keep = sum_used(classification, schema::decision_t::keep);
  const auto destroy = sum_used(classification, schema::decision_t::destroy);
  fmt::format_to(inserter, "keep: {}\t{}\n", keep.count,
                 format_bytes(keep.bytes));
  fmt::format_to(inserter, "destroy: {}\t{}\n", destroy.count,
                 format_bytes(destroy.bytes));

  for (const auto& entry : classification.entries) {
    const auto& snapshot = entry.snapshot;
    fmt::format_to(inserter, "{}: {}\t{}\t{}\t{}\n",
                   schema::to_string(entry.decision), snapshot.identifier,
                   schema::format_timestamp(snapshot.created_at),
                   format_bytes(snapshot.used_bytes),
                   snapshot.is_protected
                       ? std::string{"protected"}
                       : format_granularities(entry.kept_by));
  }
  if (classification.future_dated > 0) {
    fmt::format_to(inserter, "warning: {} snapshot(s) dated in the future\n",
                   classification.future_dated);
  }
}

}  // namespace

std::string format_bytes(const schema::byte_count_t bytes) {
  static constexpr auto units =
      std::array<std::string_view, 6>{"KiB", "MiB", "GiB", "TiB", "PiB",
                                      "EiB"};
  if (bytes < 1024) {
    return fmt::format("{} B", bytes);
  }
  auto value = static_cast<double>(bytes) / 1024.0;
  auto unit = std::size_t{0};
  while (value >= 1024.0 && unit + 1 < units.size()) {
    value /= 1024.0;
    ++unit;
  }
  return fmt::format("{:.1f} {}", value, units[unit]);
}

std::string format_granularities(const schema::granularity_set_t& set) {
  if (set.none()) {
    return std::string{schema::kUnsetValue};
  }
  auto result = std::string{};
  for (const auto granularity : schema::kGranularities) {
    if (set.test(schema::to_index(granularity))) {
      result.push_back(schema::to_unit(granularity));
    }
  }
  return result;
}

std::string render_status(const schema::run_report_t& report) {
  auto out = std::string{};
  for (const auto& dataset : report.datasets) {
    if (!dataset.classification || !dataset.policy) {
      continue;
    }
    if (!out.empty()) {
      out.push_back('\n');
    }
    render_dataset(dataset, out);
  }
  return out;
}

std::string render_changes(const schema::run_report_t& report) {
  auto out = std::string{};
  auto inserter = std::back_inserter(out);
  for (const auto& dataset : report.datasets) {
    for (const auto& identifier : dataset.created) {
      fmt::format_to(inserter, "snapshot: {}\n", identifier);
    }
    for (const auto& identifier : dataset.destroyed) {
      fmt::format_to(inserter, "destroy: {}\n", identifier);
    }
  }
  return out;
}

std::string render_failures(const schema::run_report_t& report) {
  auto out = std::string{};
  auto inserter = std::back_inserter(out);
  for (const auto& failure : report.failures) {
    fmt::format_to(inserter, "error: {}", schema::to_string(failure.code));
    if (!failure.dataset.empty()) {
      fmt::format_to(inserter, " {}", failure.dataset);
    }
    if (!failure.target.empty() && failure.target != failure.dataset) {
      fmt::format_to(inserter, " {}", failure.target);
    }
    fmt::format_to(inserter, ": {}\n", failure.message);
  }
  return out;
}

int exit_code(const schema::run_report_t& report) {
  if (schema::succeeded(report)) {
    return kExitSuccess;
  }
  if (schema::has_failure(report, schema::error_code_t::safety_violation)) {
    return kExitSafetyViolation;
  }
  return kExitFailure;
}

}  // namespace snapkeep::execution
