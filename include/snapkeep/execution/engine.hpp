#pragma once

#include <snapkeep/catalog/catalog.hpp>
#include <snapkeep/execution/guard.hpp>
#include <snapkeep/policy/parser.hpp>
#include <snapkeep/retention/selector.hpp>
#include <snapkeep/schema/dataset.hpp>
#include <snapkeep/schema/primitives.hpp>
#include <snapkeep/schema/run_report.hpp>
#include <snapkeep/storage/storage.hpp>
#include <spdlog/spdlog.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace snapkeep::execution {

/// Snapshot retention driver for one invocation.
///
/// Every operation walks the managed datasets one at a time and records
/// per-dataset and per-snapshot failures in the returned report instead of
/// stopping. The engine keeps no state between calls; `now` is always passed
/// in.
template <typename Library>
class engine final {
 public:
  explicit engine(storage::storage<Library>& storage) : storage_{storage} {}

  /// Create one `<dataset>@<now>-autosnap` snapshot per managed dataset with a
  /// valid policy.
  schema::run_report_t snap(const schema::timestamp_t& now);

  /// Classify the snapshots of every managed dataset and destroy the ones the
  /// policy no longer keeps.
  ///
  /// A dataset is fully classified before its first destroy is issued. Each
  /// destroy passes `check_destroy_target` first; a refusal is recorded as a
  /// safety violation and never retried.
  schema::run_report_t gc(const schema::timestamp_t& now);

  /// Same pipeline as gc() without any storage mutation.
  schema::run_report_t status(const schema::timestamp_t& now);

  /// Mark a snapshot as protected by setting its own property to `-`.
  schema::run_report_t protect(std::string_view identifier);

  /// Validate and store the retention policy of a dataset.
  schema::run_report_t set_policy(std::string_view dataset,
                                  std::string_view policy_text);

 private:
  struct plan_t final {
    catalog::catalog_t catalog;
    schema::dataset_report_t report;
  };

  std::optional<std::vector<schema::dataset_t>> managed_datasets(
      schema::run_report_t& report) const;

  std::optional<plan_t> plan(const schema::dataset_t& dataset,
                             const schema::timestamp_t& now,
                             schema::run_report_t& report) const;

  void destroy_unkept(plan_t& plan, schema::run_report_t& report) const;

  static void record(schema::run_report_t& report,
                     schema::error_code_t code,
                     std::string_view dataset,
                     std::string_view target,
                     std::string message);

  storage::storage<Library>& storage_;
};

template <typename Library>
schema::run_report_t engine<Library>::snap(const schema::timestamp_t& now) {
  auto report = schema::run_report_t{.command = "snap"};
  auto datasets = managed_datasets(report);
  if (!datasets) {
    return report;
  }
  for (const auto& dataset : *datasets) {
    auto error = std::string{};
    auto policy = policy::try_parse_policy(*dataset.policy, error);
    if (!policy) {
      spdlog::warn("Skipping {}: invalid policy '{}': {}", dataset.name,
                   *dataset.policy, error);
      record(report, schema::error_code_t::invalid_policy, dataset.name,
             *dataset.policy, std::move(error));
      continue;
    }
    auto created = storage_.create_snapshot(dataset.name, now, error);
    if (!created) {
      spdlog::error("Failed to snapshot {}: {}", dataset.name, error);
      record(report, schema::error_code_t::subsystem_error, dataset.name,
             dataset.name, std::move(error));
      continue;
    }
    spdlog::info("Created snapshot {}", *created);
    report.datasets.push_back(
        schema::dataset_report_t{.dataset = dataset.name,
                                 .policy_text = *dataset.policy,
                                 .policy = policy,
                                 .classification = std::nullopt,
                                 .created = {std::move(*created)},
                                 .destroyed = {}});
  }
  return report;
}

template <typename Library>
schema::run_report_t engine<Library>::gc(const schema::timestamp_t& now) {
  auto report = schema::run_report_t{.command = "gc"};
  auto datasets = managed_datasets(report);
  if (!datasets) {
    return report;
  }
  for (const auto& dataset : *datasets) {
    auto planned = plan(dataset, now, report);
    if (!planned) {
      continue;
    }
    destroy_unkept(*planned, report);
    report.datasets.push_back(std::move(planned->report));
  }
  return report;
}

template <typename Library>
schema::run_report_t engine<Library>::status(const schema::timestamp_t& now) {
  auto report = schema::run_report_t{.command = "status"};
  auto datasets = managed_datasets(report);
  if (!datasets) {
    return report;
  }
  for (const auto& dataset : *datasets) {
    auto planned = plan(dataset, now, report);
    if (planned) {
      report.datasets.push_back(std::move(planned->report));
    }
  }
  return report;
}

template <typename Library>
schema::run_report_t engine<Library>::protect(
    const std::string_view identifier) {
  auto report = schema::run_report_t{.command = "protect"};
  auto error = std::string{};
  if (!is_plain_snapshot_name(identifier, error)) {
    record(report, schema::error_code_t::invalid_argument, {}, identifier,
           std::move(error));
    return report;
  }
  if (!storage_.set_property(identifier, schema::kSnapkeepProperty,
                             schema::kUnsetValue, error)) {
    spdlog::error("Failed to protect {}: {}", identifier, error);
    record(report, schema::error_code_t::subsystem_error,
           schema::try_split_snapshot_name(identifier)->dataset, identifier,
           std::move(error));
    return report;
  }
  spdlog::info("Protected snapshot {}", identifier);
  return report;
}

template <typename Library>
schema::run_report_t engine<Library>::set_policy(
    const std::string_view dataset,
    const std::string_view policy_text) {
  auto report = schema::run_report_t{.command = "policy"};
  if (dataset.empty() || dataset.find('@') != std::string_view::npos) {
    record(report, schema::error_code_t::invalid_argument, dataset, dataset,
           "not a dataset name");
    return report;
  }
  auto error = std::string{};
  auto policy = policy::try_parse_policy(policy_text, error);
  if (!policy) {
    record(report, schema::error_code_t::invalid_policy, dataset, policy_text,
           std::move(error));
    return report;
  }

  auto previous = std::optional<std::string>{};
  if (!storage_.get_property(dataset, schema::kSnapkeepProperty, previous,
                             error) ||
      !storage_.set_property(dataset, schema::kSnapkeepProperty, policy_text,
                             error)) {
    spdlog::error("Failed to set policy of {}: {}", dataset, error);
    record(report, schema::error_code_t::subsystem_error, dataset, dataset,
           std::move(error));
    return report;
  }
  spdlog::info("Policy of {} changed from '{}' to '{}'", dataset,
               previous.value_or(std::string{schema::kUnsetValue}),
               policy_text);
  report.datasets.push_back(
      schema::dataset_report_t{.dataset = std::string{dataset},
                               .policy_text = std::string{policy_text},
                               .policy = policy,
                               .classification = std::nullopt,
                               .created = {},
                               .destroyed = {}});
  return report;
}

template <typename Library>
std::optional<std::vector<schema::dataset_t>>
engine<Library>::managed_datasets(schema::run_report_t& report) const {
  auto error = std::string{};
  auto datasets = storage_.list_datasets(error);
  if (!datasets) {
    spdlog::error("Failed to list datasets: {}", error);
    record(report, schema::error_code_t::subsystem_error, {}, {},
           std::move(error));
    return std::nullopt;
  }
  auto managed = std::vector<schema::dataset_t>{};
  for (auto& dataset : *datasets) {
    if (!dataset.policy) {
      spdlog::debug("{} is not managed", dataset.name);
      continue;
    }
    managed.push_back(std::move(dataset));
  }
  spdlog::debug("{} managed dataset(s)", managed.size());
  return managed;
}

template <typename Library>
std::optional<typename engine<Library>::plan_t> engine<Library>::plan(
    const schema::dataset_t& dataset,
    const schema::timestamp_t& now,
    schema::run_report_t& report) const {
  auto error = std::string{};
  auto policy = policy::try_parse_policy(*dataset.policy, error);
  if (!policy) {
    spdlog::warn("Skipping {}: invalid policy '{}': {}", dataset.name,
                 *dataset.policy, error);
    record(report, schema::error_code_t::invalid_policy, dataset.name,
           *dataset.policy, std::move(error));
    return std::nullopt;
  }

  auto records = storage_.list_snapshots(dataset.name, error);
  if (!records) {
    spdlog::error("Failed to list snapshots of {}: {}", dataset.name, error);
    record(report, schema::error_code_t::subsystem_error, dataset.name,
           dataset.name, std::move(error));
    return std::nullopt;
  }

  auto catalog = catalog::build_catalog(dataset.name, *records, error);
  if (!catalog) {
    spdlog::warn("Skipping {}: {}", dataset.name, error);
    record(report, schema::error_code_t::catalog_error, dataset.name,
           dataset.name, std::move(error));
    return std::nullopt;
  }

  auto classification = retention::classify(catalog->snapshots, *policy, now);
  if (classification.future_dated > 0) {
    spdlog::warn("{}: {} snapshot(s) dated after {}", dataset.name,
                 classification.future_dated, schema::format_timestamp(now));
  }
  spdlog::info("{}: {} snapshot(s), keep {}, destroy {}", dataset.name,
               classification.entries.size(),
               retention::count_decisions(classification,
                                          schema::decision_t::keep),
               retention::count_decisions(classification,
                                          schema::decision_t::destroy));

  return plan_t{
      .catalog = std::move(*catalog),
      .report = schema::dataset_report_t{
          .dataset = dataset.name,
          .policy_text = *dataset.policy,
          .policy = policy,
          .classification = std::move(classification),
          .created = {},
          .destroyed = {}}};
}

template <typename Library>
void engine<Library>::destroy_unkept(plan_t& plan,
                                     schema::run_report_t& report) const {
  for (const auto& entry : plan.report.classification->entries) {
    if (entry.decision != schema::decision_t::destroy ||
        entry.snapshot.is_protected) {
      continue;
    }
    const auto& identifier = entry.snapshot.identifier;
    auto error = std::string{};
    if (!check_destroy_target(plan.catalog, identifier, error)) {
      spdlog::critical("Refusing to destroy {}: {}", identifier, error);
      record(report, schema::error_code_t::safety_violation,
             plan.catalog.dataset, identifier, std::move(error));
      continue;
    }
    if (!storage_.destroy_snapshot(identifier, error)) {
      spdlog::error("Failed to destroy {}: {}", identifier, error);
      record(report, schema::error_code_t::subsystem_error,
             plan.catalog.dataset, identifier, std::move(error));
      continue;
    }
    spdlog::info("Destroyed snapshot {}", identifier);
    plan.report.destroyed.push_back(identifier);
  }
}

template <typename Library>
void engine<Library>::record(schema::run_report_t& report,
                             const schema::error_code_t code,
                             const std::string_view dataset,
                             const std::string_view target,
                             std::string message) {
  report.failures.push_back(schema::failure_t{.code = code,
                                              .dataset = std::string{dataset},
                                              .target = std::string{target},
                                              .message = std::move(message)});
}

}  // namespace snapkeep::execution
