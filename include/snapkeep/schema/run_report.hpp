#pragma once

#include <snapkeep/schema/classification.hpp>
#include <snapkeep/schema/error_code.hpp>
#include <snapkeep/schema/retention_policy.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

// Schema type: run report.
// Retention workflow: outcome of one snap/gc/status invocation. Failures are
// isolated per dataset or per snapshot and aggregated here instead of
// aborting the run.
namespace snapkeep::schema {

struct failure_t final {
  error_code_t code{error_code_t::subsystem_error};
  std::string dataset;
  std::string target;
  std::string message;
};

struct dataset_report_t final {
  std::string dataset;
  std::string policy_text;
  std::optional<retention_policy_t> policy;
  std::optional<classification_t> classification;
  std::vector<std::string> created;
  std::vector<std::string> destroyed;
};

struct run_report_t final {
  std::string command;
  std::vector<dataset_report_t> datasets;
  std::vector<failure_t> failures;
};

inline bool succeeded(const run_report_t& report) {
  return report.failures.empty();
}

inline bool has_failure(const run_report_t& report, const error_code_t code) {
  return std::ranges::any_of(report.failures, [code](const failure_t& failure) {
    return failure.code == code;
  });
}

}  // namespace snapkeep::schema
