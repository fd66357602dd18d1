#pragma once

#include <optional>
#include <string>

// Schema type: dataset.
// Retention workflow: a filesystem or volume; `policy` is the raw property
// value and is absent when the dataset is not managed.
namespace snapkeep::schema {

struct dataset_t final {
  std::string name;
  std::optional<std::string> policy;
};

}  // namespace snapkeep::schema
