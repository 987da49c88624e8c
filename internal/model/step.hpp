#pragma once

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace upgrader::model {

/*
  Identity of one migration step.

  Ordering is (file_id, upgrader_id); this is the canonical apply order.
*/
struct StepKey {
  std::int32_t file_id     = 0;
  std::int32_t upgrader_id = 0;

  friend bool operator==(const StepKey& a, const StepKey& b) {
    return a.file_id == b.file_id && a.upgrader_id == b.upgrader_id;
  }

  friend bool operator!=(const StepKey& a, const StepKey& b) {
    return !(a == b);
  }

  friend bool operator<(const StepKey& a, const StepKey& b) {
    return std::tie(a.file_id, a.upgrader_id) < std::tie(b.file_id, b.upgrader_id);
  }
};

// "file_id:upgrader_id", used in messages and log fields.
std::string ToString(const StepKey& key);

struct UpgraderStep {
  std::int32_t file_id     = 0;
  std::int32_t upgrader_id = 0;
  std::string  description;
  std::string  sql_text;

  StepKey Key() const {
    return {file_id, upgrader_id};
  }
};

struct MigrationFile {
  std::int32_t              file_id = 0;
  std::string               file_name;
  std::vector<UpgraderStep> steps;
};

// All steps across all files, sorted by StepKey.
using FullSequence = std::vector<UpgraderStep>;

} // namespace upgrader::model
