#pragma once

#include <cstdint>
#include <string>

#include "internal/model/step.hpp"

namespace upgrader::db::model {

/*
  One row of the history ledger.

  Written in the same transaction as the step it describes.
  Never updated or deleted.

  sql_text holds the full step body (not a digest); tamper detection
  compares it byte-for-byte.
*/

struct LedgerRecord {
  std::int32_t file_id     = 0;
  std::int32_t upgrader_id = 0;
  std::string  description;
  std::string  sql_text;

  // applied_at as unix milliseconds
  std::uint64_t applied_at_ms = 0;

  upgrader::model::StepKey Key() const {
    return {file_id, upgrader_id};
  }
};

} // namespace upgrader::db::model
