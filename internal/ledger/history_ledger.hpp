#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/session.hpp"
#include "internal/db/model/ledger_record.hpp"
#include "internal/model/step.hpp"

namespace upgrader::ledger {

/*
  History ledger accessor.

  The ledger table "$upgraders$" lives in the target schema when one is
  configured, otherwise wherever the default search_path resolves it.

  Failure mapping:
    schema check/creation      -> SchemaCreationError
    every other ledger access  -> LedgerWriteError
                                  (ConnectionError when the link dropped)
*/

class HistoryLedger {
 public:
  HistoryLedger(db::Session& session, std::optional<std::string> schema);

  // Quoted, schema-qualified table name used in every statement.
  const std::string& TableName() const {
    return table_;
  }

  // Session-level advisory lock keyed on the ledger name. Serializes
  // concurrent runs against the same target for the whole run.
  Task<void> AcquireRunLock();
  Task<void> ReleaseRunLock();

  bool HoldsRunLock() const {
    return run_lock_held_;
  }

  // Ensures the configured schema exists (creating it when allowed) and
  // makes it the session search_path. No-op without a schema.
  Task<void> PrepareSchema(bool create_schema);

  // Creates the ledger table if absent, in its own transaction.
  Task<void> Bootstrap();

  Task<std::vector<db::model::LedgerRecord>> ReadHistory();

  // Inside the step transaction: takes an exclusive table lock and checks
  // that nobody recorded `key` or anything after it in the meantime.
  Task<void> LockForStep(const model::StepKey& key);

  // Inside the step transaction.
  Task<void> Record(const model::UpgraderStep& step);

 private:
  db::Session&               session_;
  std::optional<std::string> schema_;
  std::string                table_;
  bool                       run_lock_held_ = false;
};

} // namespace upgrader::ledger
