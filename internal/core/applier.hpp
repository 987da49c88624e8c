#pragma once

#include <cstddef>
#include <vector>

#include "internal/core/options.hpp"
#include "internal/db/api/session.hpp"
#include "internal/ledger/history_ledger.hpp"
#include "internal/model/step.hpp"

namespace upgrader::observability {
class SpanScope;
}

namespace upgrader::core {

/*
  Applies pending steps in order, each in its own transaction:

    BEGIN
      lock ledger, check nobody got there first
      step SQL ({{SCHEMA}} substituted)
      ledger row
    COMMIT

  Stops at the first failure. That step's transaction is rolled back, so
  neither its effects nor its ledger row survive; earlier steps stay
  committed.

  Returns the number of steps committed.
*/
Task<std::size_t> ApplyPending(db::Session& session, ledger::HistoryLedger& ledger,
                               const std::vector<model::UpgraderStep>& pending, const Options& options,
                               const observability::SpanScope* parent = nullptr);

} // namespace upgrader::core
