#pragma once

#include <vector>

#include "internal/db/model/ledger_record.hpp"
#include "internal/model/step.hpp"

namespace upgrader::integrity {

/*
  Reconciles the on-disk FullSequence with the ledger.

  Pure logic, no I/O. Both inputs must be sorted by StepKey.

  Guarantees on return:
    - every ledger row matches the step at the same position, key and
      content (TamperDetectedError otherwise)
    - the ledger is an unbroken prefix of the sequence
      (HistoryContinuityError otherwise)
    - applied_at never decreases along the ledger

  Returns the steps after the ledger's last key, in apply order.
*/

std::vector<model::UpgraderStep> Validate(const model::FullSequence& sequence, const std::vector<db::model::LedgerRecord>& ledger);

} // namespace upgrader::integrity
