#include "integrity_validator.hpp"

#include "internal/util/errors.hpp"

namespace upgrader::integrity {

using model::StepKey;
using model::ToString;

namespace {

void CheckChronology(const std::vector<db::model::LedgerRecord>& ledger) {
  for (std::size_t i = 1; i < ledger.size(); ++i) {
    if (ledger[i].applied_at_ms < ledger[i - 1].applied_at_ms) {
      throw util::HistoryContinuityError("Upgrader " + ToString(ledger[i].Key()) + " was applied before the previous upgrader " +
                                             ToString(ledger[i - 1].Key()),
                                         ledger[i].Key());
    }
  }
}

} // namespace

std::vector<model::UpgraderStep> Validate(const model::FullSequence& sequence, const std::vector<db::model::LedgerRecord>& ledger) {
  CheckChronology(ledger);

  std::size_t i = 0;
  for (; i < ledger.size(); ++i) {
    const auto& row     = ledger[i];
    const StepKey found = row.Key();

    if (i >= sequence.size()) {
      throw util::HistoryContinuityError("Database contains upgrader " + ToString(found) + " that is missing from the migration files", found);
    }

    const auto& step       = sequence[i];
    const StepKey expected = step.Key();
    if (found != expected) {
      if (expected < found) {
        throw util::HistoryContinuityError("Gap detected in database migrations. Upgrader " + ToString(expected) +
                                               " is missing in database, but later upgrader " + ToString(found) + " is present",
                                           expected);
      }
      throw util::HistoryContinuityError("Database contains upgrader " + ToString(found) + " that is missing from the migration files", found);
    }

    if (step.sql_text != row.sql_text) {
      throw util::TamperDetectedError("Upgrader " + ToString(expected) + ". SQL content has changed", expected);
    }
    if (step.description != row.description) {
      throw util::TamperDetectedError("Upgrader " + ToString(expected) + ". Description has changed. File: '" + step.description + "' DB: '" +
                                          row.description + "'",
                                      expected);
    }
  }

  return {sequence.begin() + static_cast<std::ptrdiff_t>(i), sequence.end()};
}

} // namespace upgrader::integrity
