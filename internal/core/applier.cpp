#include "applier.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace upgrader::core {

using observability::StepField;
using observability::StringField;

namespace {

Task<void> ApplyOne(db::Session& session, ledger::HistoryLedger& ledger, const model::UpgraderStep& step,
                    const Options& options) {
  const auto key = step.Key();

  try {
    co_await session.Begin();
  } catch (const db::DbError& e) {
    if (e.Code() == db::ErrorCode::ConnectionFailure) {
      throw util::ConnectionError("Failed to begin transaction for upgrader " + model::ToString(key) + ": " + e.what());
    }
    throw util::SqlExecutionError("Failed to begin transaction for upgrader " + model::ToString(key) + ": " + e.what(), key);
  }

  co_await ledger.LockForStep(key);

  try {
    co_await session.Execute(options.ApplySchemaSubstitution(step.sql_text));
  } catch (const db::DbError& e) {
    throw util::SqlExecutionError("Upgrader " + model::ToString(key) + " (" + step.description + ") failed: " + e.what(), key);
  }

  co_await ledger.Record(step);

  try {
    co_await session.Commit();
  } catch (const db::DbError& e) {
    throw util::SqlExecutionError("Failed to commit upgrader " + model::ToString(key) + ": " + e.what(), key);
  }
}

} // namespace

Task<std::size_t> ApplyPending(db::Session& session, ledger::HistoryLedger& ledger,
                               const std::vector<model::UpgraderStep>& pending, const Options& options,
                               const observability::SpanScope* parent) {
  std::size_t applied = 0;

  for (const auto& step : pending) {
    observability::SpanScope span("upgrader.apply_step", parent);
    span.SetAttribute("upgrader.file_id", static_cast<std::int64_t>(step.file_id));
    span.SetAttribute("upgrader.upgrader_id", static_cast<std::int64_t>(step.upgrader_id));

    UPGRADER_LOG_INFO("Applying upgrader", {StepField(step.Key()), StringField("description", step.description)});

    std::exception_ptr failure;
    try {
      co_await ApplyOne(session, ledger, step, options);
    } catch (const std::exception& e) {
      span.RecordException(e.what());
      failure = std::current_exception();
    }

    if (failure) {
      UPGRADER_LOG_ERROR("Upgrader failed", {StepField(step.Key()), StringField("description", step.description)});
      if (session.InTransaction()) {
        try {
          co_await session.Rollback();
        } catch (const db::DbError& e) {
          UPGRADER_LOG_WARN("Rollback of failed upgrader failed", {StepField(step.Key()), StringField("error", e.what())});
        }
      }
      std::rethrow_exception(failure);
    }

    UPGRADER_LOG_INFO("Upgrader committed", {StepField(step.Key()), StringField("description", step.description)});
    ++applied;
  }

  co_return applied;
}

} // namespace upgrader::core
