#include "history_ledger.hpp"

#include <exception>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace upgrader::ledger {

using observability::StringField;

namespace {

[[noreturn]] void ThrowLedgerFailure(const db::DbError& e, const std::string& context) {
  if (e.Code() == db::ErrorCode::ConnectionFailure) {
    throw util::ConnectionError(context + ": " + e.what());
  }
  throw util::LedgerWriteError(context + ": " + e.what());
}

std::string QualifiedTable(const std::optional<std::string>& schema) {
  const auto table = util::QuoteIdentifier(db::sql::LEDGER_TABLE_NAME);
  if (!schema) {
    return table;
  }
  return util::QuoteIdentifier(*schema) + "." + table;
}

} // namespace

HistoryLedger::HistoryLedger(db::Session& session, std::optional<std::string> schema)
    : session_(session), schema_(std::move(schema)), table_(QualifiedTable(schema_)) {
}

Task<void> HistoryLedger::AcquireRunLock() {
  try {
    const db::sql::Params params{db::sql::RUN_LOCK_CLASS, table_};
    co_await session_.Query(db::sql::ACQUIRE_RUN_LOCK, params);
  } catch (const db::DbError& e) {
    ThrowLedgerFailure(e, "Failed to acquire upgrade lock");
  }
  run_lock_held_ = true;
  UPGRADER_LOG_DEBUG("Upgrade lock acquired", {StringField("ledger", table_)});
}

Task<void> HistoryLedger::ReleaseRunLock() {
  if (!run_lock_held_) {
    co_return;
  }
  run_lock_held_ = false;
  try {
    const db::sql::Params params{db::sql::RUN_LOCK_CLASS, table_};
    co_await session_.Query(db::sql::RELEASE_RUN_LOCK, params);
  } catch (const db::DbError& e) {
    ThrowLedgerFailure(e, "Failed to release upgrade lock");
  }
}

Task<void> HistoryLedger::PrepareSchema(bool create_schema) {
  if (!schema_) {
    co_return;
  }

  const auto quoted = util::QuoteIdentifier(*schema_);
  try {
    const db::sql::Params params{*schema_};
    auto rows = co_await session_.Query(db::sql::SELECT_SCHEMA_EXISTS, params);
    if (rows.empty()) {
      if (!create_schema) {
        throw util::SchemaCreationError("Schema " + quoted + " does not exist and create_schema is not enabled");
      }
      co_await session_.Execute("CREATE SCHEMA IF NOT EXISTS " + quoted + ";");
      UPGRADER_LOG_INFO("Created schema", {StringField("schema", *schema_)});
    }
    co_await session_.Execute("SET search_path TO " + quoted + ";");
  } catch (const db::DbError& e) {
    if (e.Code() == db::ErrorCode::ConnectionFailure) {
      throw util::ConnectionError("Failed to prepare schema " + quoted + ": " + e.what());
    }
    throw util::SchemaCreationError("Failed to prepare schema " + quoted + ": " + e.what());
  }
}

Task<void> HistoryLedger::Bootstrap() {
  std::exception_ptr failure;
  try {
    co_await session_.Begin();
    co_await session_.Execute(db::sql::CreateLedgerTable(table_));
    co_await session_.Commit();
  } catch (const db::DbError&) {
    failure = std::current_exception();
  }

  if (failure) {
    if (session_.InTransaction()) {
      try {
        co_await session_.Rollback();
      } catch (const db::DbError& e) {
        UPGRADER_LOG_WARN("Rollback after failed ledger bootstrap failed", {StringField("error", e.what())});
      }
    }
    try {
      std::rethrow_exception(failure);
    } catch (const db::DbError& e) {
      ThrowLedgerFailure(e, "Failed to create upgraders table");
    }
  }
}

Task<std::vector<db::model::LedgerRecord>> HistoryLedger::ReadHistory() {
  db::sql::Rows rows;
  try {
    rows = co_await session_.Query(db::sql::SelectLedger(table_));
  } catch (const db::DbError& e) {
    ThrowLedgerFailure(e, "Failed to load applied upgraders");
  }

  std::vector<db::model::LedgerRecord> records;
  records.reserve(rows.size());
  for (const auto& row : rows) {
    db::model::LedgerRecord r;
    r.file_id       = row.GetInt(0);
    r.upgrader_id   = row.GetInt(1);
    r.description   = row.GetText(2);
    r.sql_text      = row.GetText(3);
    r.applied_at_ms = row.IsNull(4) ? 0 : row.GetU64(4);
    records.push_back(std::move(r));
  }
  co_return records;
}

Task<void> HistoryLedger::LockForStep(const model::StepKey& key) {
  db::sql::Rows rows;
  try {
    co_await session_.Execute(db::sql::LockLedger(table_));
    const db::sql::Params params{key.file_id, key.upgrader_id};
    rows = co_await session_.Query(db::sql::CountLedgerFrom(table_), params);
  } catch (const db::DbError& e) {
    ThrowLedgerFailure(e, "Failed to lock upgraders table");
  }

  if (!rows.empty() && rows[0].GetInt64(0) != 0) {
    throw util::HistoryContinuityError("Upgrader " + model::ToString(key) + " or a later one was recorded by another process during this run", key);
  }
}

Task<void> HistoryLedger::Record(const model::UpgraderStep& step) {
  try {
    const db::sql::Params params{step.file_id, step.upgrader_id, step.description, step.sql_text};
    co_await session_.Query(db::sql::InsertLedgerRow(table_), params);
  } catch (const db::DbError& e) {
    if (e.Code() == db::ErrorCode::ConnectionFailure) {
      throw util::ConnectionError("Failed to record upgrader " + model::ToString(step.Key()) + ": " + e.what());
    }
    throw util::LedgerWriteError("Failed to record upgrader " + model::ToString(step.Key()) + ": " + e.what(), step.Key());
  }
}

} // namespace upgrader::ledger
