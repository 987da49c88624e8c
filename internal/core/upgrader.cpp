#include "upgrader.hpp"

#include <exception>
#include <utility>

#include "internal/core/applier.hpp"
#include "internal/db/postgres/tls.hpp"
#include "internal/integrity/integrity_validator.hpp"
#include "internal/ledger/history_ledger.hpp"
#include "internal/loader/step_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace upgrader::core {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

Task<void> Open(db::Session& session, SslMode ssl_mode) {
  std::exception_ptr failure;
  try {
    co_await session.Connect();
    co_await db::postgres::VerifyTransport(session, ssl_mode);
  } catch (const db::DbError&) {
    failure = std::current_exception();
  }

  if (failure) {
    if (session.IsOpen()) {
      try {
        co_await session.Close();
      } catch (const db::DbError& e) {
        UPGRADER_LOG_WARN("Failed to close connection", {StringField("error", e.what())});
      }
    }
    try {
      std::rethrow_exception(failure);
    } catch (const db::DbError& e) {
      throw util::ConnectionError(std::string("Failed to connect to database: ") + e.what());
    }
  }
}

// Releases the run lock and closes. Failures here are logged only.
Task<void> Shutdown(db::Session& session, ledger::HistoryLedger* ledger) {
  if (ledger != nullptr && ledger->HoldsRunLock() && session.IsOpen()) {
    try {
      co_await ledger->ReleaseRunLock();
    } catch (const util::UpgraderError& e) {
      UPGRADER_LOG_WARN("Failed to release upgrade lock", {StringField("error", e.what())});
    }
  }
  try {
    co_await session.Close();
  } catch (const db::DbError& e) {
    UPGRADER_LOG_WARN("Failed to close connection", {StringField("error", e.what())});
  }
}

} // namespace

Task<UpgradeReport> RunUpgrade(db::Session& session, std::filesystem::path directory, Options options) {
  observability::SpanScope span("upgrader.upgrade");

  ValidateOptions(options);

  model::FullSequence sequence;
  {
    observability::SpanScope parse("upgrader.load_steps", &span);
    sequence = loader::LoadSteps(directory);
  }
  UPGRADER_LOG_INFO("Loaded upgraders",
                    {StringField("path", directory.string()), IntField("steps", static_cast<std::int64_t>(sequence.size()))});

  UpgradeReport report;
  report.total_steps = sequence.size();

  co_await Open(session, options.ssl_mode);

  ledger::HistoryLedger ledger(session, options.schema);

  std::exception_ptr failure;
  try {
    co_await ledger.AcquireRunLock();
    co_await ledger.PrepareSchema(options.create_schema);
    co_await ledger.Bootstrap();

    auto history           = co_await ledger.ReadHistory();
    report.already_applied = history.size();

    std::vector<model::UpgraderStep> pending;
    {
      observability::SpanScope validate("upgrader.validate", &span);
      pending = integrity::Validate(sequence, history);
    }
    if (pending.empty()) {
      UPGRADER_LOG_INFO("Database is up to date", {IntField("applied", static_cast<std::int64_t>(history.size()))});
    }

    report.applied = co_await ApplyPending(session, ledger, pending, options, &span);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    failure = std::current_exception();
  }

  co_await Shutdown(session, &ledger);

  if (failure) {
    std::rethrow_exception(failure);
  }

  UPGRADER_LOG_INFO("Upgrade complete", {IntField("total", static_cast<std::int64_t>(report.total_steps)),
                                         IntField("already_applied", static_cast<std::int64_t>(report.already_applied)),
                                         IntField("applied", static_cast<std::int64_t>(report.applied)),
                                         BoolField("schema_set", options.schema.has_value())});
  co_return report;
}

Task<void> RunCheckConnection(db::Session& session, SslMode ssl_mode) {
  co_await Open(session, ssl_mode);

  std::exception_ptr failure;
  try {
    co_await session.Query("SELECT 1");
  } catch (const db::DbError&) {
    failure = std::current_exception();
  }

  co_await Shutdown(session, nullptr);

  if (failure) {
    try {
      std::rethrow_exception(failure);
    } catch (const db::DbError& e) {
      throw util::ConnectionError(std::string("Connection check failed: ") + e.what());
    }
  }
}

} // namespace upgrader::core
