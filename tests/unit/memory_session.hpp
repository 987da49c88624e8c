#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <initializer_list>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include "internal/db/api/result.hpp"
#include "internal/db/api/session.hpp"
#include "internal/db/model/ledger_record.hpp"

namespace upgrader::testing {

/*
  MemorySession

  Scripted stand-in for a PostgreSQL connection. Understands the ledger
  statements by shape; any other Execute() is treated as step SQL and
  recorded. Transactions buffer both until Commit().
*/
class MemorySession : public db::Session {
 public:
  // knobs
  bool                  fail_connect = false;
  bool                  tls          = false;
  bool                  fail_commit  = false;
  std::string           fail_on;  // step SQL containing this fails
  std::set<std::string> schemas;
  std::function<void()> on_lock_table;

  // committed state
  std::vector<db::model::LedgerRecord> ledger;
  std::vector<std::string>             applied_sql;

  // observations
  std::vector<std::string> statements;
  std::string              search_path;
  bool                     ledger_created = false;
  bool                     lock_held      = false;
  bool                     closed         = false;
  int                      rollbacks      = 0;
  std::uint64_t            clock_ms       = 1000;

  Task<void> Connect() override {
    if (fail_connect) {
      throw db::DbError(db::ErrorCode::ConnectionFailure, "connection refused");
    }
    open_ = true;
    co_return;
  }

  Task<void> Begin() override {
    RequireOpen();
    in_tx_ = true;
    co_return;
  }

  Task<void> Commit() override {
    RequireOpen();
    in_tx_ = false;
    if (fail_commit) {
      pending_ledger_.clear();
      pending_sql_.clear();
      throw db::DbError(db::ErrorCode::SerializationFailure, "could not serialize access", "40001");
    }
    for (auto& r : pending_ledger_) ledger.push_back(std::move(r));
    for (auto& s : pending_sql_) applied_sql.push_back(std::move(s));
    pending_ledger_.clear();
    pending_sql_.clear();
    co_return;
  }

  Task<void> Rollback() override {
    RequireOpen();
    in_tx_ = false;
    ++rollbacks;
    pending_ledger_.clear();
    pending_sql_.clear();
    co_return;
  }

  Task<void> Execute(const std::string& sql) override {
    RequireOpen();
    statements.push_back(sql);

    if (sql.rfind("CREATE SCHEMA", 0) == 0) {
      schemas.insert(Quoted(sql));
    } else if (sql.rfind("SET search_path", 0) == 0) {
      search_path = Quoted(sql);
    } else if (sql.rfind("CREATE TABLE IF NOT EXISTS", 0) == 0 && Contains(sql, "$upgraders$")) {
      ledger_created = true;
    } else if (sql.rfind("LOCK TABLE", 0) == 0) {
      if (on_lock_table) on_lock_table();
    } else {
      if (!fail_on.empty() && Contains(sql, fail_on)) {
        throw db::DbError(db::ErrorCode::SyntaxError, "syntax error at or near \"" + fail_on + "\"", "42601");
      }
      if (in_tx_) {
        pending_sql_.push_back(sql);
      } else {
        applied_sql.push_back(sql);
      }
    }
    co_return;
  }

  Task<db::sql::Rows> Query(const std::string& sql, const db::sql::Params& params = {}) override {
    RequireOpen();
    statements.push_back(sql);

    db::sql::Rows rows;
    if (Contains(sql, "pg_advisory_lock(")) {
      lock_held = true;
      rows.emplace_back(Fields({""}));
    } else if (Contains(sql, "pg_advisory_unlock(")) {
      lock_held = false;
      rows.emplace_back(Fields({"t"}));
    } else if (Contains(sql, "FROM pg_namespace")) {
      if (schemas.count(db::sql::ToText(params.at(0))) != 0) {
        rows.emplace_back(Fields({"1"}));
      }
    } else if (Contains(sql, "pg_stat_ssl")) {
      rows.emplace_back(Fields({tls ? "t" : "f", tls ? "TLSv1.3" : ""}));
    } else if (sql.rfind("SELECT file_id, upgrader_id", 0) == 0) {
      for (const auto& r : ledger) {
        rows.emplace_back(Fields({std::to_string(r.file_id), std::to_string(r.upgrader_id), r.description, r.sql_text,
                                  std::to_string(r.applied_at_ms)}));
      }
    } else if (sql.rfind("SELECT count(*)", 0) == 0) {
      const model::StepKey from{std::stoi(db::sql::ToText(params.at(0))), std::stoi(db::sql::ToText(params.at(1)))};
      std::int64_t         count = 0;
      for (const auto& r : ledger) {
        if (!(r.Key() < from)) ++count;
      }
      rows.emplace_back(Fields({std::to_string(count)}));
    } else if (sql.rfind("INSERT INTO", 0) == 0 && Contains(sql, "$upgraders$")) {
      db::model::LedgerRecord r;
      r.file_id       = std::stoi(db::sql::ToText(params.at(0)));
      r.upgrader_id   = std::stoi(db::sql::ToText(params.at(1)));
      r.description   = db::sql::ToText(params.at(2));
      r.sql_text      = db::sql::ToText(params.at(3));
      r.applied_at_ms = ++clock_ms;
      pending_ledger_.push_back(std::move(r));
    } else if (sql == "SELECT 1") {
      rows.emplace_back(Fields({"1"}));
    }
    co_return rows;
  }

  Task<void> Close() override {
    open_     = false;
    in_tx_    = false;
    lock_held = false;
    closed    = true;
    co_return;
  }

  bool IsOpen() const override {
    return open_;
  }

  bool InTransaction() const override {
    return in_tx_;
  }

  // Seeds a committed ledger row.
  void Seed(std::int32_t file_id, std::int32_t upgrader_id, std::string description, std::string sql_text) {
    db::model::LedgerRecord r;
    r.file_id       = file_id;
    r.upgrader_id   = upgrader_id;
    r.description   = std::move(description);
    r.sql_text      = std::move(sql_text);
    r.applied_at_ms = ++clock_ms;
    ledger.push_back(std::move(r));
  }

 private:
  static bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
  }

  static std::string Quoted(const std::string& sql) {
    const auto first = sql.find('"');
    const auto last  = sql.rfind('"');
    if (first == std::string::npos || last == first) return {};
    return sql.substr(first + 1, last - first - 1);
  }

  static std::vector<std::optional<std::string>> Fields(std::initializer_list<std::string> values) {
    return {values.begin(), values.end()};
  }

  void RequireOpen() const {
    if (!open_) {
      throw db::DbError(db::ErrorCode::ConnectionFailure, "not connected");
    }
  }

  bool                                 open_  = false;
  bool                                 in_tx_ = false;
  std::vector<db::model::LedgerRecord> pending_ledger_;
  std::vector<std::string>             pending_sql_;
};

// Runs a coroutine to completion on a private io_context.
template <typename T>
T RunTask(Task<T> task) {
  boost::asio::io_context io;
  std::exception_ptr      failure;
  std::optional<T>        result;
  boost::asio::co_spawn(io, std::move(task), [&](std::exception_ptr e, T value) {
    failure = e;
    if (!e) result.emplace(std::move(value));
  });
  io.run();
  if (failure) std::rethrow_exception(failure);
  return std::move(*result);
}

inline void RunTask(Task<void> task) {
  boost::asio::io_context io;
  std::exception_ptr      failure;
  boost::asio::co_spawn(io, std::move(task), [&](std::exception_ptr e) { failure = e; });
  io.run();
  if (failure) std::rethrow_exception(failure);
}

} // namespace upgrader::testing
