#pragma once

#include <string>

namespace upgrader::db::sql {

/*
  Canonical SQL used by the history ledger.

  `table` is the already-quoted (and schema-qualified) ledger name.
  Parameters are sent as text; casts make their types explicit.
*/

static constexpr const char* LEDGER_TABLE_NAME = "$upgraders$";

// Namespace half of the two-key advisory lock held for a whole run.
static constexpr int RUN_LOCK_CLASS = 42004200;

inline std::string CreateLedgerTable(const std::string& table) {
  return "CREATE TABLE IF NOT EXISTS " + table +
         " ("
         " file_id INT NOT NULL,"
         " upgrader_id INT NOT NULL,"
         " description TEXT NOT NULL,"
         " sql_text TEXT NOT NULL,"
         " applied_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
         " PRIMARY KEY (file_id, upgrader_id)"
         ");";
}

inline std::string SelectLedger(const std::string& table) {
  return "SELECT file_id, upgrader_id, description, sql_text,"
         " (extract(epoch FROM applied_at) * 1000)::bigint"
         " FROM " + table + " ORDER BY file_id, upgrader_id;";
}

inline std::string InsertLedgerRow(const std::string& table) {
  return "INSERT INTO " + table +
         " (file_id, upgrader_id, description, sql_text, applied_at)"
         " VALUES ($1::int, $2::int, $3::text, $4::text, now());";
}

inline std::string LockLedger(const std::string& table) {
  return "LOCK TABLE " + table + " IN EXCLUSIVE MODE;";
}

inline std::string CountLedgerFrom(const std::string& table) {
  return "SELECT count(*) FROM " + table + " WHERE (file_id, upgrader_id) >= ($1::int, $2::int);";
}

static constexpr const char* SELECT_SCHEMA_EXISTS =
    "SELECT 1 FROM pg_namespace WHERE nspname = $1::text;";

static constexpr const char* ACQUIRE_RUN_LOCK =
    "SELECT pg_advisory_lock($1::int, hashtext($2::text));";

static constexpr const char* RELEASE_RUN_LOCK =
    "SELECT pg_advisory_unlock($1::int, hashtext($2::text));";

}
