#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/task.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace upgrader::db {

/*
  Execution strategy protocol.

  One exclusively owned PostgreSQL connection. The engine (ledger,
  applier, orchestrator) is written once against this interface.

  Implementations:
    postgres::PgSession       blocking, libpqxx, never suspends
    postgres::PgAsyncSession  cooperative, libpq non-blocking API,
                              suspends on socket readiness

  Semantics guaranteed for ALL implementations:

  - Every failure surfaces as db::DbError
  - Execute() runs raw (possibly multi-statement) SQL verbatim
  - Outside Begin()/Commit() each statement auto-commits
  - Only one transaction may be open at a time
  - Destructor closes the connection; an open transaction is rolled
    back by the server
*/

class Session {
 public:
  virtual ~Session() = default;

  virtual Task<void> Connect() = 0;

  virtual Task<void> Begin()    = 0;
  virtual Task<void> Commit()   = 0;
  virtual Task<void> Rollback() = 0;

  virtual Task<void>      Execute(const std::string& sql)                            = 0;
  virtual Task<sql::Rows> Query(const std::string& sql, const sql::Params& params = {}) = 0;

  virtual Task<void> Close() = 0;

  virtual bool IsOpen() const        = 0;
  virtual bool InTransaction() const = 0;
};

} // namespace upgrader::db
