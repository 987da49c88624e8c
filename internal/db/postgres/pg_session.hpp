#pragma once

#include <memory>
#include <pqxx/pqxx>
#include <string>

#include "internal/db/api/session.hpp"

namespace upgrader::db::postgres {

/*
  PgSession

  Blocking execution strategy on top of libpqxx.

  Design notes:
  -------------
  - Every operation runs to completion on the calling thread; the
    returned Task never suspends.
  - A pqxx::work is held between Begin() and Commit()/Rollback().
  - Outside a transaction, statements run in a short-lived
    pqxx::nontransaction (autocommit), so session settings such as
    search_path and advisory locks persist on the connection.
  - libpqxx connections are NOT thread-safe; one session per run.
*/

class PgSession final : public db::Session {
 public:
  explicit PgSession(std::string conninfo);
  ~PgSession() override;

  PgSession(const PgSession&)            = delete;
  PgSession& operator=(const PgSession&) = delete;

  Task<void> Connect() override;

  Task<void> Begin() override;
  Task<void> Commit() override;
  Task<void> Rollback() override;

  Task<void>      Execute(const std::string& sql) override;
  Task<sql::Rows> Query(const std::string& sql, const sql::Params& params) override;

  Task<void> Close() override;

  bool IsOpen() const override;
  bool InTransaction() const override {
    return tx_ != nullptr;
  }

 private:
  pqxx::connection& Conn();

  std::string                       conninfo_;
  std::unique_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       tx_;
};

} // namespace upgrader::db::postgres
