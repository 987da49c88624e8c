#pragma once

#include <libpq-fe.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/session.hpp"

namespace upgrader::db::postgres {

/*
  PgAsyncSession

  Cooperative execution strategy on the libpq non-blocking API.

  Every network wait is a suspension point: the coroutine parks on the
  connection socket (asio::posix::stream_descriptor::async_wait) and the
  executor is free to run other work until the socket is ready.

  Design notes:
  -------------
  - The socket is owned by libpq; the descriptor is released, never
    closed, when rebinding or tearing down.
  - Connect drives PQconnectStart/PQconnectPoll; the socket may change
    between polls so it is rebound on every iteration.
  - All results of a command are drained before the next command is
    sent. The first error result fails the command.
  - Transactions are plain BEGIN/COMMIT/ROLLBACK. A COMMIT answered with
    "ROLLBACK" is reported as TransactionRolledBack.
  - Not thread-safe. Must be used from a single strand.
*/

class PgAsyncSession final : public db::Session {
 public:
  PgAsyncSession(boost::asio::any_io_executor executor, std::string conninfo);
  ~PgAsyncSession() override;

  PgAsyncSession(const PgAsyncSession&)            = delete;
  PgAsyncSession& operator=(const PgAsyncSession&) = delete;

  Task<void> Connect() override;

  Task<void> Begin() override;
  Task<void> Commit() override;
  Task<void> Rollback() override;

  Task<void>      Execute(const std::string& sql) override;
  Task<sql::Rows> Query(const std::string& sql, const sql::Params& params) override;

  Task<void> Close() override;

  bool IsOpen() const override;
  bool InTransaction() const override {
    return in_transaction_;
  }

 private:
  struct ResultDeleter {
    void operator()(PGresult* r) const {
      PQclear(r);
    }
  };
  using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

  enum class Wait { kRead, kWrite };

  void       BindSocket();
  void       ReleaseSocket();
  Task<void> WaitSocket(Wait direction);

  Task<void>                   Flush();
  Task<std::vector<ResultPtr>> Collect();
  Task<std::vector<ResultPtr>> RunSimple(const std::string& sql);

  [[noreturn]] void ThrowConnectionError(const std::string& context) const;

  boost::asio::any_io_executor                                 executor_;
  std::string                                                  conninfo_;
  PGconn*                                                      conn_ = nullptr;
  std::unique_ptr<boost::asio::posix::stream_descriptor>       socket_;
  int                                                          socket_fd_      = -1;
  bool                                                         in_transaction_ = false;
};

} // namespace upgrader::db::postgres
