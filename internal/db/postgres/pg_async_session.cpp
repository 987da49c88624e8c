#include "pg_async_session.hpp"

#include <boost/asio/use_awaitable.hpp>

#include <cstring>
#include <utility>

#include "internal/util/strings.hpp"

namespace upgrader::db::postgres {

namespace asio = boost::asio;

namespace {

// Ok, or throws the DbError carried by the result.
void CheckResult(const PGresult* res) {
  switch (PQresultStatus(res)) {
    case PGRES_COMMAND_OK:
    case PGRES_TUPLES_OK:
    case PGRES_EMPTY_QUERY:
      return;
    default:
      break;
  }

  const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE);
  std::string sqlstate = state ? state : "";
  std::string message  = util::Trim(PQresultErrorMessage(res));
  if (message.empty()) {
    message = PQresStatus(PQresultStatus(res));
  }
  throw DbError(ClassifySqlState(sqlstate), message, sqlstate);
}

sql::Rows ToRows(const PGresult* res) {
  sql::Rows rows;
  const int n_rows   = PQntuples(res);
  const int n_fields = PQnfields(res);
  rows.reserve(static_cast<std::size_t>(n_rows));
  for (int r = 0; r < n_rows; ++r) {
    std::vector<std::optional<std::string>> fields;
    fields.reserve(static_cast<std::size_t>(n_fields));
    for (int c = 0; c < n_fields; ++c) {
      if (PQgetisnull(res, r, c)) {
        fields.emplace_back(std::nullopt);
      } else {
        fields.emplace_back(std::string(PQgetvalue(res, r, c), static_cast<std::size_t>(PQgetlength(res, r, c))));
      }
    }
    rows.emplace_back(std::move(fields));
  }
  return rows;
}

} // namespace

PgAsyncSession::PgAsyncSession(asio::any_io_executor executor, std::string conninfo)
    : executor_(std::move(executor)), conninfo_(std::move(conninfo)) {
}

PgAsyncSession::~PgAsyncSession() {
  ReleaseSocket();
  if (conn_) {
    // server side rolls back any open transaction
    PQfinish(conn_);
  }
}

void PgAsyncSession::ThrowConnectionError(const std::string& context) const {
  std::string detail = conn_ ? util::Trim(PQerrorMessage(conn_)) : "no connection";
  throw DbError(ErrorCode::ConnectionFailure, context + ": " + detail);
}

void PgAsyncSession::BindSocket() {
  const int fd = PQsocket(conn_);
  if (fd < 0) {
    ThrowConnectionError("connection has no socket");
  }
  if (socket_ && socket_fd_ == fd) {
    return;
  }
  ReleaseSocket();
  socket_    = std::make_unique<asio::posix::stream_descriptor>(executor_, fd);
  socket_fd_ = fd;
}

void PgAsyncSession::ReleaseSocket() {
  if (socket_) {
    // libpq owns the fd
    socket_->release();
    socket_.reset();
  }
  socket_fd_ = -1;
}

Task<void> PgAsyncSession::WaitSocket(Wait direction) {
  BindSocket();
  const auto what = direction == Wait::kRead ? asio::posix::stream_descriptor::wait_read : asio::posix::stream_descriptor::wait_write;
  co_await socket_->async_wait(what, asio::use_awaitable);
}

Task<void> PgAsyncSession::Connect() {
  if (conn_) {
    throw DbError(ErrorCode::InternalError, "session already connected");
  }

  conn_ = PQconnectStart(conninfo_.c_str());
  if (!conn_) {
    throw DbError(ErrorCode::ConnectionFailure, "out of memory allocating connection");
  }
  if (PQstatus(conn_) == CONNECTION_BAD) {
    ThrowConnectionError("connection failed");
  }

  // libpq: behave as if the last poll returned WRITING
  PostgresPollingStatusType poll = PGRES_POLLING_WRITING;
  for (;;) {
    if (poll == PGRES_POLLING_OK) break;
    if (poll == PGRES_POLLING_FAILED) {
      ThrowConnectionError("connection failed");
    }
    // libpq may switch sockets while connecting (host fallback, SSL retry)
    ReleaseSocket();
    co_await WaitSocket(poll == PGRES_POLLING_READING ? Wait::kRead : Wait::kWrite);
    poll = PQconnectPoll(conn_);
  }

  if (PQsetnonblocking(conn_, 1) != 0) {
    ThrowConnectionError("cannot switch connection to non-blocking mode");
  }
  BindSocket();
}

Task<void> PgAsyncSession::Flush() {
  for (;;) {
    const int rc = PQflush(conn_);
    if (rc == 0) co_return;
    if (rc < 0) {
      ThrowConnectionError("failed to send command");
    }
    co_await WaitSocket(Wait::kWrite);
    // the server may be waiting for us to read before it accepts more
    if (!PQconsumeInput(conn_)) {
      ThrowConnectionError("failed to read from server");
    }
  }
}

Task<std::vector<PgAsyncSession::ResultPtr>> PgAsyncSession::Collect() {
  std::vector<ResultPtr> results;
  for (;;) {
    while (PQisBusy(conn_)) {
      co_await WaitSocket(Wait::kRead);
      if (!PQconsumeInput(conn_)) {
        ThrowConnectionError("failed to read from server");
      }
    }
    PGresult* res = PQgetResult(conn_);
    if (!res) break;
    results.emplace_back(res);
  }
  co_return results;
}

Task<std::vector<PgAsyncSession::ResultPtr>> PgAsyncSession::RunSimple(const std::string& sql) {
  if (!conn_) {
    throw DbError(ErrorCode::ConnectionFailure, "session is not connected");
  }
  if (!PQsendQuery(conn_, sql.c_str())) {
    ThrowConnectionError("failed to send query");
  }
  co_await Flush();
  auto results = co_await Collect();
  for (const auto& r : results) {
    CheckResult(r.get());
  }
  co_return results;
}

Task<void> PgAsyncSession::Begin() {
  if (in_transaction_) {
    throw DbError(ErrorCode::InternalError, "transaction already open");
  }
  co_await RunSimple("BEGIN");
  in_transaction_ = true;
}

Task<void> PgAsyncSession::Commit() {
  if (!in_transaction_) {
    throw DbError(ErrorCode::InternalError, "no open transaction");
  }
  in_transaction_ = false;
  auto results    = co_await RunSimple("COMMIT");
  if (!results.empty() && std::strcmp(PQcmdStatus(results.back().get()), "ROLLBACK") == 0) {
    throw DbError(ErrorCode::TransactionRolledBack, "transaction was rolled back by the server on commit");
  }
}

Task<void> PgAsyncSession::Rollback() {
  if (!in_transaction_) {
    co_return;
  }
  in_transaction_ = false;
  co_await RunSimple("ROLLBACK");
}

Task<void> PgAsyncSession::Execute(const std::string& sql) {
  co_await RunSimple(sql);
}

Task<sql::Rows> PgAsyncSession::Query(const std::string& sql, const sql::Params& params) {
  if (!conn_) {
    throw DbError(ErrorCode::ConnectionFailure, "session is not connected");
  }

  std::vector<std::string> text;
  std::vector<const char*> values;
  text.reserve(params.size());
  values.reserve(params.size());
  for (const auto& p : params) {
    text.push_back(sql::ToText(p));
  }
  for (std::size_t i = 0; i < params.size(); ++i) {
    values.push_back(sql::IsNull(params[i]) ? nullptr : text[i].c_str());
  }

  if (!PQsendQueryParams(conn_, sql.c_str(), static_cast<int>(values.size()), nullptr, values.data(), nullptr, nullptr, 0)) {
    ThrowConnectionError("failed to send query");
  }
  co_await Flush();
  auto results = co_await Collect();
  for (const auto& r : results) {
    CheckResult(r.get());
  }
  if (results.empty()) {
    co_return sql::Rows{};
  }
  co_return ToRows(results.back().get());
}

Task<void> PgAsyncSession::Close() {
  ReleaseSocket();
  if (conn_) {
    PQfinish(conn_);
    conn_ = nullptr;
  }
  in_transaction_ = false;
  co_return;
}

bool PgAsyncSession::IsOpen() const {
  return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

} // namespace upgrader::db::postgres
