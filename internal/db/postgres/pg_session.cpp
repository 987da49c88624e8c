#include "pg_session.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace upgrader::db::postgres {

namespace {

// pqxx exception hierarchy -> DbError. Must be called from a catch block.
[[noreturn]] void Translate() {
  try {
    throw;
  } catch (const pqxx::broken_connection& e) {
    throw DbError(ErrorCode::ConnectionFailure, e.what());
  } catch (const pqxx::in_doubt_error& e) {
    throw DbError(ErrorCode::InDoubt, e.what());
  } catch (const pqxx::sql_error& e) {
    throw DbError(ClassifySqlState(e.sqlstate()), e.what(), e.sqlstate());
  } catch (const pqxx::failure& e) {
    throw DbError(ErrorCode::InternalError, e.what());
  } catch (const pqxx::usage_error& e) {
    throw DbError(ErrorCode::InternalError, e.what());
  }
}

pqxx::params ToPqxx(const sql::Params& params) {
  pqxx::params out;
  for (const auto& p : params) {
    if (sql::IsNull(p)) {
      out.append();
    } else {
      out.append(sql::ToText(p));
    }
  }
  return out;
}

sql::Rows ToRows(const pqxx::result& res) {
  sql::Rows rows;
  rows.reserve(res.size());
  for (const auto& row : res) {
    std::vector<std::optional<std::string>> fields;
    fields.reserve(row.size());
    for (const auto& field : row) {
      if (field.is_null()) {
        fields.emplace_back(std::nullopt);
      } else {
        fields.emplace_back(std::string(field.c_str()));
      }
    }
    rows.emplace_back(std::move(fields));
  }
  return rows;
}

} // namespace

PgSession::PgSession(std::string conninfo) : conninfo_(std::move(conninfo)) {
}

PgSession::~PgSession() {
  if (tx_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      UPGRADER_LOG_WARN("Rollback on session teardown failed", {observability::StringField("error", e.what())});
    }
  }
}

pqxx::connection& PgSession::Conn() {
  if (!conn_) {
    throw DbError(ErrorCode::ConnectionFailure, "session is not connected");
  }
  return *conn_;
}

Task<void> PgSession::Connect() {
  try {
    conn_ = std::make_unique<pqxx::connection>(conninfo_);
  } catch (...) {
    Translate();
  }
  co_return;
}

Task<void> PgSession::Begin() {
  if (tx_) {
    throw DbError(ErrorCode::InternalError, "transaction already open");
  }
  try {
    tx_ = std::make_unique<pqxx::work>(Conn());
  } catch (...) {
    Translate();
  }
  co_return;
}

Task<void> PgSession::Commit() {
  if (!tx_) {
    throw DbError(ErrorCode::InternalError, "no open transaction");
  }
  auto tx = std::move(tx_);
  try {
    tx->commit();
  } catch (...) {
    Translate();
  }
  co_return;
}

Task<void> PgSession::Rollback() {
  if (!tx_) {
    co_return;
  }
  auto tx = std::move(tx_);
  try {
    tx->abort();
  } catch (...) {
    Translate();
  }
}

Task<void> PgSession::Execute(const std::string& sql) {
  try {
    if (tx_) {
      tx_->exec(sql);
    } else {
      pqxx::nontransaction ntx(Conn());
      ntx.exec(sql);
      ntx.commit();
    }
  } catch (const DbError&) {
    throw;
  } catch (...) {
    Translate();
  }
  co_return;
}

Task<sql::Rows> PgSession::Query(const std::string& sql, const sql::Params& params) {
  try {
    if (tx_) {
      co_return ToRows(tx_->exec_params(sql, ToPqxx(params)));
    }
    pqxx::nontransaction ntx(Conn());
    auto res = ntx.exec_params(sql, ToPqxx(params));
    ntx.commit();
    co_return ToRows(res);
  } catch (const DbError&) {
    throw;
  } catch (...) {
    Translate();
  }
}

Task<void> PgSession::Close() {
  if (tx_) {
    co_await Rollback();
  }
  if (conn_) {
    try {
      conn_->close();
    } catch (...) {
      conn_.reset();
      Translate();
    }
    conn_.reset();
  }
}

bool PgSession::IsOpen() const {
  return conn_ && conn_->is_open();
}

} // namespace upgrader::db::postgres
