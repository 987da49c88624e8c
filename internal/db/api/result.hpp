#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace upgrader::db {

/*
  Portable DB error codes.

  Sessions must translate driver errors (pqxx exceptions, libpq result
  states) into DbError. Upper layers never depend on driver types.
*/

enum class ErrorCode {
  OK = 0,

  ConnectionFailure,
  TlsUnavailable,

  SyntaxError,
  UndefinedObject,
  DuplicateObject,
  InsufficientPrivilege,

  ConstraintViolation,
  SerializationFailure,
  TransactionRolledBack,
  InDoubt,

  InternalError
};

// Maps a five character SQLSTATE onto an ErrorCode.
ErrorCode ClassifySqlState(std::string_view sqlstate);

const char* ToString(ErrorCode code);

class DbError : public std::runtime_error {
 public:
  DbError(ErrorCode code, const std::string& msg, std::string sqlstate = {})
      : std::runtime_error(msg), code_(code), sqlstate_(std::move(sqlstate)) {
  }

  ErrorCode Code() const {
    return code_;
  }

  const std::string& SqlState() const {
    return sqlstate_;
  }

 private:
  ErrorCode   code_;
  std::string sqlstate_;
};

} // namespace upgrader::db
