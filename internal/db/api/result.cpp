#include "internal/db/api/result.hpp"

namespace upgrader::db {

ErrorCode ClassifySqlState(std::string_view sqlstate) {
  if (sqlstate.size() != 5) {
    return ErrorCode::InternalError;
  }

  const auto cls = sqlstate.substr(0, 2);
  if (cls == "08") return ErrorCode::ConnectionFailure;
  if (cls == "23") return ErrorCode::ConstraintViolation;
  if (cls == "40") {
    return sqlstate == "40001" ? ErrorCode::SerializationFailure : ErrorCode::TransactionRolledBack;
  }
  if (sqlstate == "42501") return ErrorCode::InsufficientPrivilege;
  if (sqlstate == "42P06" || sqlstate == "42P07" || sqlstate == "42710" || sqlstate == "42723") return ErrorCode::DuplicateObject;
  if (sqlstate == "42P01" || sqlstate == "42703" || sqlstate == "42883" || sqlstate == "3F000") return ErrorCode::UndefinedObject;
  if (cls == "42") return ErrorCode::SyntaxError;
  if (cls == "57" || cls == "53") return ErrorCode::ConnectionFailure;

  return ErrorCode::InternalError;
}

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::ConnectionFailure:
      return "connection_failure";
    case ErrorCode::TlsUnavailable:
      return "tls_unavailable";
    case ErrorCode::SyntaxError:
      return "syntax_error";
    case ErrorCode::UndefinedObject:
      return "undefined_object";
    case ErrorCode::DuplicateObject:
      return "duplicate_object";
    case ErrorCode::InsufficientPrivilege:
      return "insufficient_privilege";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::TransactionRolledBack:
      return "transaction_rolled_back";
    case ErrorCode::InDoubt:
      return "in_doubt";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

} // namespace upgrader::db
