#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/core/options.hpp"

namespace upgrader::db::postgres {

/*
  Where to connect.

  Either a full libpq connection string (key=value or postgres:// URI)
  or discrete parameters. A connection string wins when both are set.
*/
struct ConnectionTarget {
  std::optional<std::string> connection_string;

  std::string   host;
  std::uint16_t port = 5432;
  std::string   user;
  std::string   password;
  std::string   dbname;
};

// Quotes a conninfo value: wraps in '' and escapes \ and '.
std::string QuoteConnValue(const std::string& value);

// Final libpq conninfo with sslmode appended for the requested mode.
// An sslmode already in the connection string is kept when it is at least
// as strict as requested; otherwise ConfigurationError.
std::string BuildConnInfo(const ConnectionTarget& target, core::SslMode ssl_mode);

} // namespace upgrader::db::postgres
