#pragma once

#include "internal/core/options.hpp"
#include "internal/db/api/session.hpp"

namespace upgrader::db::postgres {

/*
  Transport security check.

  libpq negotiates TLS at connect time from the sslmode we put in the
  conninfo (see conninfo.hpp). This re-checks the outcome from the
  server's side so both strategies enforce kRequire identically.

  Throws DbError(TlsUnavailable) when kRequire is set and the backend
  reports a plain connection.
*/
Task<void> VerifyTransport(db::Session& session, core::SslMode mode);

} // namespace upgrader::db::postgres
