#include "tls.hpp"

#include "internal/observability/logging.hpp"

namespace upgrader::db::postgres {

Task<void> VerifyTransport(db::Session& session, core::SslMode mode) {
  if (mode != core::SslMode::kRequire) {
    co_return;
  }

  auto rows = co_await session.Query("SELECT ssl, version FROM pg_stat_ssl WHERE pid = pg_backend_pid()");
  if (rows.empty() || rows[0].GetText(0) != "t") {
    throw DbError(ErrorCode::TlsUnavailable, "TLS was required but the connection is not encrypted");
  }

  UPGRADER_LOG_DEBUG("TLS negotiated", {observability::StringField("version", rows[0].GetText(1))});
}

} // namespace upgrader::db::postgres
