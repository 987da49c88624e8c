#include "factory.hpp"

#include "internal/db/postgres/pg_async_session.hpp"
#include "internal/db/postgres/pg_session.hpp"

namespace upgrader::factory {

std::unique_ptr<db::Session> MakeSession(Strategy strategy, const db::postgres::ConnectionTarget& target,
                                         core::SslMode ssl_mode, boost::asio::any_io_executor executor) {
  auto conninfo = db::postgres::BuildConnInfo(target, ssl_mode);

  switch (strategy) {
    case Strategy::kBlocking:
      return std::make_unique<db::postgres::PgSession>(std::move(conninfo));
    case Strategy::kCooperative:
      return std::make_unique<db::postgres::PgAsyncSession>(std::move(executor), std::move(conninfo));
  }
  return nullptr;
}

} // namespace upgrader::factory
