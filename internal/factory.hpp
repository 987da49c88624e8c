#pragma once

#include <memory>

#include <boost/asio/any_io_executor.hpp>

#include "internal/core/options.hpp"
#include "internal/db/api/session.hpp"
#include "internal/db/postgres/conninfo.hpp"

namespace upgrader::factory {

enum class Strategy {
  kBlocking,     // libpqxx, calling thread blocks on every round trip
  kCooperative,  // libpq non-blocking, suspends on the socket
};

/*
  MakeSession

  Builds an unconnected session for the requested strategy.

  NOTE:
  This is the composition root. It is the ONLY place allowed to know
  concrete session types.
*/
std::unique_ptr<db::Session> MakeSession(Strategy strategy, const db::postgres::ConnectionTarget& target,
                                         core::SslMode ssl_mode, boost::asio::any_io_executor executor);

} // namespace upgrader::factory
