#pragma once

#include <filesystem>

#include "internal/core/options.hpp"
#include "internal/core/upgrader.hpp"
#include "internal/db/api/task.hpp"
#include "internal/db/postgres/conninfo.hpp"
#include "internal/util/errors.hpp"

namespace upgrader {

using ::upgrader::core::Options;
using ::upgrader::core::OptionsBuilder;
using ::upgrader::core::SslMode;
using ::upgrader::core::UpgradeReport;
using ::upgrader::db::postgres::ConnectionTarget;
using ::upgrader::util::ErrorKind;
using ::upgrader::util::UpgraderError;

/*
  Blocking entry points. Run to completion on the calling thread.
*/
UpgradeReport Upgrade(const std::filesystem::path& directory, const ConnectionTarget& target, const Options& options);
void          CheckConnection(const ConnectionTarget& target, SslMode ssl_mode);

/*
  Cooperative entry points. Must be awaited from a coroutine running on
  an asio executor; every database round trip suspends instead of
  blocking the thread, so other work on the same executor keeps running.

    boost::asio::co_spawn(io, upgrader::UpgradeAsync(path, target, options), ...);
*/
Task<UpgradeReport> UpgradeAsync(std::filesystem::path directory, ConnectionTarget target, Options options);
Task<void>          CheckConnectionAsync(ConnectionTarget target, SslMode ssl_mode);

} // namespace upgrader
