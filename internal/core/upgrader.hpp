#pragma once

#include <cstddef>
#include <filesystem>

#include "internal/core/options.hpp"
#include "internal/db/api/session.hpp"

namespace upgrader::core {

struct UpgradeReport {
  std::size_t total_steps     = 0;  // steps found on disk
  std::size_t already_applied = 0;  // ledger rows before the run
  std::size_t applied         = 0;  // steps committed by this run
};

/*
  One upgrade run against an unconnected session:

    options -> load steps -> connect -> transport check -> run lock
      -> schema -> ledger bootstrap -> history -> validate -> apply

  Steps are loaded before any connection is made, so layout and naming
  errors never touch the database. The run lock is released and the
  session closed on every exit path.
*/
Task<UpgradeReport> RunUpgrade(db::Session& session, std::filesystem::path directory, Options options);

// Connects, runs SELECT 1, closes. ConnectionError on any failure.
Task<void> RunCheckConnection(db::Session& session, SslMode ssl_mode);

} // namespace upgrader::core
