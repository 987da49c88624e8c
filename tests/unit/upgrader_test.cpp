#include "internal/core/upgrader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "memory_session.hpp"

namespace {

namespace fs = std::filesystem;

using upgrader::core::OptionsBuilder;
using upgrader::core::RunCheckConnection;
using upgrader::core::RunUpgrade;
using upgrader::core::SslMode;
using upgrader::model::StepKey;
using upgrader::testing::MemorySession;
using upgrader::testing::RunTask;

fs::path UpgradersDir(const std::string& test_name) {
  const auto dir = fs::temp_directory_path() / "pg_schema_upgrader_orchestrator_tests" / test_name;
  fs::remove_all(dir);
  fs::create_directories(dir);

  std::ofstream(dir / "0_users.sql") << "--- 0: users\nCREATE TABLE users (id INT);\n--- 1: email\nALTER TABLE users ADD COLUMN email TEXT;\n";
  std::ofstream(dir / "1_orders.sql") << "--- 0: orders\nCREATE TABLE orders (id INT);\n";
  return dir;
}

void TestFreshDatabaseGetsEverything() {
  const auto    dir = UpgradersDir("fresh");
  MemorySession session;

  const auto report = RunTask(RunUpgrade(session, dir, OptionsBuilder().Build()));
  assert(report.total_steps == 3);
  assert(report.already_applied == 0);
  assert(report.applied == 3);

  assert(session.ledger_created);
  assert(session.ledger.size() == 3);
  assert(!session.lock_held);
  assert(session.closed);
}

void TestSecondRunIsNoOp() {
  const auto    dir = UpgradersDir("idempotent");
  MemorySession session;
  RunTask(RunUpgrade(session, dir, OptionsBuilder().Build()));
  const auto statements_after_first = session.applied_sql.size();

  const auto report = RunTask(RunUpgrade(session, dir, OptionsBuilder().Build()));
  assert(report.already_applied == 3);
  assert(report.applied == 0);
  assert(session.applied_sql.size() == statements_after_first);
}

void TestNewStepsAreAppliedIncrementally() {
  const auto    dir = UpgradersDir("incremental");
  MemorySession session;
  RunTask(RunUpgrade(session, dir, OptionsBuilder().Build()));

  std::ofstream(dir / "1_orders.sql", std::ios::app) << "--- 1: total\nALTER TABLE orders ADD COLUMN total INT;\n";
  const auto report = RunTask(RunUpgrade(session, dir, OptionsBuilder().Build()));
  assert(report.applied == 1);
  assert(session.ledger.back().Key() == (StepKey{1, 1}));
}

void TestTamperedHistoryStopsBeforeApplying() {
  const auto    dir = UpgradersDir("tamper");
  MemorySession session;
  session.Seed(0, 0, "users", "CREATE TABLE users (id BIGINT);");

  try {
    RunTask(RunUpgrade(session, dir, OptionsBuilder().Build()));
    assert(false && "tampered step must be rejected");
  } catch (const upgrader::util::TamperDetectedError& e) {
    assert(e.Step() && *e.Step() == (StepKey{0, 0}));
  }
  assert(session.applied_sql.empty());
  assert(!session.lock_held);
  assert(session.closed);
}

void TestLoaderErrorsNeverConnect() {
  const auto dir = UpgradersDir("bad_layout");
  fs::create_directories(dir / "nested");

  MemorySession session;
  bool          threw = false;
  try {
    RunTask(RunUpgrade(session, dir, OptionsBuilder().Build()));
  } catch (const upgrader::util::DirectoryLayoutError&) {
    threw = true;
  }
  assert(threw);
  assert(!session.IsOpen());
  assert(session.statements.empty());
}

void TestInvalidOptionsNeverConnect() {
  const auto    dir = UpgradersDir("bad_options");
  MemorySession session;
  bool          threw = false;
  try {
    RunTask(RunUpgrade(session, dir, OptionsBuilder().CreateSchema(true).Build()));
  } catch (const upgrader::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
  assert(session.statements.empty());
}

void TestConnectionFailureIsConnectionError() {
  const auto    dir = UpgradersDir("no_connect");
  MemorySession session;
  session.fail_connect = true;

  bool threw = false;
  try {
    RunTask(RunUpgrade(session, dir, OptionsBuilder().Build()));
  } catch (const upgrader::util::ConnectionError&) {
    threw = true;
  }
  assert(threw);
}

void TestRequiredTlsIsEnforced() {
  const auto    dir = UpgradersDir("tls");
  MemorySession plain;

  bool threw = false;
  try {
    RunTask(RunUpgrade(plain, dir, OptionsBuilder().Ssl(SslMode::kRequire).Build()));
  } catch (const upgrader::util::ConnectionError&) {
    threw = true;
  }
  assert(threw);
  assert(plain.ledger.empty());
  assert(plain.closed);

  MemorySession encrypted;
  encrypted.tls = true;
  assert(RunTask(RunUpgrade(encrypted, dir, OptionsBuilder().Ssl(SslMode::kRequire).Build())).applied == 3);
}

void TestSchemaMustExistUnlessCreationAllowed() {
  const auto    dir = UpgradersDir("schema");
  MemorySession session;

  bool threw = false;
  try {
    RunTask(RunUpgrade(session, dir, OptionsBuilder().Schema("tenant").Build()));
  } catch (const upgrader::util::SchemaCreationError&) {
    threw = true;
  }
  assert(threw);
  assert(!session.ledger_created);
  assert(!session.lock_held);

  MemorySession creating;
  const auto    report = RunTask(RunUpgrade(creating, dir, OptionsBuilder().Schema("tenant").CreateSchema(true).Build()));
  assert(report.applied == 3);
  assert(creating.schemas.count("tenant") == 1);
  assert(creating.search_path == "tenant");
}

void TestMidRunFailureKeepsEarlierSteps() {
  const auto    dir = UpgradersDir("mid_run");
  MemorySession session;
  session.fail_on = "orders";

  bool threw = false;
  try {
    RunTask(RunUpgrade(session, dir, OptionsBuilder().Build()));
  } catch (const upgrader::util::SqlExecutionError& e) {
    threw = true;
    assert(e.Step() && *e.Step() == (StepKey{1, 0}));
  }
  assert(threw);
  assert(session.ledger.size() == 2);
  assert(!session.lock_held);
  assert(session.closed);

  session.fail_on.clear();
  const auto report = RunTask(RunUpgrade(session, dir, OptionsBuilder().Build()));
  assert(report.already_applied == 2);
  assert(report.applied == 1);
}

void TestCheckConnection() {
  MemorySession ok;
  RunTask(RunCheckConnection(ok, SslMode::kDisable));
  assert(ok.closed);

  MemorySession down;
  down.fail_connect = true;
  bool threw        = false;
  try {
    RunTask(RunCheckConnection(down, SslMode::kDisable));
  } catch (const upgrader::util::ConnectionError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFreshDatabaseGetsEverything();
  TestSecondRunIsNoOp();
  TestNewStepsAreAppliedIncrementally();
  TestTamperedHistoryStopsBeforeApplying();
  TestLoaderErrorsNeverConnect();
  TestInvalidOptionsNeverConnect();
  TestConnectionFailureIsConnectionError();
  TestRequiredTlsIsEnforced();
  TestSchemaMustExistUnlessCreationAllowed();
  TestMidRunFailureKeepsEarlierSteps();
  TestCheckConnection();

  std::cout << "pg_schema_upgrader_unit_upgrader: pass\n";
  return 0;
}
