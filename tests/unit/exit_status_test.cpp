#include "internal/cli/exit_status.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <stdexcept>

namespace {

using upgrader::cli::ExitCodeFor;
using upgrader::util::ErrorKind;

void TestEveryKindHasDistinctNonZeroCode() {
  const ErrorKind kinds[] = {ErrorKind::DirectoryLayout,   ErrorKind::FileNaming,    ErrorKind::FileSequence,   ErrorKind::StepHeader,
                             ErrorKind::StepSequence,      ErrorKind::TamperDetected, ErrorKind::HistoryContinuity, ErrorKind::Connection,
                             ErrorKind::SchemaCreation,    ErrorKind::SqlExecution,  ErrorKind::LedgerWrite,    ErrorKind::Configuration};

  std::set<int> codes;
  for (auto kind : kinds) {
    const int code = ExitCodeFor(kind);
    assert(code != upgrader::cli::kExitOk);
    assert(code != upgrader::cli::kExitUnexpected);
    codes.insert(code);
  }
  assert(codes.size() == sizeof(kinds) / sizeof(kinds[0]));
}

void TestExceptionsMapThroughTheirKind() {
  assert(ExitCodeFor(upgrader::util::TamperDetectedError("changed", {0, 1})) == ExitCodeFor(ErrorKind::TamperDetected));
  assert(ExitCodeFor(upgrader::util::ConnectionError("refused")) == ExitCodeFor(ErrorKind::Connection));
  assert(ExitCodeFor(upgrader::util::ConfigurationError("bad")) == upgrader::cli::kExitUsage);
  assert(ExitCodeFor(std::runtime_error("boom")) == upgrader::cli::kExitUnexpected);
}

} // namespace

int main() {
  TestEveryKindHasDistinctNonZeroCode();
  TestExceptionsMapThroughTheirKind();

  std::cout << "pg_schema_upgrader_unit_exit_status: pass\n";
  return 0;
}
