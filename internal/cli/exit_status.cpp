#include "exit_status.hpp"

namespace upgrader::cli {

int ExitCodeFor(util::ErrorKind kind) {
  using util::ErrorKind;

  switch (kind) {
    case ErrorKind::Configuration:
      return kExitUsage;
    case ErrorKind::DirectoryLayout:
      return 10;
    case ErrorKind::FileNaming:
      return 11;
    case ErrorKind::FileSequence:
      return 12;
    case ErrorKind::StepHeader:
      return 13;
    case ErrorKind::StepSequence:
      return 14;
    case ErrorKind::TamperDetected:
      return 20;
    case ErrorKind::HistoryContinuity:
      return 21;
    case ErrorKind::Connection:
      return 30;
    case ErrorKind::SchemaCreation:
      return 31;
    case ErrorKind::SqlExecution:
      return 40;
    case ErrorKind::LedgerWrite:
      return 41;
  }
  return kExitUnexpected;
}

int ExitCodeFor(const std::exception& e) {
  if (const auto* error = dynamic_cast<const util::UpgraderError*>(&e)) {
    return ExitCodeFor(error->Kind());
  }
  return kExitUnexpected;
}

} // namespace upgrader::cli
