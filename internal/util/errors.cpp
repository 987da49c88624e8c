#include "errors.hpp"

namespace upgrader::util {

const char* ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::DirectoryLayout:
      return "DirectoryLayoutError";
    case ErrorKind::FileNaming:
      return "FileNamingError";
    case ErrorKind::FileSequence:
      return "FileSequenceError";
    case ErrorKind::StepHeader:
      return "StepHeaderError";
    case ErrorKind::StepSequence:
      return "StepSequenceError";
    case ErrorKind::TamperDetected:
      return "TamperDetectedError";
    case ErrorKind::HistoryContinuity:
      return "HistoryContinuityError";
    case ErrorKind::Connection:
      return "ConnectionError";
    case ErrorKind::SchemaCreation:
      return "SchemaCreationError";
    case ErrorKind::SqlExecution:
      return "SqlExecutionError";
    case ErrorKind::LedgerWrite:
      return "LedgerWriteError";
    case ErrorKind::Configuration:
      return "ConfigurationError";
  }
  return "UpgraderError";
}

} // namespace upgrader::util
