#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "internal/model/step.hpp"

namespace upgrader::util {

/*
  Central error types.

  Every failure of an upgrade run surfaces as one of these. The CLI
  translates the kind into an exit code (see cli/exit_status.hpp).

  Step source errors (layout .. step sequence) are raised before any
  connection is made. Integrity errors are raised before the first step
  runs.
*/

enum class ErrorKind {
  DirectoryLayout,
  FileNaming,
  FileSequence,
  StepHeader,
  StepSequence,
  TamperDetected,
  HistoryContinuity,
  Connection,
  SchemaCreation,
  SqlExecution,
  LedgerWrite,
  Configuration,
};

const char* ToString(ErrorKind kind);

class UpgraderError : public std::runtime_error {
 public:
  UpgraderError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  UpgraderError(ErrorKind kind, const std::string& msg, model::StepKey key)
      : std::runtime_error(msg), kind_(kind), step_(key) {
  }

  ErrorKind Kind() const {
    return kind_;
  }

  // Offending step, when the failure is tied to one.
  const std::optional<model::StepKey>& Step() const {
    return step_;
  }

 private:
  ErrorKind                     kind_;
  std::optional<model::StepKey> step_;
};

class DirectoryLayoutError : public UpgraderError {
 public:
  explicit DirectoryLayoutError(const std::string& msg) : UpgraderError(ErrorKind::DirectoryLayout, msg) {
  }
};

class FileNamingError : public UpgraderError {
 public:
  explicit FileNamingError(const std::string& msg) : UpgraderError(ErrorKind::FileNaming, msg) {
  }
};

class FileSequenceError : public UpgraderError {
 public:
  explicit FileSequenceError(const std::string& msg) : UpgraderError(ErrorKind::FileSequence, msg) {
  }
};

class StepHeaderError : public UpgraderError {
 public:
  explicit StepHeaderError(const std::string& msg) : UpgraderError(ErrorKind::StepHeader, msg) {
  }
};

class StepSequenceError : public UpgraderError {
 public:
  explicit StepSequenceError(const std::string& msg) : UpgraderError(ErrorKind::StepSequence, msg) {
  }
};

class TamperDetectedError : public UpgraderError {
 public:
  TamperDetectedError(const std::string& msg, model::StepKey key) : UpgraderError(ErrorKind::TamperDetected, msg, key) {
  }
};

class HistoryContinuityError : public UpgraderError {
 public:
  explicit HistoryContinuityError(const std::string& msg) : UpgraderError(ErrorKind::HistoryContinuity, msg) {
  }
  HistoryContinuityError(const std::string& msg, model::StepKey key) : UpgraderError(ErrorKind::HistoryContinuity, msg, key) {
  }
};

class ConnectionError : public UpgraderError {
 public:
  explicit ConnectionError(const std::string& msg) : UpgraderError(ErrorKind::Connection, msg) {
  }
};

class SchemaCreationError : public UpgraderError {
 public:
  explicit SchemaCreationError(const std::string& msg) : UpgraderError(ErrorKind::SchemaCreation, msg) {
  }
};

class SqlExecutionError : public UpgraderError {
 public:
  SqlExecutionError(const std::string& msg, model::StepKey key) : UpgraderError(ErrorKind::SqlExecution, msg, key) {
  }
};

class LedgerWriteError : public UpgraderError {
 public:
  explicit LedgerWriteError(const std::string& msg) : UpgraderError(ErrorKind::LedgerWrite, msg) {
  }
  LedgerWriteError(const std::string& msg, model::StepKey key) : UpgraderError(ErrorKind::LedgerWrite, msg, key) {
  }
};

class ConfigurationError : public UpgraderError {
 public:
  explicit ConfigurationError(const std::string& msg) : UpgraderError(ErrorKind::Configuration, msg) {
  }
};

} // namespace upgrader::util
