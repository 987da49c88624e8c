#pragma once

#include <filesystem>
#include <string>

#include "config/config.pb.h"
#include "internal/core/options.hpp"
#include "internal/db/postgres/conninfo.hpp"
#include "internal/factory.hpp"

namespace upgrader::cli {

enum class Command {
  kUpgrade,
  kCheckConnection,
  kHelp,
};

struct Invocation {
  Command     command = Command::kHelp;
  std::string config_path;

  // Values given on the command line, merged over the config file.
  upgrader::runtime::config::RuntimeConfig overrides;
};

// ConfigurationError on unknown commands, unknown flags or missing values.
Invocation ParseCommandLine(int argc, const char* const* argv);

std::string Usage();

// DATABASE_URL fills the connection when neither a connection string nor
// a host is configured; PGPASSWORD fills an empty password.
void ApplyEnvironment(upgrader::runtime::config::RuntimeConfig& config);

db::postgres::ConnectionTarget ResolveTarget(const upgrader::runtime::config::RuntimeConfig& config);
core::Options                  ResolveOptions(const upgrader::runtime::config::RuntimeConfig& config);
factory::Strategy              ResolveStrategy(const upgrader::runtime::config::RuntimeConfig& config);

// ConfigurationError when no path is configured.
std::filesystem::path ResolvePath(const upgrader::runtime::config::RuntimeConfig& config);

} // namespace upgrader::cli
