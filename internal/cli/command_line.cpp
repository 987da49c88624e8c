#include "command_line.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <string_view>

#include "internal/util/errors.hpp"

namespace upgrader::cli {

namespace cfg = upgrader::runtime::config;

namespace {

class ArgCursor {
 public:
  ArgCursor(int argc, const char* const* argv) : argc_(argc), argv_(argv) {
  }

  bool Done() const {
    return index_ >= argc_;
  }

  std::string_view Next() {
    return argv_[index_++];
  }

  std::string Value(std::string_view flag) {
    if (Done()) {
      throw util::ConfigurationError("Missing value for " + std::string(flag));
    }
    return std::string(Next());
  }

 private:
  int                argc_;
  const char* const* argv_;
  int                index_ = 1;
};

std::uint32_t ParsePort(const std::string& text) {
  unsigned int port = 0;
  auto [ptr, ec]    = std::from_chars(text.data(), text.data() + text.size(), port);
  if (ec != std::errc() || ptr != text.data() + text.size() || port == 0 || port > std::numeric_limits<std::uint16_t>::max()) {
    throw util::ConfigurationError("Invalid port: " + text);
  }
  return port;
}

} // namespace

std::string Usage() {
  return "Usage:\n"
         "  pg-schema-upgrader upgrade [--config FILE] [--path DIR]\n"
         "                             [--connection-string S | --host H --port P --user U --password W --database D]\n"
         "                             [--schema S] [--create-schema] [--tls] [--blocking]\n"
         "  pg-schema-upgrader check-connection [--config FILE] [connection flags] [--tls] [--blocking]\n"
         "\n"
         "Environment:\n"
         "  DATABASE_URL   connection string used when none is configured\n"
         "  PGPASSWORD     password used when none is configured\n";
}

Invocation ParseCommandLine(int argc, const char* const* argv) {
  Invocation invocation;
  if (argc < 2) {
    return invocation;
  }

  const std::string_view command = argv[1];
  if (command == "upgrade") {
    invocation.command = Command::kUpgrade;
  } else if (command == "check-connection") {
    invocation.command = Command::kCheckConnection;
  } else if (command == "help" || command == "--help" || command == "-h") {
    return invocation;
  } else {
    throw util::ConfigurationError("Unknown command: " + std::string(command));
  }

  auto* database = invocation.overrides.mutable_database();
  auto* upgrade  = invocation.overrides.mutable_upgrade();

  ArgCursor args(argc - 1, argv + 1);
  while (!args.Done()) {
    const auto flag = args.Next();

    if (flag == "--config") {
      invocation.config_path = args.Value(flag);
    } else if (flag == "--connection-string") {
      database->set_connection_string(args.Value(flag));
    } else if (flag == "--host") {
      database->set_host(args.Value(flag));
    } else if (flag == "--port") {
      database->set_port(ParsePort(args.Value(flag)));
    } else if (flag == "--user") {
      database->set_user(args.Value(flag));
    } else if (flag == "--password") {
      database->set_password(args.Value(flag));
    } else if (flag == "--database") {
      database->set_dbname(args.Value(flag));
    } else if (flag == "--tls") {
      database->set_tls(cfg::TLS_MODE_REQUIRE);
    } else if (flag == "--blocking") {
      upgrade->set_strategy(cfg::EXECUTION_STRATEGY_BLOCKING);
    } else if (flag == "--path" && invocation.command == Command::kUpgrade) {
      upgrade->set_path(args.Value(flag));
    } else if (flag == "--schema" && invocation.command == Command::kUpgrade) {
      upgrade->set_schema(args.Value(flag));
    } else if (flag == "--create-schema" && invocation.command == Command::kUpgrade) {
      upgrade->set_create_schema(true);
    } else if (flag == "--help" || flag == "-h") {
      invocation.command = Command::kHelp;
      return invocation;
    } else {
      throw util::ConfigurationError("Unknown option for " + std::string(command) + ": " + std::string(flag));
    }
  }

  return invocation;
}

void ApplyEnvironment(cfg::RuntimeConfig& config) {
  auto* database = config.mutable_database();

  if (database->connection_string().empty() && database->host().empty()) {
    if (const char* url = std::getenv("DATABASE_URL")) {
      database->set_connection_string(url);
    }
  }
  if (database->connection_string().empty() && database->password().empty()) {
    if (const char* password = std::getenv("PGPASSWORD")) {
      database->set_password(password);
    }
  }
}

db::postgres::ConnectionTarget ResolveTarget(const cfg::RuntimeConfig& config) {
  const auto& database = config.database();

  db::postgres::ConnectionTarget target;
  if (!database.connection_string().empty()) {
    target.connection_string = database.connection_string();
    return target;
  }

  target.host     = database.host();
  target.user     = database.user();
  target.password = database.password();
  target.dbname   = database.dbname();
  if (database.port() != 0) {
    if (database.port() > std::numeric_limits<std::uint16_t>::max()) {
      throw util::ConfigurationError("Invalid port: " + std::to_string(database.port()));
    }
    target.port = static_cast<std::uint16_t>(database.port());
  }
  return target;
}

core::Options ResolveOptions(const cfg::RuntimeConfig& config) {
  core::OptionsBuilder builder;
  if (!config.upgrade().schema().empty()) {
    builder.Schema(config.upgrade().schema());
  }
  builder.CreateSchema(config.upgrade().create_schema());
  builder.Ssl(config.database().tls() == cfg::TLS_MODE_REQUIRE ? core::SslMode::kRequire : core::SslMode::kDisable);
  return builder.Build();
}

factory::Strategy ResolveStrategy(const cfg::RuntimeConfig& config) {
  return config.upgrade().strategy() == cfg::EXECUTION_STRATEGY_BLOCKING ? factory::Strategy::kBlocking
                                                                          : factory::Strategy::kCooperative;
}

std::filesystem::path ResolvePath(const cfg::RuntimeConfig& config) {
  if (config.upgrade().path().empty()) {
    throw util::ConfigurationError("No upgraders directory given (--path or upgrade.path)");
  }
  return config.upgrade().path();
}

} // namespace upgrader::cli
