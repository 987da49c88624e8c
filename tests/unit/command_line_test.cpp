#include "internal/cli/command_line.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "internal/cli/exit_status.hpp"
#include "internal/util/errors.hpp"

namespace {

using upgrader::cli::Command;
using upgrader::cli::ParseCommandLine;

upgrader::cli::Invocation Parse(std::vector<const char*> args) {
  args.insert(args.begin(), "pg-schema-upgrader");
  return ParseCommandLine(static_cast<int>(args.size()), args.data());
}

bool ParseFails(std::vector<const char*> args) {
  try {
    Parse(std::move(args));
  } catch (const upgrader::util::ConfigurationError&) {
    return true;
  }
  return false;
}

void TestUpgradeFlags() {
  const auto invocation = Parse({"upgrade", "--config", "c.yaml", "--path", "./upgraders", "--host", "h", "--port", "6000", "--user", "u",
                                 "--password", "p", "--database", "d", "--schema", "s", "--create-schema", "--tls", "--blocking"});
  assert(invocation.command == Command::kUpgrade);
  assert(invocation.config_path == "c.yaml");

  const auto& o = invocation.overrides;
  assert(o.upgrade().path() == "./upgraders");
  assert(o.database().port() == 6000);
  assert(o.upgrade().create_schema());

  const auto target = upgrader::cli::ResolveTarget(o);
  assert(!target.connection_string);
  assert(target.host == "h" && target.port == 6000 && target.user == "u" && target.password == "p" && target.dbname == "d");

  const auto options = upgrader::cli::ResolveOptions(o);
  assert(options.schema == std::string("s"));
  assert(options.create_schema);
  assert(options.ssl_mode == upgrader::core::SslMode::kRequire);
  assert(upgrader::cli::ResolveStrategy(o) == upgrader::factory::Strategy::kBlocking);
}

void TestDefaultsAreCooperativeWithoutTls() {
  const auto invocation = Parse({"check-connection", "--connection-string", "postgres://localhost/app"});
  assert(invocation.command == Command::kCheckConnection);

  const auto target = upgrader::cli::ResolveTarget(invocation.overrides);
  assert(target.connection_string == std::string("postgres://localhost/app"));

  const auto options = upgrader::cli::ResolveOptions(invocation.overrides);
  assert(!options.schema);
  assert(options.ssl_mode == upgrader::core::SslMode::kDisable);
  assert(upgrader::cli::ResolveStrategy(invocation.overrides) == upgrader::factory::Strategy::kCooperative);
}

void TestRejectsBadInput() {
  assert(ParseFails({"migrate"}));
  assert(ParseFails({"upgrade", "--bogus"}));
  assert(ParseFails({"upgrade", "--path"}));
  assert(ParseFails({"upgrade", "--port", "70000"}));
  assert(ParseFails({"upgrade", "--port", "abc"}));
  assert(ParseFails({"check-connection", "--schema", "s"}));

  assert(Parse({}).command == Command::kHelp);
  assert(Parse({"upgrade", "--help"}).command == Command::kHelp);
}

void TestPathIsRequiredForUpgrade() {
  bool threw = false;
  try {
    upgrader::cli::ResolvePath(Parse({"upgrade"}).overrides);
  } catch (const upgrader::util::ConfigurationError& e) {
    threw = true;
    assert(upgrader::cli::ExitCodeFor(e) == upgrader::cli::kExitUsage);
  }
  assert(threw);
}

void TestEnvironmentDefaults() {
  setenv("DATABASE_URL", "postgres://env/app", 1);
  setenv("PGPASSWORD", "from-env", 1);

  upgrader::runtime::config::RuntimeConfig url_config;
  upgrader::cli::ApplyEnvironment(url_config);
  assert(url_config.database().connection_string() == "postgres://env/app");

  upgrader::runtime::config::RuntimeConfig host_config;
  host_config.mutable_database()->set_host("explicit");
  upgrader::cli::ApplyEnvironment(host_config);
  assert(host_config.database().connection_string().empty());
  assert(host_config.database().password() == "from-env");

  upgrader::runtime::config::RuntimeConfig with_password;
  with_password.mutable_database()->set_host("explicit");
  with_password.mutable_database()->set_password("given");
  upgrader::cli::ApplyEnvironment(with_password);
  assert(with_password.database().password() == "given");

  unsetenv("DATABASE_URL");
  unsetenv("PGPASSWORD");
}

void TestMergeLetsFlagsOverrideFile() {
  upgrader::runtime::config::RuntimeConfig file;
  file.mutable_database()->set_host("from-file");
  file.mutable_database()->set_user("file-user");
  file.mutable_upgrade()->set_path("/file/path");

  file.MergeFrom(Parse({"upgrade", "--host", "from-flag"}).overrides);
  assert(file.database().host() == "from-flag");
  assert(file.database().user() == "file-user");
  assert(file.upgrade().path() == "/file/path");
}

} // namespace

int main() {
  TestUpgradeFlags();
  TestDefaultsAreCooperativeWithoutTls();
  TestRejectsBadInput();
  TestPathIsRequiredForUpgrade();
  TestEnvironmentDefaults();
  TestMergeLetsFlagsOverrideFile();

  std::cout << "pg_schema_upgrader_unit_command_line: pass\n";
  return 0;
}
