#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "pg_schema_upgrader_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  host: db.internal
  port: 6543
  user: migrator
  password: "1234"
  dbname: app
  tls: TLS_MODE_REQUIRE
upgrade:
  path: /srv/upgraders
  schema: tenant_a
  create_schema: true
  strategy: EXECUTION_STRATEGY_BLOCKING
logging:
  level: debug
)");

  auto config = upgrader::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().host() == "db.internal");
  assert(config.database().port() == 6543);
  assert(config.database().password() == "1234");
  assert(config.database().tls() == upgrader::runtime::config::TLS_MODE_REQUIRE);
  assert(config.upgrade().path() == "/srv/upgraders");
  assert(config.upgrade().schema() == "tenant_a");
  assert(config.upgrade().create_schema());
  assert(config.upgrade().strategy() == upgrader::runtime::config::EXECUTION_STRATEGY_BLOCKING);
  assert(config.logging().level() == "debug");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  connection_string: "host='C:\\pg\\\"quoted\"' dbname=app"
)");

  auto config = upgrader::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().connection_string() == "host='C:\\pg\\\"quoted\"' dbname=app");
}

void TestEmptyDocumentIsDefaultConfig() {
  auto config = upgrader::config::ConfigLoader::LoadFromYamlString("");
  assert(config.database().host().empty());
  assert(!config.upgrade().create_schema());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  host: localhost
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)upgrader::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const upgrader::util::ConfigurationError&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsConfigurationError() {
  bool threw = false;
  try {
    (void)upgrader::config::ConfigLoader::LoadFromYaml("/nonexistent/pg-schema-upgrader.yaml");
  } catch (const upgrader::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigLoads();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestEmptyDocumentIsDefaultConfig();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsConfigurationError();

  std::cout << "pg_schema_upgrader_unit_config_loader: pass\n";
  return 0;
}
