#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace upgrader::core {

enum class SslMode {
  kDisable,  // never attempt TLS
  kRequire,  // fail the connect if TLS cannot be negotiated
};

/*
  Options of one upgrade run. Plain value, fixed for the whole run.

  schema         target schema; the ledger lives there and it becomes
                 the session search_path. Unset = default search path.
  create_schema  create the schema when missing instead of failing.
  ssl_mode       transport security for the connection.
*/
struct Options {
  std::optional<std::string> schema;
  bool                       create_schema = false;
  SslMode                    ssl_mode      = SslMode::kDisable;

  // Replaces every {{SCHEMA}} in step SQL with the configured schema.
  // Text is returned unchanged when no schema is set.
  std::string ApplySchemaSubstitution(std::string_view sql) const;
};

// Fluent assembly of Options:
//   auto options = OptionsBuilder().Schema("app").CreateSchema(true).Build();
class OptionsBuilder {
 public:
  OptionsBuilder& Schema(std::string schema) {
    options_.schema = std::move(schema);
    return *this;
  }

  OptionsBuilder& CreateSchema(bool create) {
    options_.create_schema = create;
    return *this;
  }

  OptionsBuilder& Ssl(SslMode mode) {
    options_.ssl_mode = mode;
    return *this;
  }

  Options Build() const {
    return options_;
  }

 private:
  Options options_;
};

// ConfigurationError for combinations that cannot run (create_schema
// without a schema, empty schema name).
void ValidateOptions(const Options& options);

} // namespace upgrader::core
