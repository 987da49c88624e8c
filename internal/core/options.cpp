#include "options.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace upgrader::core {

std::string Options::ApplySchemaSubstitution(std::string_view sql) const {
  if (!schema) {
    return std::string(sql);
  }
  return util::ReplaceAll(sql, "{{SCHEMA}}", *schema);
}

void ValidateOptions(const Options& options) {
  if (options.schema && options.schema->empty()) {
    throw util::ConfigurationError("schema name must not be empty");
  }
  if (options.create_schema && !options.schema) {
    throw util::ConfigurationError("create_schema is enabled but no schema name is provided");
  }
}

} // namespace upgrader::core
