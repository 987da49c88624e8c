#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace upgrader::db::sql {

/*
  Parameter abstraction.

  Postgres placeholders: $1 $2 $3, bound in order.
  Both sessions send parameters in text format; add explicit casts
  ($1::int) where the server cannot infer the type.
*/

using Param = std::variant<
    std::nullptr_t,
    int32_t,
    int64_t,
    std::string
>;

using Params = std::vector<Param>;

inline bool IsNull(const Param& p) {
  return std::holds_alternative<std::nullptr_t>(p);
}

// Text form sent on the wire. Meaningless for NULL.
inline std::string ToText(const Param& p) {
  struct Visitor {
    std::string operator()(std::nullptr_t) const { return {}; }
    std::string operator()(int32_t v) const { return std::to_string(v); }
    std::string operator()(int64_t v) const { return std::to_string(v); }
    std::string operator()(const std::string& v) const { return v; }
  };
  return std::visit(Visitor{}, p);
}

}
