#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace upgrader::db::sql {

/*
  Materialized query result.

  Sessions copy driver rows into this (text format) so pqxx::result and
  PGresult never leak into ledger or engine code.
*/

class Row {
public:
  explicit Row(std::vector<std::optional<std::string>> fields) : fields_(std::move(fields)) {}

  std::size_t Size() const { return fields_.size(); }

  bool IsNull(std::size_t col) const { return !At(col).has_value(); }

  std::string GetText(std::size_t col) const { return At(col).value_or(std::string{}); }

  int32_t GetInt(std::size_t col) const { return static_cast<int32_t>(GetInt64(col)); }

  int64_t GetInt64(std::size_t col) const {
    const auto& v = At(col);
    if (!v) throw std::invalid_argument("NULL in integer column " + std::to_string(col));
    return std::stoll(*v);
  }

  uint64_t GetU64(std::size_t col) const {
    return static_cast<uint64_t>(GetInt64(col));
  }

private:
  const std::optional<std::string>& At(std::size_t col) const {
    if (col >= fields_.size()) throw std::out_of_range("column " + std::to_string(col) + " out of range");
    return fields_[col];
  }

  std::vector<std::optional<std::string>> fields_;
};

using Rows = std::vector<Row>;

}
