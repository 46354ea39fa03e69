//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <duckdb.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace duckorm {
enum class DuckDBType : uint8_t {
  INT32,
  INT64,
  UINT32,
  UINT64,
  DOUBLE,
  VARCHAR,
  JSON,
  BOOLEAN,
  TIMESTAMP,
};

/**
 * @brief Owns one prepared statement and its result. Both are destroyed with the guard.
 */
class PreparedStatement {
 private:
  void RecycleResources();

 public:
  duckdb_result             _result;
  duckdb_prepared_statement _stmt = nullptr;
  duckdb_connection&        _con;

  bool                      _prepared = false;
  explicit PreparedStatement(duckdb_connection& con);
  PreparedStatement(duckdb_connection& con, const std::string& prepare_query);
  ~PreparedStatement();

  PreparedStatement(const PreparedStatement&)            = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;

  auto GetStmtGuard(const std::string& prepare_query) -> duckdb_prepared_statement&;
  /**
   * @brief Run the prepared statement, throwing with DuckDB's message on failure
   */
  void Execute();
  auto RowsChanged() -> idx_t;
};

struct DuckFieldDesc {
  const char* name;
  DuckDBType  type;
  size_t      offset;
};

#define FIELD(type, field, field_type) \
  duckorm::DuckFieldDesc { #field, duckorm::DuckDBType::field_type, offsetof(type, field) }

using VarTypes = std::variant<int32_t, int64_t, uint32_t, uint64_t, double, bool,
                              std::unique_ptr<std::string>>;

/**
 * @brief Move the idx-th column of a selected row out as T
 */
template <typename T>
auto TakeValue(std::vector<VarTypes>& row, size_t idx) -> T {
  auto* value = std::get_if<T>(&row.at(idx));
  if (value == nullptr) {
    throw std::runtime_error("Encountering unmatching types when parsing the data from the DB");
  }
  return std::move(*value);
}

/**
 * @brief Render a string as a single-quoted SQL literal
 */
auto Quote(const std::string& value) -> std::string;
};  // namespace duckorm
