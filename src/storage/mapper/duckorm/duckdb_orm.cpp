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

#include "storage/mapper/duckorm/duckdb_orm.hpp"

#include <duckdb.h>

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace duckorm {
namespace {
void BindFields(PreparedStatement& pre, const void* obj, std::span<const DuckFieldDesc> fields,
                size_t field_count) {
  for (size_t i = 0; i < field_count; ++i) {
    const DuckFieldDesc& field = fields[i];
    const char*          ptr   = reinterpret_cast<const char*>(obj) + field.offset;
    duckdb_state         state = DuckDBSuccess;
    switch (field.type) {
      case DuckDBType::INT32:
        state = duckdb_bind_int32(pre._stmt, i + 1, *reinterpret_cast<const int32_t*>(ptr));
        break;
      case DuckDBType::INT64:
        state = duckdb_bind_int64(pre._stmt, i + 1, *reinterpret_cast<const int64_t*>(ptr));
        break;
      case DuckDBType::UINT32:
        state = duckdb_bind_uint32(pre._stmt, i + 1, *reinterpret_cast<const uint32_t*>(ptr));
        break;
      case DuckDBType::UINT64:
        state = duckdb_bind_uint64(pre._stmt, i + 1, *reinterpret_cast<const uint64_t*>(ptr));
        break;
      case DuckDBType::DOUBLE:
        state = duckdb_bind_double(pre._stmt, i + 1, *reinterpret_cast<const double*>(ptr));
        break;
      case DuckDBType::TIMESTAMP:
      case DuckDBType::JSON:
      case DuckDBType::VARCHAR: {
        auto member_ptr = reinterpret_cast<const std::unique_ptr<std::string>*>(ptr);
        if (*member_ptr) {
          state = duckdb_bind_varchar(pre._stmt, i + 1, member_ptr->get()->c_str());
        } else {
          state = duckdb_bind_null(pre._stmt, i + 1);
        }
        break;
      }
      case DuckDBType::BOOLEAN:
        state = duckdb_bind_boolean(pre._stmt, i + 1, *reinterpret_cast<const bool*>(ptr));
        break;
      default:
        throw std::runtime_error("Unsupported DuckFieldType in BindFields()");
    }
    if (state != DuckDBSuccess) {
      throw std::runtime_error(std::string("Failed to bind field ") + field.name);
    }
  }
}

auto ReadRows(duckdb_result& result, std::span<const DuckFieldDesc> sample_fields,
              size_t field_count) -> std::vector<std::vector<VarTypes>> {
  std::vector<std::vector<VarTypes>> results;
  if (duckdb_column_count(&result) != field_count) {
    throw std::runtime_error("Column count mismatch in select query");
  }

  idx_t row_count = duckdb_row_count(&result);
  results.resize(row_count);
  for (idx_t i = 0; i < row_count; ++i) {
    results[i].resize(field_count);
    for (size_t j = 0; j < field_count; ++j) {
      switch (sample_fields[j].type) {
        case DuckDBType::INT32:
          results[i][j] = duckdb_value_int32(&result, j, i);
          break;
        case DuckDBType::INT64:
          results[i][j] = duckdb_value_int64(&result, j, i);
          break;
        case DuckDBType::UINT32:
          results[i][j] = duckdb_value_uint32(&result, j, i);
          break;
        case DuckDBType::UINT64:
          results[i][j] = duckdb_value_uint64(&result, j, i);
          break;
        case DuckDBType::DOUBLE:
          results[i][j] = duckdb_value_double(&result, j, i);
          break;
        case DuckDBType::BOOLEAN:
          results[i][j] = duckdb_value_boolean(&result, j, i);
          break;
        case DuckDBType::VARCHAR:
        case DuckDBType::JSON:
        case DuckDBType::TIMESTAMP: {
          if (duckdb_value_is_null(&result, j, i)) {
            results[i][j] = std::make_unique<std::string>();
            break;
          }
          char* value   = duckdb_value_varchar(&result, j, i);
          results[i][j] = std::make_unique<std::string>(value ? value : "");
          duckdb_free(value);
          break;
        }
        default:
          throw std::runtime_error("Unsupported DuckFieldType in select()");
      }
    }
  }
  return results;
}
};  // namespace

duckdb_state insert(duckdb_connection& conn, const char* table, const void* obj,
                    std::span<const DuckFieldDesc> fields, size_t field_count) {
  std::ostringstream sql;
  sql << "INSERT INTO " << table << " (";
  for (size_t i = 0; i < field_count; ++i) {
    sql << fields[i].name;
    if (i < field_count - 1) {
      sql << ", ";
    }
  }
  sql << ") VALUES (";
  for (size_t i = 0; i < field_count; ++i) {
    sql << "?";
    if (i < field_count - 1) {
      sql << ", ";
    }
  }
  sql << ");";

  PreparedStatement insert_pre(conn, sql.str());
  BindFields(insert_pre, obj, fields, field_count);
  insert_pre.Execute();
  return DuckDBSuccess;
}

idx_t update(duckdb_connection& conn, const char* table, const void* obj,
             std::span<const DuckFieldDesc> fields, size_t field_count, const char* where_clause) {
  std::ostringstream sql;
  sql << "UPDATE " << table << " SET ";
  for (size_t i = 0; i < field_count; ++i) {
    sql << fields[i].name << " = ?";
    if (i < field_count - 1) {
      sql << ", ";
    }
  }
  sql << " WHERE " << where_clause << ";";

  PreparedStatement update_pre(conn, sql.str());
  BindFields(update_pre, obj, fields, field_count);
  update_pre.Execute();
  return update_pre.RowsChanged();
}

idx_t remove(duckdb_connection& conn, const char* table, const char* where_clause) {
  std::ostringstream sql;
  sql << "DELETE FROM " << table << " WHERE " << where_clause << ";";

  PreparedStatement delete_pre(conn, sql.str());
  delete_pre.Execute();
  return delete_pre.RowsChanged();
}

std::vector<std::vector<VarTypes>> select(duckdb_connection& conn, const std::string table,
                                          std::span<const DuckFieldDesc> sample_fields,
                                          size_t field_count, const char* where_clause) {
  std::ostringstream sql;
  sql << "SELECT ";
  for (size_t i = 0; i < field_count; ++i) {
    sql << sample_fields[i].name;
    if (i < field_count - 1) {
      sql << ", ";
    }
  }
  sql << " FROM " << table << " WHERE " << where_clause << ";";

  PreparedStatement select_pre(conn, sql.str());
  select_pre.Execute();
  return ReadRows(select_pre._result, sample_fields, field_count);
}

std::vector<std::vector<VarTypes>> select_by_query(duckdb_connection&             conn,
                                                   std::span<const DuckFieldDesc> sample_fields,
                                                   size_t field_count, const std::string& sql) {
  PreparedStatement select_pre(conn, sql);
  select_pre.Execute();
  return ReadRows(select_pre._result, sample_fields, field_count);
}

void execute(duckdb_connection& conn, const std::string& sql) {
  duckdb_result result;
  if (duckdb_query(conn, sql.c_str(), &result) != DuckDBSuccess) {
    const char* err = duckdb_result_error(&result);
    std::string msg = err ? err : "Unknown DuckDB error";
    duckdb_destroy_result(&result);
    throw std::runtime_error(msg);
  }
  duckdb_destroy_result(&result);
}

uint64_t scalar_uint64(duckdb_connection& conn, const std::string& sql) {
  PreparedStatement count_pre(conn, sql);
  count_pre.Execute();
  if (duckdb_row_count(&count_pre._result) == 0 ||
      duckdb_value_is_null(&count_pre._result, 0, 0)) {
    return 0;
  }
  return duckdb_value_uint64(&count_pre._result, 0, 0);
}
};  // namespace duckorm
