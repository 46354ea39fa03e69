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

#include "storage/controller/db_controller.hpp"

#include <duckdb.h>

#include <filesystem>
#include <stdexcept>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "utils/log/logger.hpp"

namespace arcvault {
/**
 * @brief Construct a new DBController::DBController object
 *
 * @param db_path
 */
DBController::DBController(const file_path_t& db_path) : _db_path(db_path) {
  InitializeDB();
}

/**
 * @brief Destroy the DBController::DBController object
 *
 */
DBController::~DBController() {
  if (_db) duckdb_close(&_db);
}

/**
 * @brief Get a connection guard for the database.
 *
 * @return ConnectionGuard
 */
auto DBController::GetConnectionGuard() -> ConnectionGuard {
  ConnectionGuard guard{nullptr};

  if (duckdb_connect(_db, &guard._conn) != DuckDBSuccess) {
    throw std::runtime_error("DB cannot be connected: " + _db_path.string());
  }

  return guard;
}

/**
 * @brief Open the database file and create the catalog tables if they are missing.
 *
 */
void DBController::InitializeDB() {
  if (_db) return;
  if (_db_path.has_parent_path()) {
    std::filesystem::create_directories(_db_path.parent_path());
  }
  char* open_error = nullptr;
  if (duckdb_open_ext(_db_path.string().c_str(), &_db, nullptr, &open_error) != DuckDBSuccess) {
    std::string msg = "DB cannot be opened: " + _db_path.string();
    if (open_error) {
      msg += ": ";
      msg += open_error;
      duckdb_free(open_error);
    }
    throw std::runtime_error(msg);
  }

  auto guard = GetConnectionGuard();
  duckorm::execute(guard._conn, init_table_query);
  Logger::Storage()->debug("Catalog database ready at {}", _db_path.string());
}
};  // namespace arcvault
