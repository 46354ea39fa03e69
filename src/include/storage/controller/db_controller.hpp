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

#include "storage/controller/controller_types.hpp"
#include "type/type.hpp"

namespace arcvault {
class DBController {
 private:
  duckdb_database              _db = nullptr;

  file_path_t                  _db_path;

  // Ids are unique per table; uniqueness is enforced by CatalogController rather than an index so
  // that whole-row updates inside one transaction do not trip DuckDB's index constraint checks.
  constexpr static const char* init_table_query =
      "CREATE TABLE IF NOT EXISTS Card (id TEXT NOT NULL, file_name TEXT, file_path TEXT, type "
      "UINTEGER, format TEXT, file_size UBIGINT, date_added TEXT, date_modified TEXT, preview "
      "TEXT, tags TEXT, collections TEXT, in_moodboard BOOLEAN, metadata TEXT);"
      "CREATE TABLE IF NOT EXISTS Tag (id TEXT NOT NULL, name TEXT, category_id TEXT, card_count "
      "UBIGINT, date_created TEXT, metadata TEXT);"
      "CREATE TABLE IF NOT EXISTS Category (id TEXT NOT NULL, name TEXT, date_created TEXT, "
      "tag_ids TEXT, metadata TEXT);"
      "CREATE TABLE IF NOT EXISTS Collection (id TEXT NOT NULL, name TEXT, date_created TEXT, "
      "date_modified TEXT, card_ids TEXT, metadata TEXT);"
      "CREATE TABLE IF NOT EXISTS Moodboard (id TEXT NOT NULL, card_ids TEXT, date_modified "
      "TEXT);"
      "CREATE TABLE IF NOT EXISTS PreviewCache (card_id TEXT NOT NULL, preview_path TEXT, "
      "date_created TEXT);";

 public:
  explicit DBController(const file_path_t& db_path);
  DBController(const DBController&)            = delete;
  DBController& operator=(const DBController&) = delete;
  ~DBController();

  void InitializeDB();

  auto GetConnectionGuard() -> ConnectionGuard;
  auto GetDBPath() const -> const file_path_t& { return _db_path; }
};
};  // namespace arcvault
