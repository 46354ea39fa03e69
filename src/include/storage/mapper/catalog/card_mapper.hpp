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

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"
#include "type/type.hpp"

namespace arcvault {
// CREATE TABLE Card (id TEXT, file_name TEXT, file_path TEXT, type UINTEGER, format TEXT,
// file_size UBIGINT, date_added TEXT, date_modified TEXT, preview TEXT, tags TEXT, collections
// TEXT, in_moodboard BOOLEAN, metadata TEXT);
struct CardMapperParams {
  std::unique_ptr<std::string> id;
  std::unique_ptr<std::string> file_name;
  std::unique_ptr<std::string> file_path;
  uint32_t                     type;
  std::unique_ptr<std::string> format;
  uint64_t                     file_size;
  std::unique_ptr<std::string> date_added;
  std::unique_ptr<std::string> date_modified;
  std::unique_ptr<std::string> preview;
  // JSON arrays of ids
  std::unique_ptr<std::string> tags;
  std::unique_ptr<std::string> collections;
  bool                         in_moodboard;
  // JSON object with width, height, duration and description
  std::unique_ptr<std::string> metadata;
};

class CardMapper : public MapperInterface<CardMapper, CardMapperParams, card_id_t>,
                   public FieldReflectable<CardMapper> {
 private:
  static constexpr uint32_t                                         _field_count      = 13;
  static constexpr const char*                                      _table_name       = "Card";
  static constexpr const char*                                      _prime_key_clause = "id={}";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      FIELD(CardMapperParams, id, VARCHAR),
      FIELD(CardMapperParams, file_name, VARCHAR),
      FIELD(CardMapperParams, file_path, VARCHAR),
      FIELD(CardMapperParams, type, UINT32),
      FIELD(CardMapperParams, format, VARCHAR),
      FIELD(CardMapperParams, file_size, UINT64),
      FIELD(CardMapperParams, date_added, TIMESTAMP),
      FIELD(CardMapperParams, date_modified, TIMESTAMP),
      FIELD(CardMapperParams, preview, VARCHAR),
      FIELD(CardMapperParams, tags, JSON),
      FIELD(CardMapperParams, collections, JSON),
      FIELD(CardMapperParams, in_moodboard, BOOLEAN),
      FIELD(CardMapperParams, metadata, JSON)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> CardMapperParams;
  friend struct FieldReflectable<CardMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace arcvault
