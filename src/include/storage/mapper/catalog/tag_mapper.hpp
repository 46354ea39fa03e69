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
// CREATE TABLE Tag (id TEXT, name TEXT, category_id TEXT, card_count UBIGINT, date_created
// TEXT, metadata TEXT);
struct TagMapperParams {
  std::unique_ptr<std::string> id;
  std::unique_ptr<std::string> name;
  std::unique_ptr<std::string> category_id;
  uint64_t                     card_count;
  std::unique_ptr<std::string> date_created;
  // JSON object with color and description
  std::unique_ptr<std::string> metadata;
};

class TagMapper : public MapperInterface<TagMapper, TagMapperParams, tag_id_t>,
                public FieldReflectable<TagMapper> {
 private:
  static constexpr uint32_t                                         _field_count      = 6;
  static constexpr const char*                                      _table_name       = "Tag";
  static constexpr const char*                                      _prime_key_clause = "id={}";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      FIELD(TagMapperParams, id, VARCHAR),
      FIELD(TagMapperParams, name, VARCHAR),
      FIELD(TagMapperParams, category_id, VARCHAR),
      FIELD(TagMapperParams, card_count, UINT64),
      FIELD(TagMapperParams, date_created, TIMESTAMP),
      FIELD(TagMapperParams, metadata, JSON)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> TagMapperParams;
  friend struct FieldReflectable<TagMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace arcvault
