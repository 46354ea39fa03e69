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
// CREATE TABLE Collection (id TEXT, name TEXT, date_created TEXT, date_modified TEXT, card_ids
// TEXT, metadata TEXT);
struct CollectionMapperParams {
  std::unique_ptr<std::string> id;
  std::unique_ptr<std::string> name;
  std::unique_ptr<std::string> date_created;
  std::unique_ptr<std::string> date_modified;
  // Ordered JSON array of card ids
  std::unique_ptr<std::string> card_ids;
  std::unique_ptr<std::string> metadata;
};

class CollectionMapper : public MapperInterface<CollectionMapper, CollectionMapperParams, collection_id_t>,
                       public FieldReflectable<CollectionMapper> {
 private:
  static constexpr uint32_t                                         _field_count      = 6;
  static constexpr const char*                                      _table_name       = "Collection";
  static constexpr const char*                                      _prime_key_clause = "id={}";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      FIELD(CollectionMapperParams, id, VARCHAR),
      FIELD(CollectionMapperParams, name, VARCHAR),
      FIELD(CollectionMapperParams, date_created, TIMESTAMP),
      FIELD(CollectionMapperParams, date_modified, TIMESTAMP),
      FIELD(CollectionMapperParams, card_ids, JSON),
      FIELD(CollectionMapperParams, metadata, JSON)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> CollectionMapperParams;
  friend struct FieldReflectable<CollectionMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace arcvault
