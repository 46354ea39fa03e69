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
// CREATE TABLE Category (id TEXT, name TEXT, date_created TEXT, tag_ids TEXT, metadata TEXT);
struct CategoryMapperParams {
  std::unique_ptr<std::string> id;
  std::unique_ptr<std::string> name;
  std::unique_ptr<std::string> date_created;
  // Ordered JSON array of tag ids
  std::unique_ptr<std::string> tag_ids;
  // JSON object with color and order
  std::unique_ptr<std::string> metadata;
};

class CategoryMapper : public MapperInterface<CategoryMapper, CategoryMapperParams, category_id_t>,
                     public FieldReflectable<CategoryMapper> {
 private:
  static constexpr uint32_t                                         _field_count      = 5;
  static constexpr const char*                                      _table_name       = "Category";
  static constexpr const char*                                      _prime_key_clause = "id={}";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      FIELD(CategoryMapperParams, id, VARCHAR),
      FIELD(CategoryMapperParams, name, VARCHAR),
      FIELD(CategoryMapperParams, date_created, TIMESTAMP),
      FIELD(CategoryMapperParams, tag_ids, JSON),
      FIELD(CategoryMapperParams, metadata, JSON)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> CategoryMapperParams;
  friend struct FieldReflectable<CategoryMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace arcvault
