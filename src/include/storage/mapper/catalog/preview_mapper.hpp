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
// CREATE TABLE PreviewCache (card_id TEXT, preview_path TEXT, date_created TEXT);
struct PreviewMapperParams {
  std::unique_ptr<std::string> card_id;
  std::unique_ptr<std::string> preview_path;
  std::unique_ptr<std::string> date_created;
};

class PreviewMapper : public MapperInterface<PreviewMapper, PreviewMapperParams, card_id_t>,
                    public FieldReflectable<PreviewMapper> {
 private:
  static constexpr uint32_t                                         _field_count      = 3;
  static constexpr const char*                                      _table_name       = "PreviewCache";
  static constexpr const char*                                      _prime_key_clause = "card_id={}";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      FIELD(PreviewMapperParams, card_id, VARCHAR),
      FIELD(PreviewMapperParams, preview_path, VARCHAR),
      FIELD(PreviewMapperParams, date_created, TIMESTAMP)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> PreviewMapperParams;
  friend struct FieldReflectable<PreviewMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace arcvault
