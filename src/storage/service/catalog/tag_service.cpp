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

#include "storage/service/catalog/tag_service.hpp"

#include <utility>

#include "catalog/entity_json.hpp"
#include "storage/service/catalog/column_codec.hpp"

namespace arcvault {
auto TagService::ToParams(const Tag& source) -> TagMapperParams {
  nlohmann::json metadata = nlohmann::json::object();
  json_field::PutOptional(metadata, "color", source.color_);
  json_field::PutOptional(metadata, "description", source.description_);
  return {column_codec::Text(source.id_),           column_codec::Text(source.name_),
          column_codec::Text(source.category_id_),  source.card_count_,
          column_codec::Text(source.date_created_), column_codec::Text(metadata.dump())};
}

auto TagService::FromParams(TagMapperParams&& param) -> Tag {
  Tag tag;
  tag.id_           = std::move(*param.id);
  tag.name_         = std::move(*param.name);
  tag.category_id_  = std::move(*param.category_id);
  tag.card_count_   = param.card_count;
  tag.date_created_ = std::move(*param.date_created);
  auto metadata     = column_codec::DecodeObject(*param.metadata);
  tag.color_        = json_field::GetOptional<std::string>(metadata, "color");
  tag.description_  = json_field::GetOptional<std::string>(metadata, "description");
  return tag;
}

auto TagService::GetTagsByCategory(const category_id_t& category_id) -> std::vector<Tag> {
  return GetByPredicate(column_codec::Equals("category_id", category_id));
}
};  // namespace arcvault
