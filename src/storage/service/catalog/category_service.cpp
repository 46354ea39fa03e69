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

#include "storage/service/catalog/category_service.hpp"

#include <utility>

#include "catalog/entity_json.hpp"
#include "storage/service/catalog/column_codec.hpp"

namespace arcvault {
auto CategoryService::ToParams(const Category& source) -> CategoryMapperParams {
  nlohmann::json metadata = nlohmann::json::object();
  json_field::PutOptional(metadata, "color", source.color_);
  json_field::PutOptional(metadata, "order", source.order_);
  return {column_codec::Text(source.id_), column_codec::Text(source.name_),
          column_codec::Text(source.date_created_), column_codec::EncodeIds(source.tag_ids_),
          column_codec::Text(metadata.dump())};
}

auto CategoryService::FromParams(CategoryMapperParams&& param) -> Category {
  Category category;
  category.id_           = std::move(*param.id);
  category.name_         = std::move(*param.name);
  category.date_created_ = std::move(*param.date_created);
  category.tag_ids_      = column_codec::DecodeIds(*param.tag_ids);
  auto metadata          = column_codec::DecodeObject(*param.metadata);
  category.color_        = json_field::GetOptional<std::string>(metadata, "color");
  category.order_        = json_field::GetOptional<int32_t>(metadata, "order");
  return category;
}

auto CategoryService::GetCategoriesListingTag(const tag_id_t& tag_id) -> std::vector<Category> {
  auto candidates = GetByPredicate(column_codec::ListContains("tag_ids", tag_id));
  std::erase_if(candidates,
                [&](const Category& c) { return !id_list::Contains(c.tag_ids_, tag_id); });
  return candidates;
}
};  // namespace arcvault
