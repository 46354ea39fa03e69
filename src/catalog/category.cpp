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

#include "catalog/category.hpp"

#include "catalog/entity_json.hpp"

namespace arcvault {
auto Category::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["id"]          = id_;
  j["name"]        = name_;
  j["dateCreated"] = date_created_;
  j["tagIds"]      = tag_ids_;
  json_field::PutOptional(j, "color", color_);
  json_field::PutOptional(j, "order", order_);
  return j;
}

auto Category::FromJson(const nlohmann::json& j) -> Category {
  Category category;
  category.id_           = j.at("id").get<std::string>();
  category.name_         = json_field::Get<std::string>(j, "name", "");
  category.date_created_ = json_field::Get<std::string>(j, "dateCreated", "");
  category.tag_ids_      = json_field::Get<std::vector<std::string>>(j, "tagIds", {});
  category.color_        = json_field::GetOptional<std::string>(j, "color");
  category.order_        = json_field::GetOptional<int32_t>(j, "order");
  return category;
}

void CategoryPatch::ApplyTo(Category& category) const {
  if (name_) category.name_ = *name_;
  if (color_) category.color_ = color_;
  if (tag_ids_) category.tag_ids_ = *tag_ids_;
  if (order_) category.order_ = order_;
}
};  // namespace arcvault
