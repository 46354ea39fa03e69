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

#include "catalog/tag.hpp"

#include "catalog/entity_json.hpp"

namespace arcvault {
auto Tag::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["id"]          = id_;
  j["name"]        = name_;
  j["categoryId"]  = category_id_;
  j["cardCount"]   = card_count_;
  j["dateCreated"] = date_created_;
  json_field::PutOptional(j, "color", color_);
  json_field::PutOptional(j, "description", description_);
  return j;
}

auto Tag::FromJson(const nlohmann::json& j) -> Tag {
  Tag tag;
  tag.id_           = j.at("id").get<std::string>();
  tag.name_         = json_field::Get<std::string>(j, "name", "");
  tag.category_id_  = json_field::Get<std::string>(j, "categoryId", "");
  tag.card_count_   = json_field::Get<uint64_t>(j, "cardCount", 0);
  tag.date_created_ = json_field::Get<std::string>(j, "dateCreated", "");
  tag.color_        = json_field::GetOptional<std::string>(j, "color");
  tag.description_  = json_field::GetOptional<std::string>(j, "description");
  return tag;
}

void TagPatch::ApplyTo(Tag& tag) const {
  if (name_) tag.name_ = *name_;
  if (category_id_) tag.category_id_ = *category_id_;
  if (card_count_) tag.card_count_ = *card_count_;
  if (color_) tag.color_ = color_;
  if (description_) tag.description_ = description_;
}
};  // namespace arcvault
