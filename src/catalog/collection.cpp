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

#include "catalog/collection.hpp"

#include "catalog/entity_json.hpp"

namespace arcvault {
auto Collection::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["id"]           = id_;
  j["name"]         = name_;
  j["dateCreated"]  = date_created_;
  j["dateModified"] = date_modified_;
  j["cardIds"]      = card_ids_;
  json_field::PutOptional(j, "description", description_);
  return j;
}

auto Collection::FromJson(const nlohmann::json& j) -> Collection {
  Collection collection;
  collection.id_            = j.at("id").get<std::string>();
  collection.name_          = json_field::Get<std::string>(j, "name", "");
  collection.description_   = json_field::GetOptional<std::string>(j, "description");
  collection.date_created_  = json_field::Get<std::string>(j, "dateCreated", "");
  collection.date_modified_ = json_field::Get<std::string>(j, "dateModified", collection.date_created_);
  collection.card_ids_      = json_field::Get<std::vector<std::string>>(j, "cardIds", {});
  return collection;
}

void CollectionPatch::ApplyTo(Collection& collection) const {
  if (name_) collection.name_ = *name_;
  if (description_) collection.description_ = description_;
  if (card_ids_) collection.card_ids_ = *card_ids_;
}

auto Moodboard::ToJson() const -> nlohmann::json {
  return {{"id", id_}, {"cardIds", card_ids_}, {"dateModified", date_modified_}};
}

auto Moodboard::FromJson(const nlohmann::json& j) -> Moodboard {
  Moodboard board;
  board.id_            = json_field::Get<std::string>(j, "id", kMoodboardId);
  board.card_ids_      = json_field::Get<std::vector<std::string>>(j, "cardIds", {});
  board.date_modified_ = json_field::Get<std::string>(j, "dateModified", "");
  return board;
}

auto PreviewEntry::ToJson() const -> nlohmann::json {
  return {{"cardId", card_id_}, {"previewPath", preview_path_}, {"dateCreated", date_created_}};
}

auto PreviewEntry::FromJson(const nlohmann::json& j) -> PreviewEntry {
  PreviewEntry entry;
  entry.card_id_      = j.at("cardId").get<std::string>();
  entry.preview_path_ = json_field::Get<std::string>(j, "previewPath", "");
  entry.date_created_ = json_field::Get<std::string>(j, "dateCreated", "");
  return entry;
}
};  // namespace arcvault
