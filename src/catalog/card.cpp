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

#include "catalog/card.hpp"

#include "catalog/entity_json.hpp"

namespace arcvault {
auto Card::HasTag(const tag_id_t& tag_id) const -> bool { return id_list::Contains(tags_, tag_id); }

auto Card::InCollection(const collection_id_t& collection_id) const -> bool {
  return id_list::Contains(collections_, collection_id);
}

auto Card::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["id"]          = id_;
  j["fileName"]    = file_name_;
  j["filePath"]    = file_path_.string();
  j["type"]        = MediaTypeToString(type_);
  j["format"]      = format_;
  j["fileSize"]    = file_size_;
  j["dateAdded"]   = date_added_;
  j["tags"]        = tags_;
  j["collections"] = collections_;
  j["inMoodboard"] = in_moodboard_;
  if (!preview_.empty()) {
    j["thumbnailUrl"] = preview_;
  }
  json_field::PutOptional(j, "dateModified", date_modified_);
  json_field::PutOptional(j, "width", width_);
  json_field::PutOptional(j, "height", height_);
  json_field::PutOptional(j, "duration", duration_);
  json_field::PutOptional(j, "description", description_);
  return j;
}

auto Card::FromJson(const nlohmann::json& j) -> Card {
  Card card;
  card.id_           = j.at("id").get<std::string>();
  card.file_name_    = json_field::Get<std::string>(j, "fileName", "");
  card.file_path_    = json_field::Get<std::string>(j, "filePath", "");
  card.type_         = MediaTypeFromString(json_field::Get<std::string>(j, "type", "image"));
  card.format_       = json_field::Get<std::string>(j, "format", "");
  card.file_size_    = json_field::Get<uint64_t>(j, "fileSize", 0);
  card.date_added_   = json_field::Get<std::string>(j, "dateAdded", "");
  card.date_modified_ = json_field::GetOptional<std::string>(j, "dateModified");
  card.width_        = json_field::GetOptional<uint32_t>(j, "width");
  card.height_       = json_field::GetOptional<uint32_t>(j, "height");
  card.duration_     = json_field::GetOptional<double>(j, "duration");
  card.preview_      = json_field::Get<std::string>(j, "thumbnailUrl", "");
  card.tags_         = json_field::Get<std::vector<std::string>>(j, "tags", {});
  card.collections_  = json_field::Get<std::vector<std::string>>(j, "collections", {});
  card.in_moodboard_ = json_field::Get<bool>(j, "inMoodboard", false);
  card.description_  = json_field::GetOptional<std::string>(j, "description");
  return card;
}

void CardPatch::ApplyTo(Card& card) const {
  if (file_name_) card.file_name_ = *file_name_;
  if (file_path_) card.file_path_ = *file_path_;
  if (type_) card.type_ = *type_;
  if (format_) card.format_ = *format_;
  if (file_size_) card.file_size_ = *file_size_;
  if (width_) card.width_ = width_;
  if (height_) card.height_ = height_;
  if (duration_) card.duration_ = duration_;
  if (preview_) card.preview_ = *preview_;
  if (tags_) card.tags_ = *tags_;
  if (collections_) card.collections_ = *collections_;
  if (in_moodboard_) card.in_moodboard_ = *in_moodboard_;
  if (description_) card.description_ = description_;
}
};  // namespace arcvault
