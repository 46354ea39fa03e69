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

#include "storage/service/catalog/collection_service.hpp"

#include <utility>

#include "catalog/entity_json.hpp"
#include "storage/service/catalog/column_codec.hpp"

namespace arcvault {
auto CollectionService::ToParams(const Collection& source) -> CollectionMapperParams {
  nlohmann::json metadata = nlohmann::json::object();
  json_field::PutOptional(metadata, "description", source.description_);
  return {column_codec::Text(source.id_),
          column_codec::Text(source.name_),
          column_codec::Text(source.date_created_),
          column_codec::Text(source.date_modified_),
          column_codec::EncodeIds(source.card_ids_),
          column_codec::Text(metadata.dump())};
}

auto CollectionService::FromParams(CollectionMapperParams&& param) -> Collection {
  Collection collection;
  collection.id_            = std::move(*param.id);
  collection.name_          = std::move(*param.name);
  collection.date_created_  = std::move(*param.date_created);
  collection.date_modified_ = std::move(*param.date_modified);
  collection.card_ids_      = column_codec::DecodeIds(*param.card_ids);
  auto metadata             = column_codec::DecodeObject(*param.metadata);
  collection.description_   = json_field::GetOptional<std::string>(metadata, "description");
  return collection;
}

auto CollectionService::GetCollectionsHoldingCard(const card_id_t& card_id)
    -> std::vector<Collection> {
  auto candidates = GetByPredicate(column_codec::ListContains("card_ids", card_id));
  std::erase_if(candidates,
                [&](const Collection& c) { return !id_list::Contains(c.card_ids_, card_id); });
  return candidates;
}

auto MoodboardService::ToParams(const Moodboard& source) -> MoodboardMapperParams {
  return {column_codec::Text(source.id_), column_codec::EncodeIds(source.card_ids_),
          column_codec::Text(source.date_modified_)};
}

auto MoodboardService::FromParams(MoodboardMapperParams&& param) -> Moodboard {
  Moodboard board;
  board.id_            = std::move(*param.id);
  board.card_ids_      = column_codec::DecodeIds(*param.card_ids);
  board.date_modified_ = std::move(*param.date_modified);
  return board;
}

auto MoodboardService::Load() -> Moodboard {
  auto board = GetById(kMoodboardId);
  if (!board.has_value()) {
    return Moodboard{};
  }
  return std::move(*board);
}

void MoodboardService::Save(const Moodboard& board) {
  if (Update(board, kMoodboardId) == 0) {
    Insert(board);
  }
}

auto PreviewService::ToParams(const PreviewEntry& source) -> PreviewMapperParams {
  return {column_codec::Text(source.card_id_), column_codec::Text(source.preview_path_),
          column_codec::Text(source.date_created_)};
}

auto PreviewService::FromParams(PreviewMapperParams&& param) -> PreviewEntry {
  return {std::move(*param.card_id), std::move(*param.preview_path),
          std::move(*param.date_created)};
}
};  // namespace arcvault
