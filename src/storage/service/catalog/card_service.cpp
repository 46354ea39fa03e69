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

#include "storage/service/catalog/card_service.hpp"

#include <fmt/format.h>

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "catalog/entity_json.hpp"
#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/service/catalog/column_codec.hpp"

namespace arcvault {
auto CardService::ToParams(const Card& source) -> CardMapperParams {
  nlohmann::json metadata = nlohmann::json::object();
  json_field::PutOptional(metadata, "width", source.width_);
  json_field::PutOptional(metadata, "height", source.height_);
  json_field::PutOptional(metadata, "duration", source.duration_);
  json_field::PutOptional(metadata, "description", source.description_);

  return {column_codec::Text(source.id_),
          column_codec::Text(source.file_name_),
          column_codec::Text(source.file_path_.string()),
          static_cast<uint32_t>(source.type_),
          column_codec::Text(source.format_),
          source.file_size_,
          column_codec::Text(source.date_added_),
          source.date_modified_ ? column_codec::Text(*source.date_modified_) : nullptr,
          column_codec::Text(source.preview_),
          column_codec::EncodeIds(source.tags_),
          column_codec::EncodeIds(source.collections_),
          source.in_moodboard_,
          column_codec::Text(metadata.dump())};
}

auto CardService::FromParams(CardMapperParams&& param) -> Card {
  Card card;
  card.id_           = std::move(*param.id);
  card.file_name_    = std::move(*param.file_name);
  card.file_path_    = std::filesystem::path(std::move(*param.file_path));
  card.type_         = static_cast<MediaType>(param.type);
  card.format_       = std::move(*param.format);
  card.file_size_    = param.file_size;
  card.date_added_   = std::move(*param.date_added);
  if (!param.date_modified->empty()) {
    card.date_modified_ = std::move(*param.date_modified);
  }
  card.preview_      = std::move(*param.preview);
  card.tags_         = column_codec::DecodeIds(*param.tags);
  card.collections_  = column_codec::DecodeIds(*param.collections);
  card.in_moodboard_ = param.in_moodboard;

  auto metadata      = column_codec::DecodeObject(*param.metadata);
  card.width_        = json_field::GetOptional<uint32_t>(metadata, "width");
  card.height_       = json_field::GetOptional<uint32_t>(metadata, "height");
  card.duration_     = json_field::GetOptional<double>(metadata, "duration");
  card.description_  = json_field::GetOptional<std::string>(metadata, "description");
  return card;
}

auto CardService::GetCardsByIds(const std::vector<card_id_t>& ids) -> std::vector<Card> {
  if (ids.empty()) return {};
  std::string in_list;
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) in_list += ", ";
    in_list += duckorm::Quote(ids[i]);
  }
  return GetByPredicate(fmt::format("id IN ({})", in_list));
}

auto CardService::GetCardsWithTag(const tag_id_t& tag_id) -> std::vector<Card> {
  auto candidates = GetByPredicate(column_codec::ListContains("tags", tag_id));
  std::erase_if(candidates, [&](const Card& card) { return !card.HasTag(tag_id); });
  return candidates;
}

auto CardService::GetCardsInCollection(const collection_id_t& collection_id) -> std::vector<Card> {
  auto candidates = GetByPredicate(column_codec::ListContains("collections", collection_id));
  std::erase_if(candidates, [&](const Card& card) { return !card.InCollection(collection_id); });
  return candidates;
}

auto CardService::GetCardsByType(MediaType type) -> std::vector<Card> {
  return GetByPredicate(fmt::format("type={}", static_cast<uint32_t>(type)));
}

auto CardService::GetMoodboardCards() -> std::vector<Card> {
  return GetByPredicate("in_moodboard");
}

auto CardService::GetPage(uint32_t offset, uint32_t limit, CardOrder order, bool reverse)
    -> std::vector<Card> {
  const char* column = order == CardOrder::FILE_NAME ? "file_name" : "date_added";
  return GetByPredicate(fmt::format("TRUE ORDER BY {} {}, id LIMIT {} OFFSET {}", column,
                                    reverse ? "DESC" : "ASC", limit, offset));
}

auto CardService::CountByType(MediaType type) -> uint64_t {
  return Count(fmt::format("type={}", static_cast<uint32_t>(type)));
}

auto CardService::TotalFileSize() -> uint64_t {
  return duckorm::scalar_uint64(_conn, "SELECT COALESCE(SUM(file_size), 0) FROM Card;");
}
};  // namespace arcvault
