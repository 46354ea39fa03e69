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

#include "catalog/catalog_snapshot.hpp"

#include <stdexcept>

namespace arcvault {
namespace {
template <typename Entity>
auto ToJsonArray(const std::vector<Entity>& entities) -> nlohmann::json {
  auto arr = nlohmann::json::array();
  for (const auto& e : entities) {
    arr.push_back(e.ToJson());
  }
  return arr;
}

template <typename Entity>
auto FromJsonArray(const nlohmann::json& j, const char* key) -> std::vector<Entity> {
  std::vector<Entity> entities;
  auto                it = j.find(key);
  if (it == j.end() || !it->is_array()) {
    return entities;
  }
  entities.reserve(it->size());
  for (const auto& item : *it) {
    entities.push_back(Entity::FromJson(item));
  }
  return entities;
}
};  // namespace

auto CatalogSnapshot::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["cards"]        = ToJsonArray(cards_);
  j["tags"]         = ToJsonArray(tags_);
  j["categories"]   = ToJsonArray(categories_);
  j["collections"]  = ToJsonArray(collections_);
  j["moodboard"]    = moodboard_ ? moodboard_->ToJson() : nlohmann::json(nullptr);
  j["previewCache"] = ToJsonArray(previews_);
  j["exportDate"]   = export_date_;
  j["version"]      = version_;
  return j;
}

auto CatalogSnapshot::Dump(int indent) const -> std::string { return ToJson().dump(indent); }

auto CatalogSnapshot::FromJson(const nlohmann::json& j) -> CatalogSnapshot {
  if (!j.is_object()) {
    throw std::invalid_argument("catalog snapshot must be a JSON object");
  }
  CatalogSnapshot snapshot;
  snapshot.cards_       = FromJsonArray<Card>(j, "cards");
  snapshot.tags_        = FromJsonArray<Tag>(j, "tags");
  snapshot.categories_  = FromJsonArray<Category>(j, "categories");
  snapshot.collections_ = FromJsonArray<Collection>(j, "collections");
  snapshot.previews_    = FromJsonArray<PreviewEntry>(j, "previewCache");

  auto board            = j.find("moodboard");
  if (board != j.end() && board->is_object()) {
    snapshot.moodboard_ = Moodboard::FromJson(*board);
  } else if (board != j.end() && board->is_array() && !board->empty()) {
    // Older exports stored the board as a one-row table
    snapshot.moodboard_ = Moodboard::FromJson(board->front());
  }
  snapshot.export_date_ = j.value("exportDate", std::string{});
  snapshot.version_     = j.value("version", std::string{kSnapshotVersion});
  return snapshot;
}

auto CatalogSnapshot::Parse(const std::string& text) -> CatalogSnapshot {
  return FromJson(nlohmann::json::parse(text));
}
};  // namespace arcvault
