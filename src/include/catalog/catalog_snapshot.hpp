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

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "catalog/card.hpp"
#include "catalog/category.hpp"
#include "catalog/collection.hpp"
#include "catalog/tag.hpp"

namespace arcvault {
constexpr const char* kSnapshotVersion = "1.0";

/**
 * @brief Whole-catalog payload. This is what a backup archive carries under _database/ and what a
 * restore hands back to the caller for import.
 */
struct CatalogSnapshot {
  std::vector<Card>         cards_;
  std::vector<Tag>          tags_;
  std::vector<Category>     categories_;
  std::vector<Collection>   collections_;
  std::optional<Moodboard>  moodboard_;
  std::vector<PreviewEntry> previews_;
  timestamp_t               export_date_;
  std::string               version_ = kSnapshotVersion;

  auto                      ToJson() const -> nlohmann::json;
  auto                      Dump(int indent = 2) const -> std::string;

  /**
   * @brief Parse a serialized catalog. Missing sections are treated as empty.
   *
   * @throws std::invalid_argument if the document is not an object, nlohmann::json::exception if
   * it is malformed or a record lacks its id
   */
  static auto               FromJson(const nlohmann::json& j) -> CatalogSnapshot;
  static auto               Parse(const std::string& text) -> CatalogSnapshot;

  bool                      operator==(const CatalogSnapshot& other) const = default;
};

struct CatalogStatistics {
  uint64_t cards_       = 0;
  uint64_t images_      = 0;
  uint64_t videos_      = 0;
  uint64_t tags_        = 0;
  uint64_t categories_  = 0;
  uint64_t collections_ = 0;
  uint64_t moodboard_   = 0;
  uint64_t total_bytes_ = 0;
};
};  // namespace arcvault
