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

#include <optional>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace arcvault {
struct Collection {
  collection_id_t            id_;
  std::string                name_;
  std::optional<std::string> description_;
  timestamp_t                date_created_;
  timestamp_t                date_modified_;
  std::vector<card_id_t>     card_ids_;

  auto                       ToJson() const -> nlohmann::json;
  static auto                FromJson(const nlohmann::json& j) -> Collection;

  bool                       operator==(const Collection& other) const = default;
};

struct CollectionPatch {
  std::optional<std::string>            name_;
  std::optional<std::string>            description_;
  std::optional<std::vector<card_id_t>> card_ids_;

  void                                  ApplyTo(Collection& collection) const;
};

/**
 * @brief The singleton scratch working set. Its id is always kMoodboardId.
 */
struct Moodboard {
  std::string            id_ = kMoodboardId;
  std::vector<card_id_t> card_ids_;
  timestamp_t            date_modified_;

  auto                   ToJson() const -> nlohmann::json;
  static auto            FromJson(const nlohmann::json& j) -> Moodboard;

  bool                   operator==(const Moodboard& other) const = default;
};

/**
 * @brief Cached preview location for a card. Owned by the preview pipeline, cleared with the card.
 */
struct PreviewEntry {
  card_id_t   card_id_;
  std::string preview_path_;
  timestamp_t date_created_;

  auto        ToJson() const -> nlohmann::json;
  static auto FromJson(const nlohmann::json& j) -> PreviewEntry;

  bool        operator==(const PreviewEntry& other) const = default;
};
};  // namespace arcvault
