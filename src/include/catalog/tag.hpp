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

#include "type/type.hpp"

namespace arcvault {
/**
 * @brief Categorization label. card_count_ mirrors how many Cards carry the tag; it is kept up to
 * date on card creation and tag edits but not on card deletion, so it may run stale until the
 * integrity repairer or RecalculateTagCounts() fixes it.
 */
struct Tag {
  tag_id_t                   id_;
  std::string                name_;
  category_id_t              category_id_;
  uint64_t                   card_count_ = 0;
  std::optional<std::string> color_;
  std::optional<std::string> description_;
  timestamp_t                date_created_;

  auto                       ToJson() const -> nlohmann::json;
  static auto                FromJson(const nlohmann::json& j) -> Tag;

  bool                       operator==(const Tag& other) const = default;
};

struct TagPatch {
  std::optional<std::string>   name_;
  std::optional<category_id_t> category_id_;
  std::optional<uint64_t>      card_count_;
  std::optional<std::string>   color_;
  std::optional<std::string>   description_;

  void                         ApplyTo(Tag& tag) const;
};

/**
 * @brief A tag whose category anchor is gone.
 */
struct OrphanTag {
  Tag tag_;
  bool category_exists_ = false;
};

struct OrphanTagCleanup {
  uint32_t deleted_            = 0;
  uint32_t removed_from_cards_ = 0;
};
};  // namespace arcvault
