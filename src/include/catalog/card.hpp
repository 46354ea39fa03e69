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

#include "type/type.hpp"

namespace arcvault {
/**
 * @brief Catalog record for one media file in the working directory.
 */
struct Card {
  card_id_t                    id_;
  std::string                  file_name_;
  file_path_t                  file_path_;
  MediaType                    type_      = MediaType::IMAGE;
  std::string                  format_;
  uint64_t                     file_size_ = 0;
  timestamp_t                  date_added_;
  std::optional<timestamp_t>   date_modified_;
  std::optional<uint32_t>      width_;
  std::optional<uint32_t>      height_;
  std::optional<double>        duration_;
  // Cached preview reference, either a file path or a data URL
  std::string                  preview_;
  std::vector<tag_id_t>        tags_;
  std::vector<collection_id_t> collections_;
  bool                         in_moodboard_ = false;
  std::optional<std::string>   description_;

  auto        HasTag(const tag_id_t& tag_id) const -> bool;
  auto        InCollection(const collection_id_t& collection_id) const -> bool;

  auto        ToJson() const -> nlohmann::json;
  static auto FromJson(const nlohmann::json& j) -> Card;

  bool        operator==(const Card& other) const = default;
};

/**
 * @brief Targeted field update for a Card. Unset members are left untouched.
 */
struct CardPatch {
  std::optional<std::string>                  file_name_;
  std::optional<file_path_t>                  file_path_;
  std::optional<MediaType>                    type_;
  std::optional<std::string>                  format_;
  std::optional<uint64_t>                     file_size_;
  std::optional<uint32_t>                     width_;
  std::optional<uint32_t>                     height_;
  std::optional<double>                       duration_;
  std::optional<std::string>                  preview_;
  std::optional<std::vector<tag_id_t>>        tags_;
  std::optional<std::vector<collection_id_t>> collections_;
  std::optional<bool>                         in_moodboard_;
  std::optional<std::string>                  description_;

  void                                        ApplyTo(Card& card) const;
};

struct CardStatistics {
  uint64_t total_  = 0;
  uint64_t images_ = 0;
  uint64_t videos_ = 0;
};
};  // namespace arcvault
