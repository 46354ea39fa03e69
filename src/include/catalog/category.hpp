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
struct Category {
  category_id_t              id_;
  std::string                name_;
  std::optional<std::string> color_;
  timestamp_t                date_created_;
  std::vector<tag_id_t>      tag_ids_;
  // Display position, unset for categories created before ordering existed
  std::optional<int32_t>     order_;

  auto                       ToJson() const -> nlohmann::json;
  static auto                FromJson(const nlohmann::json& j) -> Category;

  bool                       operator==(const Category& other) const = default;
};

struct CategoryPatch {
  std::optional<std::string>           name_;
  std::optional<std::string>           color_;
  std::optional<std::vector<tag_id_t>> tag_ids_;
  std::optional<int32_t>               order_;

  void                                 ApplyTo(Category& category) const;
};
};  // namespace arcvault
