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

#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace arcvault {
namespace json_field {
template <typename T>
auto Get(const nlohmann::json& j, const char* key, T fallback) -> T {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  return it->template get<T>();
}

template <typename T>
auto GetOptional(const nlohmann::json& j, const char* key) -> std::optional<T> {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->template get<T>();
}

template <typename T>
void PutOptional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
  if (value.has_value()) {
    j[key] = *value;
  }
}
};  // namespace json_field

namespace id_list {
inline auto Contains(const std::vector<std::string>& ids, const std::string& id) -> bool {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

/**
 * @brief Append the id if absent, keeping set semantics on an ordered list.
 *
 * @return true if the list changed
 */
inline auto Insert(std::vector<std::string>& ids, const std::string& id) -> bool {
  if (Contains(ids, id)) {
    return false;
  }
  ids.push_back(id);
  return true;
}

inline auto Erase(std::vector<std::string>& ids, const std::string& id) -> bool {
  auto before = ids.size();
  ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
  return ids.size() != before;
}

template <typename Pred>
auto Filter(const std::vector<std::string>& ids, Pred keep) -> std::vector<std::string> {
  std::vector<std::string> kept;
  kept.reserve(ids.size());
  std::copy_if(ids.begin(), ids.end(), std::back_inserter(kept), keep);
  return kept;
}
};  // namespace id_list
};  // namespace arcvault
