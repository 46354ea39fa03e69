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

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_types.hpp"

namespace arcvault {
namespace column_codec {
inline auto EncodeIds(const std::vector<std::string>& ids) -> std::unique_ptr<std::string> {
  return std::make_unique<std::string>(nlohmann::json(ids).dump());
}

/**
 * @brief Decode a JSON id-list column. NULL or malformed text decodes to an empty list.
 */
inline auto DecodeIds(const std::string& text) -> std::vector<std::string> {
  if (text.empty()) return {};
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_array()) return {};
  std::vector<std::string> ids;
  ids.reserve(parsed.size());
  for (const auto& item : parsed) {
    if (item.is_string()) ids.push_back(item.get<std::string>());
  }
  return ids;
}

inline auto DecodeObject(const std::string& text) -> nlohmann::json {
  if (text.empty()) return nlohmann::json::object();
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) return nlohmann::json::object();
  return parsed;
}

inline auto Text(const std::string& value) -> std::unique_ptr<std::string> {
  return std::make_unique<std::string>(value);
}

/**
 * @brief WHERE fragment matching rows whose JSON id-list column holds id
 */
inline auto ListContains(const char* column, const std::string& id) -> std::string {
  return fmt::format("contains({}, {})", column, duckorm::Quote(nlohmann::json(id).dump()));
}

inline auto Equals(const char* column, const std::string& value) -> std::string {
  return fmt::format("{}={}", column, duckorm::Quote(value));
}
};  // namespace column_codec
};  // namespace arcvault
