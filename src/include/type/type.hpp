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

#include <cstdint>
#include <filesystem>
#include <string>

namespace arcvault {

// Native filesystem path
#define file_path_t     std::filesystem::path

// String identifiers of the five catalog entity kinds
#define card_id_t       std::string
#define tag_id_t        std::string
#define category_id_t   std::string
#define collection_id_t std::string

// ISO-8601 UTC timestamp, e.g. 2026-01-31T12:00:00.000Z
#define timestamp_t     std::string

enum class MediaType : uint32_t { IMAGE = 0, VIDEO = 1 };

enum class EntityKind : uint32_t { CARD, TAG, CATEGORY, COLLECTION, MOODBOARD };

inline auto MediaTypeToString(MediaType type) -> const char* {
  return type == MediaType::VIDEO ? "video" : "image";
}

inline auto MediaTypeFromString(const std::string& str) -> MediaType {
  return str == "video" ? MediaType::VIDEO : MediaType::IMAGE;
}

// The single well-known Moodboard record
constexpr const char* kMoodboardId = "default";
};  // namespace arcvault
