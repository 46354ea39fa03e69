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

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace arcvault {
constexpr const char* kManifestVersion   = "1.0";
// Top-level archive folder that carries the serialized catalog
constexpr const char* kDatabaseFolder    = "_database";
constexpr const char* kDatabaseEntryName = "_database/arc_database.json";

enum class BackupErrorKind : uint32_t { DIRECTORY_UNAVAILABLE, IO, FORMAT, BUSY };

auto BackupErrorKindToString(BackupErrorKind kind) -> const char*;

class BackupError : public std::runtime_error {
 private:
  BackupErrorKind _kind;

 public:
  BackupError(BackupErrorKind kind, const std::string& what)
      : std::runtime_error(what), _kind(kind) {}

  auto Kind() const -> BackupErrorKind { return _kind; }
};

struct BackupProgress {
  uint32_t percent_         = 0;
  uint64_t processed_bytes_ = 0;
  uint64_t total_bytes_     = 0;

  bool     operator==(const BackupProgress& other) const = default;
};

using ProgressCallback = std::function<void(const BackupProgress&)>;

/**
 * @brief Descriptive record of a produced archive. Not needed to restore.
 */
struct BackupManifest {
  std::string              version_ = kManifestVersion;
  timestamp_t              date_;
  file_path_t              working_dir_;
  // Size of the finished archive before splitting
  uint64_t                 total_size_  = 0;
  uint64_t                 files_count_ = 0;
  uint32_t                 parts_       = 1;
  std::string              archive_name_;
  std::vector<std::string> part_files_;
  std::string              checksum_;

  auto                     ToJson() const -> nlohmann::json;
  static auto              FromJson(const nlohmann::json& j) -> BackupManifest;
};

struct BackupRequest {
  file_path_t output_path_;
  file_path_t working_dir_;
  uint32_t    part_count_ = 1;
  std::string serialized_store_;
};

struct BackupResult {
  uint64_t                  size_        = 0;
  uint64_t                  files_count_ = 0;
  std::chrono::milliseconds duration_{0};
  BackupManifest            manifest_;
  std::vector<file_path_t>  output_files_;
};

struct RestoreRequest {
  file_path_t                archive_path_;
  file_path_t                target_dir_;
  std::optional<std::string> expected_checksum_;
};

struct RestoreResult {
  bool                       success_        = false;
  std::optional<std::string> serialized_store_;
  uint64_t                   files_restored_ = 0;
};
};  // namespace arcvault
