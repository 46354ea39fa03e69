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

#include "archive/archive_types.hpp"

namespace arcvault {
auto BackupErrorKindToString(BackupErrorKind kind) -> const char* {
  switch (kind) {
    case BackupErrorKind::DIRECTORY_UNAVAILABLE:
      return "directory_unavailable";
    case BackupErrorKind::IO:
      return "io";
    case BackupErrorKind::FORMAT:
      return "format";
    case BackupErrorKind::BUSY:
      return "busy";
  }
  return "unknown";
}

auto BackupManifest::ToJson() const -> nlohmann::json {
  return {{"version", version_},
          {"date", date_},
          {"workingDir", working_dir_.string()},
          {"totalSize", total_size_},
          {"filesCount", files_count_},
          {"parts", parts_},
          {"archiveName", archive_name_},
          {"partFiles", part_files_},
          {"checksum", checksum_}};
}

auto BackupManifest::FromJson(const nlohmann::json& j) -> BackupManifest {
  BackupManifest manifest;
  manifest.version_      = j.value("version", std::string{kManifestVersion});
  manifest.date_         = j.value("date", std::string{});
  manifest.working_dir_  = j.value("workingDir", std::string{});
  manifest.total_size_   = j.value("totalSize", uint64_t{0});
  manifest.files_count_  = j.value("filesCount", uint64_t{0});
  manifest.parts_        = j.value("parts", uint32_t{1});
  manifest.archive_name_ = j.value("archiveName", std::string{});
  manifest.part_files_   = j.value("partFiles", std::vector<std::string>{});
  manifest.checksum_     = j.value("checksum", std::string{});
  return manifest;
}
};  // namespace arcvault
