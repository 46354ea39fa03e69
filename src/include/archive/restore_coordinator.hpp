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

#include "archive/archive_types.hpp"

namespace arcvault {
/**
 * @brief Reassembles and unpacks a backup archive into a target directory and hands back the
 * serialized catalog it carried. The live catalog is never touched here; the caller imports the
 * payload.
 */
class RestoreCoordinator {
 private:
  std::filesystem::path _temp_dir;

 public:
  /**
   * @param temp_dir where merged archives and extraction folders are created; defaults to the
   * system temp directory
   */
  explicit RestoreCoordinator(std::filesystem::path temp_dir = {});

  /**
   * @brief Restore from an archive or from any part of a split archive.
   *
   * @throws BackupError FORMAT for incomplete part sets, checksum mismatches, unsafe or corrupt
   * entries; IO for filesystem failures
   */
  auto        RestoreBackup(const RestoreRequest& request) -> RestoreResult;

  /**
   * @brief Unpack every entry of a ZIP archive under dest. Entries with absolute paths or ".."
   * components are rejected.
   *
   * @return number of regular files written
   */
  static auto ExtractArchive(const std::filesystem::path& archive_path,
                             const std::filesystem::path& dest) -> uint64_t;
};
};  // namespace arcvault
