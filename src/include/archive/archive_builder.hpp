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
struct DirectoryStats {
  uint64_t total_bytes_ = 0;
  uint64_t files_count_ = 0;
};

/**
 * @brief Writes the serialized catalog plus every file of the working directory into one ZIP
 * archive, optionally split into parts afterwards.
 *
 * Steps run strictly in order: verify directory, measure, write catalog entry, write files,
 * finalize, checksum, split, manifest. Any failure deletes the partial archive and any parts,
 * then propagates.
 */
class ArchiveBuilder {
 private:
  int              _compression_level;
  ProgressCallback _progress;

  void             EmitProgress(uint64_t processed, uint64_t total);

 public:
  explicit ArchiveBuilder(int compression_level = 9, ProgressCallback progress = {});

  auto        CreateBackup(const BackupRequest& request) -> BackupResult;

  /**
   * @brief Total size and count of regular files under dir, skipping the given path
   */
  static auto ScanDirectory(const std::filesystem::path& dir,
                            const std::filesystem::path& skip = {}) -> DirectoryStats;
};
};  // namespace arcvault
