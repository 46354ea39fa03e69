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
#include <optional>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace arcvault {
/**
 * @brief Byte-level split of one file into numbered parts and the reverse merge.
 *
 * Parts of "<dir>/<base>.zip" are named "<dir>/<base>.arc.part01", "<base>.arc.part02", ...
 * Concatenating the parts in index order reproduces the original bytes exactly.
 */
class PartSplitter {
 public:
  static constexpr const char* kPartMarker = ".arc.part";

  /**
   * @brief Split file_path into part_count contiguous ranges of ceil(size / part_count) bytes,
   * then delete the original. Existing parts of the same base numbered above part_count are
   * removed. On failure the parts written so far are removed and the original is kept.
   *
   * @throws BackupError (IO) on read/write failure, std::invalid_argument if part_count < 2
   */
  static auto Split(const file_path_t& file_path, uint32_t part_count) -> std::vector<file_path_t>;

  /**
   * @brief Concatenate every part sharing first_part's base name into one file. Parts are left in
   * place.
   *
   * @param first_part any part of the set, usually .arc.part01
   * @param output merged file path; defaults to "<base>_merged.zip" beside the parts
   * @throws BackupError (FORMAT) if the numbered sequence is not 01..N without gaps
   */
  static auto Merge(const file_path_t& first_part, std::optional<file_path_t> output = std::nullopt)
      -> file_path_t;

  static auto IsPartPath(const file_path_t& path) -> bool;
  /**
   * @brief "<dir>/<base>" for a part path, or for an archive path with .arc/.zip stripped
   */
  static auto BasePath(const file_path_t& path) -> file_path_t;
  static auto PartPath(const file_path_t& base, uint32_t index) -> file_path_t;
  /**
   * @brief Numeric index of a part path, 0 if path is not a part
   */
  static auto PartIndex(const file_path_t& path) -> uint32_t;
  /**
   * @brief All parts of the set first_part belongs to, sorted by name
   */
  static auto ListParts(const file_path_t& first_part) -> std::vector<file_path_t>;
};
};  // namespace arcvault
