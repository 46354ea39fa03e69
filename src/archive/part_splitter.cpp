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

#include "archive/part_splitter.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "archive/archive_types.hpp"
#include "utils/log/logger.hpp"

namespace arcvault {
namespace {
constexpr size_t kCopyChunk = 1 << 20;

const std::regex kPartSuffix{R"(\.arc\.part(\d+)$)"};

/**
 * @brief Copy up to length bytes from in to out, length == UINT64_MAX copies to EOF
 */
auto CopyBytes(std::ifstream& in, std::ofstream& out, uint64_t length) -> uint64_t {
  std::vector<char> buffer(kCopyChunk);
  uint64_t          copied = 0;
  while (copied < length && in) {
    auto want = static_cast<std::streamsize>(std::min<uint64_t>(buffer.size(), length - copied));
    in.read(buffer.data(), want);
    auto got = in.gcount();
    if (got <= 0) break;
    out.write(buffer.data(), got);
    if (!out) {
      throw BackupError(BackupErrorKind::IO, "Write failed while copying archive bytes");
    }
    copied += static_cast<uint64_t>(got);
  }
  if (in.bad()) {
    throw BackupError(BackupErrorKind::IO, "Read failed while copying archive bytes");
  }
  return copied;
}
};  // namespace

auto PartSplitter::IsPartPath(const file_path_t& path) -> bool {
  return std::regex_search(path.filename().string(), kPartSuffix);
}

auto PartSplitter::PartIndex(const file_path_t& path) -> uint32_t {
  std::smatch match;
  auto        name = path.filename().string();
  if (!std::regex_search(name, match, kPartSuffix)) return 0;
  return static_cast<uint32_t>(std::stoul(match[1].str()));
}

auto PartSplitter::BasePath(const file_path_t& path) -> file_path_t {
  auto name = path.filename().string();
  if (IsPartPath(path)) {
    name = std::regex_replace(name, kPartSuffix, "");
  } else {
    static const std::regex kArchiveExt{R"(\.(arc|zip)$)"};
    name = std::regex_replace(name, kArchiveExt, "");
  }
  return path.parent_path() / name;
}

auto PartSplitter::PartPath(const file_path_t& base, uint32_t index) -> file_path_t {
  return file_path_t(fmt::format("{}{}{:02}", base.string(), kPartMarker, index));
}

auto PartSplitter::Split(const file_path_t& file_path, uint32_t part_count)
    -> std::vector<file_path_t> {
  if (part_count < 2) {
    throw std::invalid_argument("Split needs at least two parts");
  }
  std::error_code ec;
  uint64_t        total = std::filesystem::file_size(file_path, ec);
  if (ec) {
    throw BackupError(BackupErrorKind::IO,
                      fmt::format("Cannot stat {}: {}", file_path.string(), ec.message()));
  }
  uint64_t      part_size = (total + part_count - 1) / part_count;
  auto          base      = BasePath(file_path);

  std::ifstream in(file_path, std::ios::binary);
  if (!in) {
    throw BackupError(BackupErrorKind::IO, "Cannot open archive for splitting: " +
                                               file_path.string());
  }

  std::vector<file_path_t> parts;
  try {
    for (uint32_t i = 1; i <= part_count; ++i) {
      auto          part_path = PartPath(base, i);
      std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
      if (!out) {
        throw BackupError(BackupErrorKind::IO, "Cannot create part " + part_path.string());
      }
      parts.push_back(part_path);
      uint64_t start = static_cast<uint64_t>(i - 1) * part_size;
      uint64_t want  = start >= total ? 0 : std::min(part_size, total - start);
      if (CopyBytes(in, out, want) != want) {
        throw BackupError(BackupErrorKind::IO, "Archive ended early while writing " +
                                                   part_path.string());
      }
      out.close();
      if (!out) {
        throw BackupError(BackupErrorKind::IO, "Cannot finish part " + part_path.string());
      }
      Logger::Archive()->debug("Wrote part {} ({} bytes)", part_path.filename().string(), want);
    }
    // Higher-numbered parts left by an earlier split of the same base would join the merge
    for (const auto& stale : ListParts(parts.front())) {
      if (PartIndex(stale) <= part_count) continue;
      if (!std::filesystem::remove(stale, ec) || ec) {
        throw BackupError(BackupErrorKind::IO, "Cannot remove stale part " + stale.string());
      }
      Logger::Archive()->info("Removed stale part {}", stale.filename().string());
    }
  } catch (const std::exception&) {
    for (const auto& part : parts) {
      std::filesystem::remove(part, ec);
    }
    throw;
  }
  in.close();

  if (!std::filesystem::remove(file_path, ec) || ec) {
    throw BackupError(BackupErrorKind::IO, "Cannot remove the unsplit archive " +
                                               file_path.string());
  }
  Logger::Archive()->info("Split {} into {} parts", file_path.filename().string(), part_count);
  return parts;
}

auto PartSplitter::ListParts(const file_path_t& first_part) -> std::vector<file_path_t> {
  auto                     base_name = BasePath(first_part).filename().string();
  auto                     dir       = first_part.parent_path();
  std::vector<file_path_t> parts;
  std::error_code          ec;
  for (const auto& entry : std::filesystem::directory_iterator(dir.empty() ? "." : dir, ec)) {
    if (!entry.is_regular_file()) continue;
    auto name = entry.path().filename().string();
    if (!IsPartPath(entry.path())) continue;
    if (std::regex_replace(name, kPartSuffix, "") != base_name) continue;
    parts.push_back(entry.path());
  }
  if (ec) {
    throw BackupError(BackupErrorKind::IO,
                      fmt::format("Cannot list {}: {}", dir.string(), ec.message()));
  }
  std::sort(parts.begin(), parts.end(), [](const file_path_t& lhs, const file_path_t& rhs) {
    return lhs.filename().string() < rhs.filename().string();
  });
  return parts;
}

auto PartSplitter::Merge(const file_path_t& first_part, std::optional<file_path_t> output)
    -> file_path_t {
  auto parts = ListParts(first_part);
  if (parts.empty()) {
    throw BackupError(BackupErrorKind::FORMAT, "No archive parts found for " +
                                                   first_part.string());
  }
  for (size_t i = 0; i < parts.size(); ++i) {
    if (PartIndex(parts[i]) != i + 1) {
      throw BackupError(BackupErrorKind::FORMAT,
                        fmt::format("Archive part {:02} is missing (found {})", i + 1,
                                    parts[i].filename().string()));
    }
  }

  file_path_t merged = output.value_or(file_path_t(BasePath(first_part).string() + "_merged.zip"));
  try {
    std::ofstream out(merged, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw BackupError(BackupErrorKind::IO, "Cannot create merged archive " + merged.string());
    }
    for (const auto& part : parts) {
      std::ifstream in(part, std::ios::binary);
      if (!in) {
        throw BackupError(BackupErrorKind::IO, "Cannot open part " + part.string());
      }
      CopyBytes(in, out, UINT64_MAX);
    }
    out.close();
    if (!out) {
      throw BackupError(BackupErrorKind::IO, "Cannot finish merged archive " + merged.string());
    }
  } catch (const std::exception&) {
    std::error_code ec;
    std::filesystem::remove(merged, ec);
    throw;
  }
  Logger::Archive()->info("Merged {} parts into {}", parts.size(), merged.string());
  return merged;
}
};  // namespace arcvault
