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

#include "archive/restore_coordinator.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <fmt/format.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "archive/part_splitter.hpp"
#include "type/hash_type.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/log/logger.hpp"

namespace arcvault {
namespace {
using ArchiveReader = std::unique_ptr<struct archive, decltype(&archive_read_free)>;

/**
 * @brief Removes the registered temporary paths when the restore scope ends.
 */
class TempPaths {
 private:
  std::vector<std::filesystem::path> _paths;

 public:
  TempPaths() = default;
  TempPaths(const TempPaths&)            = delete;
  TempPaths& operator=(const TempPaths&) = delete;
  ~TempPaths() {
    for (const auto& path : _paths) {
      std::error_code ec;
      std::filesystem::remove_all(path, ec);
      if (ec) {
        Logger::Archive()->warn("Could not remove temporary {}: {}", path.string(), ec.message());
      }
    }
  }
  void Add(std::filesystem::path path) { _paths.push_back(std::move(path)); }
};

auto ReaderError(struct archive* a, const std::string& context) -> BackupError {
  const char* err = archive_error_string(a);
  return BackupError(BackupErrorKind::FORMAT,
                     fmt::format("{}: {}", context, err ? err : "corrupt archive"));
}

/**
 * @brief Relative path of an archive entry, or empty if the entry would escape dest
 */
auto SafeEntryPath(const std::string& name) -> std::filesystem::path {
  std::filesystem::path entry(name);
  if (name.empty() || entry.is_absolute() || entry.has_root_name() || name.front() == '/' ||
      name.front() == '\\') {
    return {};
  }
  for (const auto& part : entry) {
    if (part == "..") return {};
  }
  return entry.lexically_normal();
}

auto CopyTree(const std::filesystem::path& src, const std::filesystem::path& dest) -> uint64_t {
  uint64_t        copied = 0;
  std::error_code ec;
  for (auto it = std::filesystem::recursive_directory_iterator(src, ec);
       !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    auto relative = std::filesystem::relative(it->path(), src);
    if (it.depth() == 0 && relative == kDatabaseFolder) {
      it.disable_recursion_pending();
      continue;
    }
    auto target = dest / relative;
    if (it->is_directory()) {
      std::filesystem::create_directories(target);
    } else if (it->is_regular_file()) {
      std::filesystem::create_directories(target.parent_path());
      std::filesystem::copy_file(it->path(), target,
                                 std::filesystem::copy_options::overwrite_existing);
      ++copied;
    }
  }
  if (ec) {
    throw BackupError(BackupErrorKind::IO,
                      fmt::format("Cannot walk {}: {}", src.string(), ec.message()));
  }
  return copied;
}
};  // namespace

RestoreCoordinator::RestoreCoordinator(std::filesystem::path temp_dir)
    : _temp_dir(temp_dir.empty() ? std::filesystem::temp_directory_path() : std::move(temp_dir)) {}

auto RestoreCoordinator::ExtractArchive(const std::filesystem::path& archive_path,
                                        const std::filesystem::path& dest) -> uint64_t {
  ArchiveReader reader(archive_read_new(), &archive_read_free);
  if (!reader) {
    throw BackupError(BackupErrorKind::IO, "Cannot allocate archive reader");
  }
  struct archive* a = reader.get();
  archive_read_support_format_zip(a);
  if (archive_read_open_filename(a, archive_path.string().c_str(), 10240) != ARCHIVE_OK) {
    throw ReaderError(a, "Cannot open archive " + archive_path.string());
  }

  uint64_t              files = 0;
  struct archive_entry* entry = nullptr;
  std::vector<char>     buffer(64 * 1024);
  while (true) {
    int rc = archive_read_next_header(a, &entry);
    if (rc == ARCHIVE_EOF) break;
    if (rc < ARCHIVE_WARN) {
      throw ReaderError(a, "Cannot read archive entry");
    }
    const char* raw_name = archive_entry_pathname(entry);
    auto        relative = SafeEntryPath(raw_name ? raw_name : "");
    if (relative.empty()) {
      throw BackupError(BackupErrorKind::FORMAT,
                        fmt::format("Unsafe archive entry \"{}\"", raw_name ? raw_name : ""));
    }
    auto target = dest / relative;
    if (archive_entry_filetype(entry) == AE_IFDIR) {
      std::filesystem::create_directories(target);
      continue;
    }
    if (archive_entry_filetype(entry) != AE_IFREG) {
      Logger::Archive()->warn("Skipping non-regular archive entry {}", relative.string());
      continue;
    }
    std::filesystem::create_directories(target.parent_path());
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw BackupError(BackupErrorKind::IO, "Cannot create " + target.string());
    }
    while (true) {
      la_ssize_t got = archive_read_data(a, buffer.data(), buffer.size());
      if (got == 0) break;
      if (got < 0) {
        throw ReaderError(a, "Cannot read data of " + relative.string());
      }
      out.write(buffer.data(), got);
      if (!out) {
        throw BackupError(BackupErrorKind::IO, "Cannot write " + target.string());
      }
    }
    ++files;
  }
  return files;
}

/**
 * @brief Merge parts if needed, unpack into a fresh temporary folder, read the catalog entry,
 * copy everything else into the target directory, clean up.
 *
 * @param request
 * @return RestoreResult
 */
auto RestoreCoordinator::RestoreBackup(const RestoreRequest& request) -> RestoreResult {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(request.archive_path_, ec)) {
    throw BackupError(BackupErrorKind::IO,
                      "Archive not found: " + request.archive_path_.string());
  }
  std::filesystem::create_directories(_temp_dir, ec);
  if (ec) {
    throw BackupError(BackupErrorKind::IO, fmt::format("Cannot create temp directory {}: {}",
                                                       _temp_dir.string(), ec.message()));
  }

  TempPaths temp;
  auto      stamp        = TimeProvider::NowMillis();
  auto      archive_path = request.archive_path_;
  if (PartSplitter::IsPartPath(archive_path)) {
    Logger::Archive()->info("Merging archive parts of {}", archive_path.string());
    auto merged = _temp_dir / fmt::format("arc_merged_{}.zip", stamp);
    temp.Add(merged);
    archive_path = PartSplitter::Merge(archive_path, merged);
  }

  if (request.expected_checksum_ && !request.expected_checksum_->empty()) {
    auto actual = Checksum64::ComputeFile(archive_path).ToString();
    if (actual != *request.expected_checksum_) {
      throw BackupError(BackupErrorKind::FORMAT,
                        fmt::format("Archive checksum mismatch: expected {}, got {}",
                                    *request.expected_checksum_, actual));
    }
  }

  auto extract_dir = _temp_dir / fmt::format("arc_restore_{}", stamp);
  temp.Add(extract_dir);
  std::filesystem::create_directories(extract_dir);
  auto extracted = ExtractArchive(archive_path, extract_dir);
  Logger::Archive()->info("Extracted {} entries from {}", extracted, archive_path.string());

  RestoreResult result;
  auto          db_entry = extract_dir / kDatabaseFolder / "arc_database.json";
  if (std::filesystem::is_regular_file(db_entry, ec)) {
    std::ifstream      in(db_entry, std::ios::binary);
    std::ostringstream content;
    content << in.rdbuf();
    if (!in && !in.eof()) {
      throw BackupError(BackupErrorKind::IO, "Cannot read catalog entry " + db_entry.string());
    }
    result.serialized_store_ = content.str();
  } else {
    Logger::Archive()->info("Archive carries no catalog entry");
  }

  std::filesystem::create_directories(request.target_dir_, ec);
  if (ec) {
    throw BackupError(BackupErrorKind::IO, fmt::format("Cannot create {}: {}",
                                                       request.target_dir_.string(),
                                                       ec.message()));
  }
  result.files_restored_ = CopyTree(extract_dir, request.target_dir_);
  result.success_        = true;
  Logger::Archive()->info("Restored {} files into {}", result.files_restored_,
                          request.target_dir_.string());
  return result;
}
};  // namespace arcvault
