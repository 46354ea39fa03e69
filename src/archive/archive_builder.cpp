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

#include "archive/archive_builder.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "archive/part_splitter.hpp"
#include "type/hash_type.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/log/logger.hpp"

namespace arcvault {
namespace {
constexpr size_t kChunkSize = 64 * 1024;

using ArchiveWriter         = std::unique_ptr<struct archive, decltype(&archive_write_free)>;

auto WriterError(struct archive* a, const std::string& context) -> BackupError {
  const char* err = archive_error_string(a);
  return BackupError(BackupErrorKind::IO,
                     fmt::format("{}: {}", context, err ? err : "unknown archive error"));
}

/**
 * @brief True if candidate is the archive being written or one of its parts
 */
auto IsOwnOutput(const std::filesystem::path& candidate, const std::filesystem::path& output)
    -> bool {
  if (output.empty()) return false;
  std::error_code ec;
  if (std::filesystem::equivalent(candidate, output, ec)) return true;
  return PartSplitter::IsPartPath(candidate) &&
         PartSplitter::BasePath(candidate) == PartSplitter::BasePath(output);
}

void WriteHeader(struct archive* a, const std::string& name, uint64_t size, time_t mtime) {
  std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)> entry(archive_entry_new(),
                                                                             &archive_entry_free);
  archive_entry_set_pathname(entry.get(), name.c_str());
  archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));
  archive_entry_set_filetype(entry.get(), AE_IFREG);
  archive_entry_set_perm(entry.get(), 0644);
  archive_entry_set_mtime(entry.get(), mtime, 0);
  if (archive_write_header(a, entry.get()) < ARCHIVE_OK) {
    throw WriterError(a, "Cannot write archive entry header for " + name);
  }
}

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  if (std::filesystem::remove(path, ec)) {
    Logger::Archive()->info("Removed partial output {}", path.string());
  } else if (ec) {
    Logger::Archive()->warn("Could not remove partial output {}: {}", path.string(), ec.message());
  }
}
};  // namespace

ArchiveBuilder::ArchiveBuilder(int compression_level, ProgressCallback progress)
    : _compression_level(compression_level), _progress(std::move(progress)) {}

void ArchiveBuilder::EmitProgress(uint64_t processed, uint64_t total) {
  if (!_progress) return;
  BackupProgress progress;
  progress.processed_bytes_ = processed;
  progress.total_bytes_     = total;
  progress.percent_ =
      total == 0 ? 100u
                 : static_cast<uint32_t>(std::min<uint64_t>(100, (processed * 100 + total / 2) / total));
  _progress(progress);
}

auto ArchiveBuilder::ScanDirectory(const std::filesystem::path& dir,
                                   const std::filesystem::path& skip) -> DirectoryStats {
  DirectoryStats  stats;
  std::error_code ec;
  for (auto it = std::filesystem::recursive_directory_iterator(dir, ec);
       !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file() || IsOwnOutput(it->path(), skip)) continue;
    stats.total_bytes_ += it->file_size();
    ++stats.files_count_;
  }
  if (ec) {
    throw BackupError(BackupErrorKind::IO,
                      fmt::format("Cannot walk {}: {}", dir.string(), ec.message()));
  }
  return stats;
}

/**
 * @brief Create a backup archive of request.working_dir_ at request.output_path_.
 *
 * @param request
 * @return BackupResult
 * @throws BackupError DIRECTORY_UNAVAILABLE if the working directory cannot be read, IO on any
 * write or split failure
 */
auto ArchiveBuilder::CreateBackup(const BackupRequest& request) -> BackupResult {
  auto            started = std::chrono::steady_clock::now();
  const auto&     output  = request.output_path_;
  std::error_code ec;
  if (!std::filesystem::is_directory(request.working_dir_, ec)) {
    throw BackupError(BackupErrorKind::DIRECTORY_UNAVAILABLE,
                      "Working directory is unavailable: " + request.working_dir_.string());
  }
  if (output.empty()) {
    throw BackupError(BackupErrorKind::IO, "Backup output path is empty");
  }
  uint32_t part_count = std::max<uint32_t>(request.part_count_, 1);

  auto     stats      = ScanDirectory(request.working_dir_, output);
  Logger::Archive()->info("Backing up {} ({} files, {} bytes) to {}", request.working_dir_.string(),
                          stats.files_count_, stats.total_bytes_, output.string());

  if (output.has_parent_path()) {
    std::filesystem::create_directories(output.parent_path(), ec);
    if (ec) {
      throw BackupError(BackupErrorKind::IO, fmt::format("Cannot create {}: {}",
                                                         output.parent_path().string(),
                                                         ec.message()));
    }
  }

  BackupResult result;
  bool         output_opened = false;
  try {
    ArchiveWriter writer(archive_write_new(), &archive_write_free);
    if (!writer) {
      throw BackupError(BackupErrorKind::IO, "Cannot allocate archive writer");
    }
    struct archive* a = writer.get();
    if (archive_write_set_format_zip(a) != ARCHIVE_OK) {
      throw WriterError(a, "ZIP format is unavailable");
    }
    if (archive_write_set_format_option(a, "zip", "compression", "deflate") < ARCHIVE_OK) {
      throw WriterError(a, "Deflate compression is unavailable");
    }
    auto level = std::to_string(_compression_level);
    if (archive_write_set_format_option(a, "zip", "compression-level", level.c_str()) <
        ARCHIVE_OK) {
      Logger::Archive()->warn("Compression level {} not applied: {}", level,
                              archive_error_string(a) ? archive_error_string(a) : "unsupported");
    }
    output_opened = true;
    if (archive_write_open_filename(a, output.string().c_str()) != ARCHIVE_OK) {
      throw WriterError(a, "Cannot open " + output.string());
    }

    auto now = static_cast<time_t>(TimeProvider::NowMillis() / 1000);
    WriteHeader(a, kDatabaseEntryName, request.serialized_store_.size(), now);
    if (archive_write_data(a, request.serialized_store_.data(),
                           request.serialized_store_.size()) < 0) {
      throw WriterError(a, "Cannot write catalog entry");
    }

    uint64_t          processed = 0;
    std::vector<char> buffer(kChunkSize);
    EmitProgress(0, stats.total_bytes_);
    for (auto it = std::filesystem::recursive_directory_iterator(request.working_dir_, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
      if (!it->is_regular_file() || IsOwnOutput(it->path(), output)) continue;
      auto relative = std::filesystem::relative(it->path(), request.working_dir_).generic_string();
      WriteHeader(a, relative, it->file_size(), now);

      std::ifstream in(it->path(), std::ios::binary);
      if (!in) {
        throw BackupError(BackupErrorKind::IO, "Cannot read " + it->path().string());
      }
      while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = in.gcount();
        if (got <= 0) break;
        if (archive_write_data(a, buffer.data(), static_cast<size_t>(got)) < 0) {
          throw WriterError(a, "Cannot write " + relative);
        }
        processed += static_cast<uint64_t>(got);
        EmitProgress(processed, stats.total_bytes_);
      }
      if (in.bad()) {
        throw BackupError(BackupErrorKind::IO, "Read failed for " + it->path().string());
      }
      Logger::Archive()->trace("Added {}", relative);
    }
    if (ec) {
      throw BackupError(BackupErrorKind::IO, fmt::format("Cannot walk {}: {}",
                                                         request.working_dir_.string(),
                                                         ec.message()));
    }
    if (archive_write_close(a) != ARCHIVE_OK) {
      throw WriterError(a, "Cannot finalize " + output.string());
    }
    writer.reset();

    result.size_        = std::filesystem::file_size(output);
    result.files_count_ = stats.files_count_;
    auto checksum       = Checksum64::ComputeFile(output).ToString();

    if (part_count > 1) {
      result.output_files_ = PartSplitter::Split(output, part_count);
    } else {
      result.output_files_ = {output};
    }

    auto& manifest        = result.manifest_;
    manifest.date_        = TimeProvider::NowIso();
    manifest.working_dir_ = request.working_dir_;
    manifest.total_size_  = result.size_;
    manifest.files_count_ = stats.files_count_;
    manifest.parts_       = part_count;
    manifest.checksum_    = checksum;
    for (const auto& file : result.output_files_) {
      manifest.part_files_.push_back(file.filename().string());
    }
    manifest.archive_name_ = manifest.part_files_.front();
  } catch (const std::exception& e) {
    Logger::Archive()->error("Backup to {} failed: {}", output.string(), e.what());
    // Split cleans up its own parts; earlier backups under the same base stay untouched
    if (output_opened) {
      RemoveQuietly(output);
    }
    for (const auto& file : result.output_files_) {
      RemoveQuietly(file);
    }
    throw;
  }

  result.duration_ = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  Logger::Archive()->info("Backup finished: {} bytes in {} part(s), {} ms", result.size_,
                          part_count, result.duration_.count());
  return result;
}
};  // namespace arcvault
