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

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "archive/archive_builder.hpp"
#include "archive/part_splitter.hpp"
#include "archive/plain_zip.hpp"
#include "archive/restore_coordinator.hpp"
#include "archive_test_fixation.hpp"
#include "type/hash_type.hpp"

namespace arcvault {
namespace {
const std::string kStorePayload =
    R"({"cards": [{"id": "card_1", "fileName": "a.jpg"}], "version": "1.0"})";
};  // namespace

TEST_F(ArchiveTests, BackupRestoreRoundTrip) {
  WriteFile(work_dir_ / "2024" / "05" / "17" / "a.jpg", Noise(70000, 1));
  WriteFile(work_dir_ / "2024" / "05" / "18" / "b.png", Noise(1234, 2));
  WriteFile(work_dir_ / "_cache" / "thumbs" / "a.webp", "thumb");
  WriteFile(work_dir_ / "notes.txt", "");
  auto original = Snapshot(work_dir_);

  std::vector<BackupProgress> events;
  ArchiveBuilder              builder(6, [&](const BackupProgress& p) { events.push_back(p); });
  BackupRequest               request;
  request.output_path_      = out_dir_ / "backup.zip";
  request.working_dir_      = work_dir_;
  request.serialized_store_ = kStorePayload;
  auto result               = builder.CreateBackup(request);

  EXPECT_EQ(result.files_count_, 4u);
  EXPECT_EQ(result.size_, std::filesystem::file_size(request.output_path_));
  ASSERT_EQ(result.output_files_.size(), 1u);
  EXPECT_EQ(result.manifest_.parts_, 1u);
  EXPECT_EQ(result.manifest_.archive_name_, "backup.zip");
  EXPECT_EQ(result.manifest_.version_, "1.0");
  EXPECT_EQ(result.manifest_.checksum_, Checksum64::ComputeFile(request.output_path_).ToString());
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back().percent_, 100u);
  EXPECT_EQ(events.back().processed_bytes_, events.back().total_bytes_);

  auto          target = test_dir_ / "restored";
  RestoreCoordinator coordinator(temp_dir_);
  RestoreRequest     restore;
  restore.archive_path_      = request.output_path_;
  restore.target_dir_        = target;
  restore.expected_checksum_ = result.manifest_.checksum_;
  auto restored              = coordinator.RestoreBackup(restore);

  EXPECT_TRUE(restored.success_);
  ASSERT_TRUE(restored.serialized_store_.has_value());
  EXPECT_EQ(*restored.serialized_store_, kStorePayload);
  EXPECT_EQ(restored.files_restored_, 4u);
  EXPECT_EQ(Snapshot(target), original);
  EXPECT_FALSE(std::filesystem::exists(target / kDatabaseFolder));
  EXPECT_TRUE(std::filesystem::is_empty(temp_dir_));
}

TEST_F(ArchiveTests, FiftyFilesInFourParts) {
  for (int i = 0; i < 50; ++i) {
    WriteFile(work_dir_ / "shots" / ("img_" + std::to_string(i) + ".raw"), Noise(2000 + i * 37, i));
  }
  auto           original = Snapshot(work_dir_);

  ArchiveBuilder builder;
  BackupRequest  request;
  request.output_path_      = out_dir_ / "arc_backup.zip";
  request.working_dir_      = work_dir_;
  request.part_count_       = 4;
  request.serialized_store_ = kStorePayload;
  auto result               = builder.CreateBackup(request);

  ASSERT_EQ(result.output_files_.size(), 4u);
  EXPECT_FALSE(std::filesystem::exists(request.output_path_));
  uint64_t total = 0;
  for (const auto& part : result.output_files_) total += std::filesystem::file_size(part);
  EXPECT_EQ(total, result.size_);
  EXPECT_EQ(result.manifest_.total_size_, result.size_);
  EXPECT_EQ(result.manifest_.files_count_, 50u);
  EXPECT_EQ(result.manifest_.part_files_.front(), "arc_backup.arc.part01");

  size_t parts_on_disk = 0;
  for (const auto& entry : std::filesystem::directory_iterator(out_dir_)) {
    EXPECT_TRUE(PartSplitter::IsPartPath(entry.path())) << entry.path().string();
    ++parts_on_disk;
  }
  EXPECT_EQ(parts_on_disk, 4u);

  RestoreCoordinator coordinator(temp_dir_);
  RestoreRequest     restore;
  restore.archive_path_      = result.output_files_.front();
  restore.target_dir_        = test_dir_ / "restored";
  restore.expected_checksum_ = result.manifest_.checksum_;
  auto restored              = coordinator.RestoreBackup(restore);
  EXPECT_EQ(restored.files_restored_, 50u);
  EXPECT_EQ(Snapshot(restore.target_dir_), original);
  EXPECT_TRUE(std::filesystem::is_empty(temp_dir_));
}

TEST_F(ArchiveTests, EmptyWorkingDirectoryReportsFullProgress) {
  std::vector<BackupProgress> events;
  ArchiveBuilder              builder(9, [&](const BackupProgress& p) { events.push_back(p); });
  BackupRequest               request;
  request.output_path_ = out_dir_ / "empty.zip";
  request.working_dir_ = work_dir_;
  auto result          = builder.CreateBackup(request);

  EXPECT_EQ(result.files_count_, 0u);
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back().percent_, 100u);
}

TEST_F(ArchiveTests, MissingWorkingDirectoryFailsUpFront) {
  ArchiveBuilder builder;
  BackupRequest  request;
  request.output_path_ = out_dir_ / "never.zip";
  request.working_dir_ = test_dir_ / "does_not_exist";
  try {
    builder.CreateBackup(request);
    FAIL() << "backup of a missing directory succeeded";
  } catch (const BackupError& e) {
    EXPECT_EQ(e.Kind(), BackupErrorKind::DIRECTORY_UNAVAILABLE);
  }
  EXPECT_FALSE(std::filesystem::exists(request.output_path_));
}

TEST_F(ArchiveTests, FailedBackupLeavesNoPartialOutput) {
  WriteFile(work_dir_ / "big.bin", Noise(300000, 5));
  ArchiveBuilder builder(9, [](const BackupProgress& p) {
    if (p.processed_bytes_ > 0) throw std::runtime_error("disk full");
  });
  BackupRequest request;
  request.output_path_ = out_dir_ / "partial.zip";
  request.working_dir_ = work_dir_;
  request.part_count_  = 3;
  EXPECT_THROW(builder.CreateBackup(request), std::runtime_error);
  EXPECT_TRUE(std::filesystem::is_empty(out_dir_));
}

TEST_F(ArchiveTests, FailedBackupKeepsEarlierPartsOfSameBase) {
  auto earlier = PartSplitter::PartPath(out_dir_ / "nightly", 1);
  WriteFile(earlier, "earlier backup bytes");
  WriteFile(work_dir_ / "big.bin", Noise(300000, 6));
  ArchiveBuilder builder(9, [](const BackupProgress& p) {
    if (p.processed_bytes_ > 0) throw std::runtime_error("disk full");
  });
  BackupRequest request;
  request.output_path_ = out_dir_ / "nightly.zip";
  request.working_dir_ = work_dir_;
  request.part_count_  = 3;
  EXPECT_THROW(builder.CreateBackup(request), std::runtime_error);

  EXPECT_FALSE(std::filesystem::exists(request.output_path_));
  ASSERT_TRUE(std::filesystem::exists(earlier));
  EXPECT_EQ(ReadFile(earlier), "earlier backup bytes");
}

TEST_F(ArchiveTests, RestoreOfArchiveWithoutCatalogEntry) {
  auto archive = out_dir_ / "manual.zip";
  WritePlainZip(archive, {{"2024/05/17/a.jpg", "jpeg bytes"}, {"notes.txt", "hello"}});

  auto               target = test_dir_ / "restored";
  RestoreCoordinator coordinator(temp_dir_);
  RestoreRequest     restore;
  restore.archive_path_ = archive;
  restore.target_dir_   = target;
  auto restored         = coordinator.RestoreBackup(restore);

  EXPECT_TRUE(restored.success_);
  EXPECT_FALSE(restored.serialized_store_.has_value());
  EXPECT_EQ(restored.files_restored_, 2u);
  EXPECT_EQ(ReadFile(target / "2024" / "05" / "17" / "a.jpg"), "jpeg bytes");
  EXPECT_EQ(ReadFile(target / "notes.txt"), "hello");
  EXPECT_TRUE(std::filesystem::is_empty(temp_dir_));
}

TEST_F(ArchiveTests, BackupInsideWorkingDirectorySkipsItself) {
  WriteFile(work_dir_ / "a.txt", "alpha");
  ArchiveBuilder builder;
  BackupRequest  request;
  request.output_path_ = work_dir_ / "self.zip";
  request.working_dir_ = work_dir_;
  auto result          = builder.CreateBackup(request);
  EXPECT_EQ(result.files_count_, 1u);

  auto target = test_dir_ / "restored";
  RestoreCoordinator coordinator(temp_dir_);
  RestoreRequest     restore;
  restore.archive_path_ = request.output_path_;
  restore.target_dir_   = target;
  auto restored         = coordinator.RestoreBackup(restore);
  EXPECT_EQ(restored.files_restored_, 1u);
  EXPECT_FALSE(std::filesystem::exists(target / "self.zip"));
}

TEST_F(ArchiveTests, RestoreOverwritesExistingFiles) {
  WriteFile(work_dir_ / "keep.txt", "fresh");
  ArchiveBuilder builder;
  BackupRequest  request;
  request.output_path_ = out_dir_ / "over.zip";
  request.working_dir_ = work_dir_;
  builder.CreateBackup(request);

  auto target = test_dir_ / "restored";
  WriteFile(target / "keep.txt", "stale content");
  WriteFile(target / "other.txt", "untouched");

  RestoreCoordinator coordinator(temp_dir_);
  RestoreRequest     restore;
  restore.archive_path_ = request.output_path_;
  restore.target_dir_   = target;
  auto restored         = coordinator.RestoreBackup(restore);
  EXPECT_EQ(ReadFile(target / "keep.txt"), "fresh");
  EXPECT_EQ(ReadFile(target / "other.txt"), "untouched");
  ASSERT_TRUE(restored.serialized_store_.has_value());
  EXPECT_TRUE(restored.serialized_store_->empty());
}

TEST_F(ArchiveTests, RestoreRejectsChecksumMismatch) {
  WriteFile(work_dir_ / "a.txt", "alpha");
  ArchiveBuilder builder;
  BackupRequest  request;
  request.output_path_ = out_dir_ / "sum.zip";
  request.working_dir_ = work_dir_;
  builder.CreateBackup(request);

  RestoreCoordinator coordinator(temp_dir_);
  RestoreRequest     restore;
  restore.archive_path_      = request.output_path_;
  restore.target_dir_        = test_dir_ / "restored";
  restore.expected_checksum_ = "0000000000000000";
  try {
    coordinator.RestoreBackup(restore);
    FAIL() << "restore with a wrong checksum succeeded";
  } catch (const BackupError& e) {
    EXPECT_EQ(e.Kind(), BackupErrorKind::FORMAT);
  }
  EXPECT_FALSE(std::filesystem::exists(restore.target_dir_));
}

TEST_F(ArchiveTests, RestoreRejectsCorruptArchive) {
  WriteFile(out_dir_ / "garbage.zip", "this is not a zip archive at all");
  RestoreCoordinator coordinator(temp_dir_);
  RestoreRequest     restore;
  restore.archive_path_ = out_dir_ / "garbage.zip";
  restore.target_dir_   = test_dir_ / "restored";
  EXPECT_THROW(coordinator.RestoreBackup(restore), BackupError);
  EXPECT_TRUE(std::filesystem::is_empty(temp_dir_));
}

TEST_F(ArchiveTests, RestoreOfMissingArchiveFails) {
  RestoreCoordinator coordinator(temp_dir_);
  RestoreRequest     restore;
  restore.archive_path_ = out_dir_ / "nothing.zip";
  restore.target_dir_   = test_dir_ / "restored";
  try {
    coordinator.RestoreBackup(restore);
    FAIL() << "restore of a missing archive succeeded";
  } catch (const BackupError& e) {
    EXPECT_EQ(e.Kind(), BackupErrorKind::IO);
  }
}
}  // namespace arcvault
