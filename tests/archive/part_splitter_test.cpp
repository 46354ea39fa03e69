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

#include "archive/archive_types.hpp"
#include "archive/part_splitter.hpp"
#include "archive_test_fixation.hpp"

namespace arcvault {
TEST(PartSplitterNamingTest, PartPathsAndBases) {
  EXPECT_EQ(PartSplitter::PartPath("/backups/arc_2026", 1).string(),
            "/backups/arc_2026.arc.part01");
  EXPECT_EQ(PartSplitter::PartPath("/backups/arc_2026", 12).string(),
            "/backups/arc_2026.arc.part12");
  EXPECT_TRUE(PartSplitter::IsPartPath("/backups/arc_2026.arc.part03"));
  EXPECT_FALSE(PartSplitter::IsPartPath("/backups/arc_2026.zip"));
  EXPECT_EQ(PartSplitter::BasePath("/backups/arc_2026.arc.part03").string(), "/backups/arc_2026");
  EXPECT_EQ(PartSplitter::BasePath("/backups/arc_2026.zip").string(), "/backups/arc_2026");
  EXPECT_EQ(PartSplitter::BasePath("/backups/arc_2026.arc").string(), "/backups/arc_2026");
}

TEST_F(ArchiveTests, SplitThenMergeIsByteIdentical) {
  auto archive = out_dir_ / "backup.zip";
  auto content = Noise(100003, 7);
  WriteFile(archive, content);

  auto parts = PartSplitter::Split(archive, 4);
  ASSERT_EQ(parts.size(), 4u);
  EXPECT_FALSE(std::filesystem::exists(archive));
  uint64_t total = 0;
  for (const auto& part : parts) total += std::filesystem::file_size(part);
  EXPECT_EQ(total, content.size());
  EXPECT_EQ(std::filesystem::file_size(parts[0]), 25001u);
  EXPECT_EQ(parts[0].filename().string(), "backup.arc.part01");

  auto merged = PartSplitter::Merge(parts[0]);
  EXPECT_EQ(merged.string(), (out_dir_ / "backup_merged.zip").string());
  EXPECT_EQ(ReadFile(merged), content);
  for (const auto& part : parts) EXPECT_TRUE(std::filesystem::exists(part));
}

TEST_F(ArchiveTests, ResplitWithFewerPartsDropsStaleParts) {
  auto archive = out_dir_ / "backup.zip";
  WriteFile(archive, std::string(600, 'A'));
  ASSERT_EQ(PartSplitter::Split(archive, 6).size(), 6u);

  WriteFile(archive, std::string(400, 'B'));
  auto parts = PartSplitter::Split(archive, 4);
  ASSERT_EQ(parts.size(), 4u);
  EXPECT_EQ(PartSplitter::ListParts(parts[0]).size(), 4u);
  EXPECT_FALSE(std::filesystem::exists(PartSplitter::PartPath(out_dir_ / "backup", 5)));
  EXPECT_FALSE(std::filesystem::exists(PartSplitter::PartPath(out_dir_ / "backup", 6)));

  auto merged = PartSplitter::Merge(parts[0]);
  EXPECT_EQ(ReadFile(merged), std::string(400, 'B'));
}

TEST_F(ArchiveTests, SplitHandlesFilesSmallerThanPartCount) {
  auto archive = out_dir_ / "tiny.zip";
  WriteFile(archive, "abc");
  auto parts = PartSplitter::Split(archive, 5);
  ASSERT_EQ(parts.size(), 5u);
  EXPECT_EQ(std::filesystem::file_size(parts[4]), 0u);

  auto merged = PartSplitter::Merge(parts[2], out_dir_ / "tiny_again.zip");
  EXPECT_EQ(ReadFile(merged), "abc");
}

TEST_F(ArchiveTests, SplitRejectsSinglePart) {
  auto archive = out_dir_ / "single.zip";
  WriteFile(archive, "content");
  EXPECT_THROW(PartSplitter::Split(archive, 1), std::invalid_argument);
  EXPECT_TRUE(std::filesystem::exists(archive));
}

TEST_F(ArchiveTests, MergeDetectsMissingPart) {
  auto archive = out_dir_ / "gap.zip";
  WriteFile(archive, Noise(4096, 3));
  auto parts = PartSplitter::Split(archive, 3);
  std::filesystem::remove(parts[1]);

  try {
    PartSplitter::Merge(parts[0]);
    FAIL() << "merge of an incomplete part set succeeded";
  } catch (const BackupError& e) {
    EXPECT_EQ(e.Kind(), BackupErrorKind::FORMAT);
  }
  EXPECT_FALSE(std::filesystem::exists(out_dir_ / "gap_merged.zip"));
}

TEST_F(ArchiveTests, MergeWithoutPartsFails) {
  try {
    PartSplitter::Merge(out_dir_ / "none.arc.part01");
    FAIL() << "merge without parts succeeded";
  } catch (const BackupError& e) {
    EXPECT_EQ(e.Kind(), BackupErrorKind::FORMAT);
  }
}
}  // namespace arcvault
