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

#include <algorithm>
#include <stdexcept>

#include "../storage/catalog_test_fixation.hpp"
#include "integrity/integrity_repairer.hpp"
#include "integrity/integrity_validator.hpp"

namespace arcvault {
class IntegrityTests : public CatalogTests {
 protected:
  static auto AllFilesPresent() -> FileExistsFn {
    return [](const std::filesystem::path&) { return true; };
  }

  auto Validate() -> ValidationReport {
    IntegrityValidator validator(Catalog(), AllFilesPresent());
    return validator.Validate();
  }

  auto Repair(const ValidationReport& report) -> uint32_t {
    IntegrityRepairer repairer(Catalog());
    return repairer.Repair(report.issues_);
  }

  static auto Find(const ValidationReport& report, IssueKind kind) -> const IntegrityIssue* {
    auto it = std::find_if(report.issues_.begin(), report.issues_.end(),
                           [kind](const IntegrityIssue& issue) { return issue.kind_ == kind; });
    return it == report.issues_.end() ? nullptr : &*it;
  }
};

TEST_F(IntegrityTests, CleanCatalogIsValid) {
  AddCategory("cat", "Mood");
  AddTag("tag_a", "A", "cat");
  Catalog().AddCard(MakeCard("card_1", "1.jpg", {"tag_a"}));
  AddCollection("col", "Refs", {"card_1"});
  Catalog().AddToMoodboard("card_1");

  auto report = Validate();
  EXPECT_TRUE(report.is_valid_);
  EXPECT_TRUE(report.issues_.empty());
}

TEST_F(IntegrityTests, StaleTagCountIsReportedAsOrphanedTag) {
  AddCategory("cat_style", "Style");
  AddTag("tag_minimal", "Minimal", "cat_style", 3);
  AddTag("tag_bold", "Bold", "cat_style", 0);

  auto report = Validate();
  ASSERT_EQ(report.issues_.size(), 1u);
  const auto& issue = report.issues_[0];
  EXPECT_EQ(issue.kind_, IssueKind::ORPHANED_TAG);
  EXPECT_EQ(issue.entity_id_, "tag_minimal");
  EXPECT_TRUE(issue.AutoFixable());
  EXPECT_FALSE(issue.description_.empty());
  EXPECT_TRUE(report.is_valid_);

  EXPECT_EQ(Repair(report), 1u);
  EXPECT_EQ(Catalog().GetTag("tag_minimal")->card_count_, 0u);
  EXPECT_EQ(Catalog().GetTag("tag_bold")->card_count_, 0u);
  EXPECT_TRUE(Validate().issues_.empty());
}

TEST_F(IntegrityTests, CardDeletedOutsideCascadeLeavesOrphanedCollection) {
  Catalog().AddCard(MakeCard("card_a", "a.jpg"));
  Catalog().AddCard(MakeCard("card_b", "b.jpg"));
  Catalog().AddCard(MakeCard("card_c", "c.jpg"));
  AddCollection("col_refs", "Refs", {"card_a", "card_b", "card_c"});

  // Simulate a crash between the card delete and its cascade
  {
    auto        guard = storage_->GetDBController().GetConnectionGuard();
    CardService cards(guard._conn);
    EXPECT_EQ(cards.RemoveById("card_b"), 1u);
  }

  auto report = Validate();
  auto issue  = Find(report, IssueKind::ORPHANED_COLLECTION);
  ASSERT_NE(issue, nullptr);
  EXPECT_EQ(issue->entity_id_, "col_refs");
  EXPECT_EQ(issue->affected_ids_, std::vector<std::string>{"card_b"});
  EXPECT_NE(issue->description_.find("1 of 3"), std::string::npos);

  Repair(report);
  EXPECT_EQ(Catalog().GetCollection("col_refs")->card_ids_,
            (std::vector<card_id_t>{"card_a", "card_c"}));
}

TEST_F(IntegrityTests, MissingFileIsReportedButNeverFixed) {
  Catalog().AddCard(MakeCard("card_a", "a.jpg"));

  IntegrityValidator validator(Catalog(), [](const std::filesystem::path& path) {
    return path.filename() != "a.jpg";
  });
  auto report = validator.Validate();
  ASSERT_EQ(report.issues_.size(), 1u);
  EXPECT_EQ(report.issues_[0].kind_, IssueKind::MISSING_FILE);
  EXPECT_EQ(report.issues_[0].severity_, IssueSeverity::ERROR);
  EXPECT_FALSE(report.issues_[0].AutoFixable());
  EXPECT_FALSE(report.is_valid_);
  EXPECT_EQ(report.FixableCount(), 0u);

  IntegrityRepairer repairer(Catalog());
  auto              result = repairer.RepairDetailed(report.issues_);
  EXPECT_EQ(result.fixed_, 0u);
  EXPECT_EQ(result.skipped_, 1u);
  EXPECT_TRUE(Catalog().GetCard("card_a").has_value());
}

TEST_F(IntegrityTests, FileCheckFailuresAreSkipped) {
  Catalog().AddCard(MakeCard("card_a", "a.jpg"));
  IntegrityValidator validator(Catalog(), [](const std::filesystem::path&) -> bool {
    throw std::runtime_error("volume not mounted");
  });
  auto report = validator.Validate();
  EXPECT_EQ(report.CountOf(IssueKind::MISSING_FILE), 0u);
  EXPECT_TRUE(report.is_valid_);
}

TEST_F(IntegrityTests, DeletedCategoryOrphansItsTags) {
  AddCategory("cat", "Mood");
  AddTag("tag_a", "A", "cat");
  Catalog().AddCard(MakeCard("card_1", "1.jpg", {"tag_a"}));
  {
    auto            guard = storage_->GetDBController().GetConnectionGuard();
    CategoryService categories(guard._conn);
    categories.RemoveById("cat");
  }

  auto report = Validate();
  auto issue  = Find(report, IssueKind::ORPHANED_TAG_CATEGORY);
  ASSERT_NE(issue, nullptr);
  EXPECT_EQ(issue->entity_id_, "tag_a");

  Repair(report);
  EXPECT_FALSE(Catalog().GetTag("tag_a").has_value());
  EXPECT_TRUE(Catalog().GetCard("card_1")->tags_.empty());
  EXPECT_TRUE(Validate().issues_.empty());
}

TEST_F(IntegrityTests, DanglingReferencesAreDetectedAndRepaired) {
  AddCategory("cat", "Mood");
  AddTag("tag_a", "A", "cat");
  AddTag("tag_b", "B", "cat");
  Catalog().AddCard(MakeCard("card_1", "1.jpg", {"tag_a", "tag_b"}));
  AddCollection("col", "Refs", {"card_1"});
  Catalog().AddToMoodboard("card_1");
  Catalog().AddCard(MakeCard("card_2", "2.jpg"));
  Catalog().AddToMoodboard("card_2");
  {
    auto              guard = storage_->GetDBController().GetConnectionGuard();
    TagService        tags(guard._conn);
    CollectionService collections(guard._conn);
    CardService       cards(guard._conn);
    tags.RemoveById("tag_b");
    collections.RemoveById("col");
    cards.RemoveById("card_2");
  }

  auto report = Validate();
  EXPECT_EQ(report.CountOf(IssueKind::DANGLING_CARD_REFERENCE), 1u);
  EXPECT_EQ(report.CountOf(IssueKind::ORPHANED_CATEGORY), 1u);
  EXPECT_EQ(report.CountOf(IssueKind::MOODBOARD_MISMATCH), 1u);
  auto dangling = Find(report, IssueKind::DANGLING_CARD_REFERENCE);
  ASSERT_NE(dangling, nullptr);
  EXPECT_EQ(dangling->affected_ids_, (std::vector<std::string>{"tag_b", "col"}));

  EXPECT_EQ(Repair(report), 3u);
  auto card = Catalog().GetCard("card_1");
  EXPECT_EQ(card->tags_, std::vector<tag_id_t>{"tag_a"});
  EXPECT_TRUE(card->collections_.empty());
  EXPECT_EQ(Catalog().GetCategory("cat")->tag_ids_, std::vector<tag_id_t>{"tag_a"});
  EXPECT_EQ(Catalog().GetMoodboard().card_ids_, std::vector<card_id_t>{"card_1"});
  EXPECT_TRUE(Validate().issues_.empty());
}

TEST_F(IntegrityTests, MoodboardFlagAndUnlistedTag) {
  AddCategory("cat", "Mood");
  AddTag("tag_a", "A", "cat");
  Catalog().AddCard(MakeCard("card_1", "1.jpg"));
  {
    auto            guard = storage_->GetDBController().GetConnectionGuard();
    CardService     cards(guard._conn);
    CategoryService categories(guard._conn);
    auto            card = cards.GetById("card_1");
    card->in_moodboard_  = true;
    cards.Update(*card, "card_1");
    auto category        = categories.GetById("cat");
    category->tag_ids_.clear();
    categories.Update(*category, "cat");
  }

  auto report = Validate();
  EXPECT_EQ(report.CountOf(IssueKind::MOODBOARD_FLAG_MISMATCH), 1u);
  EXPECT_EQ(report.CountOf(IssueKind::UNLISTED_TAG), 1u);

  EXPECT_EQ(Repair(report), 2u);
  EXPECT_FALSE(Catalog().GetCard("card_1")->in_moodboard_);
  EXPECT_EQ(Catalog().GetCategory("cat")->tag_ids_, std::vector<tag_id_t>{"tag_a"});
}

TEST_F(IntegrityTests, RepairIsIdempotentAndCountsMatchCards) {
  AddCategory("cat", "Mood");
  AddTag("tag_a", "A", "cat", 7);
  AddTag("tag_b", "B", "cat", 1);
  Catalog().AddCard(MakeCard("card_1", "1.jpg", {"tag_a"}));
  Catalog().AddCard(MakeCard("card_2", "2.jpg", {"tag_a", "tag_b"}));
  AddCollection("col", "Refs", {"card_1", "card_2"});
  Catalog().DeleteCard("card_2");
  {
    auto        guard = storage_->GetDBController().GetConnectionGuard();
    CardService cards(guard._conn);
    cards.RemoveById("card_1");
  }

  auto first = Validate();
  EXPECT_GT(first.FixableCount(), 0u);
  EXPECT_GT(Repair(first), 0u);
  auto after_first = Catalog().ExportSnapshot();

  auto second      = Validate();
  EXPECT_EQ(second.FixableCount(), 0u);
  EXPECT_EQ(Repair(second), 0u);
  auto after_second         = Catalog().ExportSnapshot();
  after_second.export_date_ = after_first.export_date_;
  EXPECT_EQ(after_second, after_first);

  for (const auto& tag : Catalog().ListTags()) {
    EXPECT_EQ(tag.card_count_, Catalog().GetCardsByTags({tag.id_}).size()) << tag.name_;
  }
}

TEST_F(IntegrityTests, ReportSerializesIssues) {
  AddCategory("cat_style", "Style");
  AddTag("tag_minimal", "Minimal", "cat_style", 3);

  auto j = Validate().ToJson();
  ASSERT_TRUE(j.contains("issues"));
  ASSERT_EQ(j["issues"].size(), 1u);
  EXPECT_EQ(j["issues"][0]["type"], "orphaned_tag");
  EXPECT_EQ(j["issues"][0]["severity"], "warning");
}
}  // namespace arcvault
