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

#include "catalog_test_fixation.hpp"

namespace arcvault {
namespace {
auto Ids(const std::vector<Card>& cards) -> std::vector<card_id_t> {
  std::vector<card_id_t> ids;
  for (const auto& card : cards) ids.push_back(card.id_);
  std::sort(ids.begin(), ids.end());
  return ids;
}
};  // namespace

TEST_F(CatalogTests, AddCardFillsDefaultsAndCountsTags) {
  AddCategory("cat_style", "Style");
  AddTag("tag_minimal", "Minimal", "cat_style");

  Card card;
  card.file_path_ = test_dir_ / "work" / "a.jpg";
  card.tags_      = {"tag_minimal", "tag_unknown"};
  auto id         = Catalog().AddCard(card);

  auto stored     = Catalog().GetCard(id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_FALSE(stored->id_.empty());
  EXPECT_EQ(stored->file_name_, "a.jpg");
  EXPECT_FALSE(stored->date_added_.empty());
  EXPECT_EQ(stored->tags_, std::vector<tag_id_t>{"tag_minimal"});
  EXPECT_EQ(Catalog().GetTag("tag_minimal")->card_count_, 1u);
}

TEST_F(CatalogTests, AddCardRejectsInvalidInput) {
  Card no_path;
  no_path.id_ = "card_x";
  EXPECT_THROW(Catalog().AddCard(no_path), std::invalid_argument);

  Catalog().AddCard(MakeCard("card_a", "a.jpg"));
  EXPECT_THROW(Catalog().AddCard(MakeCard("card_a", "again.jpg")), std::invalid_argument);
  EXPECT_EQ(Catalog().CountCards(), 1u);
}

TEST_F(CatalogTests, MissingIdsDegradeGracefully) {
  EXPECT_FALSE(Catalog().GetCard("nope").has_value());
  CardPatch patch;
  patch.file_name_ = "renamed.jpg";
  EXPECT_EQ(Catalog().UpdateCard("nope", patch), 0u);
  EXPECT_NO_THROW(Catalog().DeleteCard("nope"));
  EXPECT_NO_THROW(Catalog().DeleteTag("nope"));
  EXPECT_NO_THROW(Catalog().DeleteCategory("nope"));
  EXPECT_NO_THROW(Catalog().DeleteCollection("nope"));
  EXPECT_FALSE(Catalog().AddToMoodboard("nope"));
}

TEST_F(CatalogTests, UpdateCardAdjustsTagCounts) {
  AddCategory("cat", "Mood");
  AddTag("tag_a", "A", "cat");
  AddTag("tag_b", "B", "cat");
  Catalog().AddCard(MakeCard("card_1", "1.jpg", {"tag_a"}));

  CardPatch patch;
  patch.tags_ = std::vector<tag_id_t>{"tag_b"};
  EXPECT_EQ(Catalog().UpdateCard("card_1", patch), 1u);
  EXPECT_EQ(Catalog().GetTag("tag_a")->card_count_, 0u);
  EXPECT_EQ(Catalog().GetTag("tag_b")->card_count_, 1u);

  // Counts never go below zero
  patch.tags_ = std::vector<tag_id_t>{};
  Catalog().UpdateCard("card_1", patch);
  patch.tags_ = std::vector<tag_id_t>{};
  Catalog().UpdateCard("card_1", patch);
  EXPECT_EQ(Catalog().GetTag("tag_b")->card_count_, 0u);
  EXPECT_TRUE(Catalog().GetCard("card_1")->date_modified_.has_value());
}

TEST_F(CatalogTests, DeleteCardCascadesToCollectionsMoodboardAndPreviews) {
  Catalog().AddCard(MakeCard("card_a", "a.jpg"));
  Catalog().AddCard(MakeCard("card_b", "b.jpg"));
  AddCollection("col_1", "One", {"card_a", "card_b"});
  AddCollection("col_2", "Two", {"card_a"});
  Catalog().AddToMoodboard("card_a");
  Catalog().PutPreview("card_a", "/cache/_cache/thumbs/a.webp");

  EXPECT_TRUE(Catalog().GetCard("card_a")->InCollection("col_1"));

  Catalog().DeleteCard("card_a");

  EXPECT_FALSE(Catalog().GetCard("card_a").has_value());
  EXPECT_EQ(Catalog().GetCollection("col_1")->card_ids_, std::vector<card_id_t>{"card_b"});
  EXPECT_TRUE(Catalog().GetCollection("col_2")->card_ids_.empty());
  EXPECT_TRUE(Catalog().GetMoodboard().card_ids_.empty());
  EXPECT_FALSE(Catalog().GetPreview("card_a").has_value());
}

TEST_F(CatalogTests, DeleteCategoryRemovesTagsAndCardReferences) {
  AddCategory("cat_style", "Style");
  AddCategory("cat_place", "Place");
  AddTag("tag_minimal", "Minimal", "cat_style");
  AddTag("tag_bold", "Bold", "cat_style");
  AddTag("tag_city", "City", "cat_place");
  Catalog().AddCard(MakeCard("card_1", "1.jpg", {"tag_minimal", "tag_city"}));
  Catalog().AddCard(MakeCard("card_2", "2.jpg", {"tag_bold"}));

  EXPECT_EQ(Catalog().GetCategory("cat_style")->tag_ids_.size(), 2u);

  Catalog().DeleteCategory("cat_style");

  EXPECT_FALSE(Catalog().GetCategory("cat_style").has_value());
  EXPECT_FALSE(Catalog().GetTag("tag_minimal").has_value());
  EXPECT_FALSE(Catalog().GetTag("tag_bold").has_value());
  EXPECT_TRUE(Catalog().GetTag("tag_city").has_value());
  EXPECT_EQ(Catalog().GetCard("card_1")->tags_, std::vector<tag_id_t>{"tag_city"});
  EXPECT_TRUE(Catalog().GetCard("card_2")->tags_.empty());
}

TEST_F(CatalogTests, AddTagRequiresExistingCategory) {
  EXPECT_THROW(AddTag("tag_x", "X", "cat_missing"), std::invalid_argument);
  EXPECT_TRUE(Catalog().ListTags().empty());
}

TEST_F(CatalogTests, MoveTagToCategoryUpdatesBothSides) {
  AddCategory("cat_a", "A");
  AddCategory("cat_b", "B");
  AddTag("tag_1", "One", "cat_a");

  Catalog().MoveTagToCategory("tag_1", "cat_b");

  EXPECT_EQ(Catalog().GetTag("tag_1")->category_id_, "cat_b");
  EXPECT_TRUE(Catalog().GetCategory("cat_a")->tag_ids_.empty());
  EXPECT_EQ(Catalog().GetCategory("cat_b")->tag_ids_, std::vector<tag_id_t>{"tag_1"});

  EXPECT_THROW(Catalog().MoveTagToCategory("tag_1", "cat_missing"), std::invalid_argument);
  EXPECT_THROW(Catalog().MoveTagToCategory("tag_missing", "cat_a"), std::invalid_argument);
  EXPECT_NO_THROW(Catalog().MoveTagToCategory("tag_1", "cat_b"));
  EXPECT_EQ(Catalog().ListTagsByCategory("cat_b").size(), 1u);
}

TEST_F(CatalogTests, CategoriesKeepDisplayOrder) {
  AddCategory("cat_c", "C");
  AddCategory("cat_a", "A");
  AddCategory("cat_b", "B");

  CategoryPatch patch;
  patch.order_ = 10;
  Catalog().UpdateCategory("cat_c", patch);

  auto listed = Catalog().ListCategories();
  ASSERT_EQ(listed.size(), 3u);
  EXPECT_EQ(listed[0].id_, "cat_a");
  EXPECT_EQ(listed[1].id_, "cat_b");
  EXPECT_EQ(listed[2].id_, "cat_c");

  EXPECT_EQ(Catalog().FixCategoriesOrder(), 3u);
  EXPECT_EQ(Catalog().GetCategory("cat_c")->order_.value_or(-1), 2);
  EXPECT_EQ(Catalog().FixCategoriesOrder(), 0u);
}

TEST_F(CatalogTests, CollectionMembershipStaysInSync) {
  Catalog().AddCard(MakeCard("card_a", "a.jpg"));
  AddCollection("col_1", "One");
  AddCollection("col_2", "Two");

  EXPECT_TRUE(Catalog().AddCardToCollection("card_a", "col_1"));
  EXPECT_EQ(Catalog().GetCollection("col_1")->card_ids_, std::vector<card_id_t>{"card_a"});
  EXPECT_TRUE(Catalog().GetCard("card_a")->InCollection("col_1"));

  CardPatch patch;
  patch.collections_ = std::vector<collection_id_t>{"col_2"};
  Catalog().UpdateCardWithCollections("card_a", patch);
  EXPECT_TRUE(Catalog().GetCollection("col_1")->card_ids_.empty());
  EXPECT_EQ(Catalog().GetCollection("col_2")->card_ids_, std::vector<card_id_t>{"card_a"});

  EXPECT_TRUE(Catalog().RemoveCardFromCollection("card_a", "col_2"));
  EXPECT_TRUE(Catalog().GetCard("card_a")->collections_.empty());
  EXPECT_FALSE(Catalog().RemoveCardFromCollection("card_a", "col_2"));

  Catalog().AddCardToCollection("card_a", "col_1");
  Catalog().DeleteCollection("col_1");
  EXPECT_TRUE(Catalog().GetCard("card_a")->collections_.empty());
}

TEST_F(CatalogTests, MoodboardFlagMirrorsMembership) {
  Catalog().AddCard(MakeCard("card_a", "a.jpg"));
  auto pinned          = MakeCard("card_b", "b.jpg");
  pinned.in_moodboard_ = true;
  Catalog().AddCard(pinned);

  EXPECT_EQ(Catalog().GetMoodboard().card_ids_, std::vector<card_id_t>{"card_b"});
  EXPECT_TRUE(Catalog().AddToMoodboard("card_a"));
  EXPECT_TRUE(Catalog().GetCard("card_a")->in_moodboard_);
  EXPECT_EQ(Catalog().GetMoodboard().card_ids_.size(), 2u);

  CardPatch patch;
  patch.in_moodboard_ = false;
  Catalog().UpdateCard("card_b", patch);
  EXPECT_EQ(Catalog().GetMoodboard().card_ids_, std::vector<card_id_t>{"card_a"});

  CardQuery query;
  query.moodboard_only_ = true;
  EXPECT_EQ(Ids(Catalog().SearchCards(query)), std::vector<card_id_t>{"card_a"});

  Catalog().ClearMoodboard();
  EXPECT_TRUE(Catalog().GetMoodboard().card_ids_.empty());
  EXPECT_FALSE(Catalog().GetCard("card_a")->in_moodboard_);
}

TEST_F(CatalogTests, SearchAndTagQueries) {
  AddCategory("cat", "Mood");
  AddTag("tag_a", "A", "cat");
  AddTag("tag_b", "B", "cat");
  Catalog().AddCard(MakeCard("card_1", "1.jpg", {"tag_a", "tag_b"}));
  Catalog().AddCard(MakeCard("card_2", "2.jpg", {"tag_a"}));
  auto video  = MakeCard("card_3", "3.mp4", {"tag_b"});
  video.type_ = MediaType::VIDEO;
  Catalog().AddCard(video);

  EXPECT_EQ(Ids(Catalog().GetCardsByTags({"tag_a", "tag_b"})),
            std::vector<card_id_t>{"card_1"});
  EXPECT_TRUE(Catalog().GetCardsByTags({}).empty());

  CardQuery query;
  query.type_    = MediaType::VIDEO;
  query.tag_ids_ = {"tag_b"};
  EXPECT_EQ(Ids(Catalog().SearchCards(query)), std::vector<card_id_t>{"card_3"});

  auto stats = Catalog().CountCardsByType();
  EXPECT_EQ(stats.total_, 3u);
  EXPECT_EQ(stats.images_, 2u);
  EXPECT_EQ(stats.videos_, 1u);

  auto top = Catalog().GetTopTags(1);
  ASSERT_EQ(top.size(), 1u);
  EXPECT_EQ(top[0].card_count_, 2u);

  auto page = Catalog().ListCardsPaginated(0, 2, CardOrder::FILE_NAME, true);
  ASSERT_EQ(page.size(), 2u);
  EXPECT_EQ(page[0].file_name_, "3.mp4");
  EXPECT_EQ(Catalog().ListCardsPaginated(2, 2, CardOrder::FILE_NAME).size(), 1u);
  EXPECT_EQ(Catalog().GetCardsByIds({"card_2", "missing"}).size(), 1u);
}

TEST_F(CatalogTests, OrphanTagsAndCountRecalculation) {
  AddCategory("cat", "Mood");
  AddTag("tag_a", "A", "cat", 5);
  Catalog().AddCard(MakeCard("card_1", "1.jpg", {"tag_a"}));
  EXPECT_EQ(Catalog().GetTag("tag_a")->card_count_, 6u);

  EXPECT_EQ(Catalog().RecalculateTagCounts(), 1u);
  EXPECT_EQ(Catalog().GetTag("tag_a")->card_count_, 1u);
  EXPECT_EQ(Catalog().RecalculateTagCounts(), 0u);

  // Remove the category record only, leaving the tag behind
  auto guard = storage_->GetDBController().GetConnectionGuard();
  CategoryService categories(guard._conn);
  categories.RemoveById("cat");

  auto orphans = Catalog().FindOrphanTags();
  ASSERT_EQ(orphans.size(), 1u);
  EXPECT_EQ(orphans[0].tag_.id_, "tag_a");

  auto cleanup = Catalog().CleanupOrphanTags();
  EXPECT_EQ(cleanup.deleted_, 1u);
  EXPECT_EQ(cleanup.removed_from_cards_, 1u);
  EXPECT_TRUE(Catalog().GetCard("card_1")->tags_.empty());
}

TEST_F(CatalogTests, StatisticsSummarizeCatalog) {
  AddCategory("cat", "Mood");
  AddTag("tag_a", "A", "cat");
  auto big       = MakeCard("card_1", "1.jpg");
  big.file_size_ = 4000;
  Catalog().AddCard(big);
  Catalog().AddCard(MakeCard("card_2", "2.jpg"));
  AddCollection("col", "Refs", {"card_1"});
  Catalog().AddToMoodboard("card_2");

  auto stats = Catalog().GetStatistics();
  EXPECT_EQ(stats.cards_, 2u);
  EXPECT_EQ(stats.images_, 2u);
  EXPECT_EQ(stats.tags_, 1u);
  EXPECT_EQ(stats.categories_, 1u);
  EXPECT_EQ(stats.collections_, 1u);
  EXPECT_EQ(stats.moodboard_, 1u);
  EXPECT_EQ(stats.total_bytes_, 5024u);
}
}  // namespace arcvault
