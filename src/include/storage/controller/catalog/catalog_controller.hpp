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
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "catalog/card.hpp"
#include "catalog/catalog_snapshot.hpp"
#include "catalog/category.hpp"
#include "catalog/collection.hpp"
#include "catalog/tag.hpp"
#include "storage/controller/controller_types.hpp"
#include "storage/service/catalog/card_service.hpp"
#include "storage/service/catalog/category_service.hpp"
#include "storage/service/catalog/collection_service.hpp"
#include "storage/service/catalog/tag_service.hpp"
#include "type/type.hpp"

namespace arcvault {
/**
 * @brief Conjunctive card search. Every listed tag must be present on a matching card.
 */
struct CardQuery {
  std::optional<MediaType> type_;
  std::vector<tag_id_t>    tag_ids_;
  bool                     moodboard_only_ = false;
};

/**
 * @brief Typed CRUD and cascade mutation over the five linked catalog tables.
 *
 * Every multi-record mutation runs in one DuckDB transaction. Operations on ids that do not exist
 * are no-ops, or return an empty optional / zero count. Tag::card_count_ is kept current on card
 * creation and tag edits only; DeleteCard leaves counts stale until RecalculateTagCounts() or the
 * integrity repairer runs.
 */
class CatalogController {
 private:
  ConnectionGuard      _guard;
  CardService          _cards;
  TagService           _tags;
  CategoryService      _categories;
  CollectionService    _collections;
  MoodboardService     _moodboard;
  PreviewService       _previews;

  std::recursive_mutex _mtx;

  void                 AdjustTagCounts(const std::vector<tag_id_t>& added,
                                       const std::vector<tag_id_t>& removed);
  auto                 ExistingTagIds(const std::vector<tag_id_t>& ids) -> std::vector<tag_id_t>;
  auto                 ExistingCollectionIds(const std::vector<collection_id_t>& ids)
      -> std::vector<collection_id_t>;
  auto                 ExistingCardIds(const std::vector<card_id_t>& ids) -> std::vector<card_id_t>;
  void                 SetMoodboardMembership(Card& card, bool member);
  void                 ClearTables();

 public:
  explicit CatalogController(ConnectionGuard&& guard);

  // Cards
  auto AddCard(Card card) -> card_id_t;
  auto GetCard(const card_id_t& id) -> std::optional<Card>;
  auto ListCards() -> std::vector<Card>;
  auto GetCardsByIds(const std::vector<card_id_t>& ids) -> std::vector<Card>;
  auto ListCardsPaginated(uint32_t offset, uint32_t limit, CardOrder order = CardOrder::DATE_ADDED,
                          bool reverse = true) -> std::vector<Card>;
  auto CountCards() -> uint64_t;
  auto CountCardsByType() -> CardStatistics;
  auto UpdateCard(const card_id_t& id, const CardPatch& patch) -> uint32_t;
  auto UpdateCardWithCollections(const card_id_t& id, const CardPatch& patch) -> uint32_t;
  void DeleteCard(const card_id_t& id);
  auto SearchCards(const CardQuery& query) -> std::vector<Card>;
  auto GetCardsByTags(const std::vector<tag_id_t>& tag_ids) -> std::vector<Card>;

  // Tags
  auto AddTag(Tag tag) -> tag_id_t;
  auto GetTag(const tag_id_t& id) -> std::optional<Tag>;
  auto ListTags() -> std::vector<Tag>;
  auto ListTagsByCategory(const category_id_t& category_id) -> std::vector<Tag>;
  auto GetTopTags(uint32_t limit) -> std::vector<Tag>;
  auto UpdateTag(const tag_id_t& id, const TagPatch& patch) -> uint32_t;
  /**
   * @brief Remove the tag and strip it from every card. The owning category keeps the id unless
   * detach_from_category is set.
   */
  void DeleteTag(const tag_id_t& id, bool detach_from_category = false);
  void MoveTagToCategory(const tag_id_t& tag_id, const category_id_t& new_category_id);

  // Categories
  auto AddCategory(Category category) -> category_id_t;
  auto GetCategory(const category_id_t& id) -> std::optional<Category>;
  auto ListCategories() -> std::vector<Category>;
  auto UpdateCategory(const category_id_t& id, const CategoryPatch& patch) -> uint32_t;
  void DeleteCategory(const category_id_t& id);
  auto FixCategoriesOrder() -> uint32_t;

  // Collections
  auto AddCollection(Collection collection) -> collection_id_t;
  auto GetCollection(const collection_id_t& id) -> std::optional<Collection>;
  auto ListCollections() -> std::vector<Collection>;
  auto UpdateCollection(const collection_id_t& id, const CollectionPatch& patch) -> uint32_t;
  void DeleteCollection(const collection_id_t& id);
  auto AddCardToCollection(const card_id_t& card_id, const collection_id_t& collection_id)
      -> bool;
  auto RemoveCardFromCollection(const card_id_t& card_id, const collection_id_t& collection_id)
      -> bool;

  // Moodboard
  auto GetMoodboard() -> Moodboard;
  auto AddToMoodboard(const card_id_t& card_id) -> bool;
  auto RemoveFromMoodboard(const card_id_t& card_id) -> bool;
  void ClearMoodboard();
  /**
   * @brief Overwrite the board's id list as-is. Flags on cards are not touched.
   */
  void ReplaceMoodboardCards(const std::vector<card_id_t>& card_ids);

  // Preview cache
  void PutPreview(const card_id_t& card_id, const std::string& preview_path);
  auto GetPreview(const card_id_t& card_id) -> std::optional<std::string>;

  // Maintenance
  auto RecalculateTagCounts() -> uint32_t;
  auto FindOrphanTags() -> std::vector<OrphanTag>;
  auto CleanupOrphanTags() -> OrphanTagCleanup;
  auto GetStatistics() -> CatalogStatistics;

  auto ExportSnapshot() -> CatalogSnapshot;
  /**
   * @brief Replace the whole catalog with a snapshot. With new_working_dir, card paths are
   * rebased onto it by their YYYY/MM/DD/... tail and preview paths by their _cache/thumbs/... tail.
   */
  void ImportSnapshot(const CatalogSnapshot& snapshot,
                      const std::optional<std::filesystem::path>& new_working_dir = std::nullopt);
};
};  // namespace arcvault
