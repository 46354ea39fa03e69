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

#include <filesystem>
#include <regex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "catalog/entity_json.hpp"
#include "storage/controller/catalog/catalog_controller.hpp"
#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/log/logger.hpp"

namespace arcvault {
namespace {
/**
 * @brief Re-anchor the tail of old_path matched by tail_pattern under new_root. Paths without a
 * match are returned unchanged.
 */
auto RebasePath(const std::string& old_path, const std::regex& tail_pattern,
                const std::filesystem::path& new_root) -> std::string {
  std::smatch match;
  if (!std::regex_search(old_path, match, tail_pattern)) {
    return old_path;
  }
  std::filesystem::path rebased = new_root;
  std::string           tail    = match[1].str();
  size_t                start   = 0;
  while (start <= tail.size()) {
    size_t end = tail.find_first_of("/\\", start);
    if (end == std::string::npos) end = tail.size();
    if (end > start) rebased /= tail.substr(start, end - start);
    start = end + 1;
  }
  return rebased.string();
}

const std::regex kDatedTail{R"((\d{4}[\\/]\d{2}[\\/]\d{2}[\\/].+)$)"};
const std::regex kThumbTail{R"((_cache[\\/]thumbs[\\/].+)$)"};
};  // namespace

/**
 * @brief Recompute every tag's card count from the cards that reference it.
 *
 * @return number of tags whose stored count was wrong
 */
auto CatalogController::RecalculateTagCounts() -> uint32_t {
  std::lock_guard<std::recursive_mutex>      lock(_mtx);
  std::unordered_map<std::string, uint64_t> counts;
  for (const auto& card : _cards.GetAll()) {
    for (const auto& tag_id : card.tags_) {
      ++counts[tag_id];
    }
  }

  TransactionGuard tx(_guard);
  uint32_t         updated = 0;
  for (auto& tag : _tags.GetAll()) {
    auto     it     = counts.find(tag.id_);
    uint64_t actual = it == counts.end() ? 0 : it->second;
    if (tag.card_count_ == actual) continue;
    tag.card_count_ = actual;
    _tags.Update(tag, tag.id_);
    ++updated;
  }
  tx.Commit();
  Logger::Storage()->info("Recalculated tag counts, {} tags updated", updated);
  return updated;
}

auto CatalogController::FindOrphanTags() -> std::vector<OrphanTag> {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  std::unordered_set<std::string>       category_ids;
  for (const auto& category : _categories.GetAll()) {
    category_ids.insert(category.id_);
  }
  std::vector<OrphanTag> orphans;
  for (auto& tag : _tags.GetAll()) {
    if (!tag.category_id_.empty() && category_ids.contains(tag.category_id_)) continue;
    orphans.push_back({std::move(tag), false});
  }
  return orphans;
}

/**
 * @brief Delete every tag whose category is gone, stripping it from cards first.
 */
auto CatalogController::CleanupOrphanTags() -> OrphanTagCleanup {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  OrphanTagCleanup                      cleanup;
  TransactionGuard                      tx(_guard);
  for (const auto& orphan : FindOrphanTags()) {
    cleanup.removed_from_cards_ +=
        static_cast<uint32_t>(_cards.GetCardsWithTag(orphan.tag_.id_).size());
    DeleteTag(orphan.tag_.id_);
    ++cleanup.deleted_;
  }
  tx.Commit();
  Logger::Storage()->info("Removed {} orphan tags from {} cards", cleanup.deleted_,
                          cleanup.removed_from_cards_);
  return cleanup;
}

auto CatalogController::GetStatistics() -> CatalogStatistics {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  CatalogStatistics                     stats;
  stats.images_      = _cards.CountByType(MediaType::IMAGE);
  stats.videos_      = _cards.CountByType(MediaType::VIDEO);
  stats.cards_       = _cards.Count();
  stats.tags_        = _tags.Count();
  stats.categories_  = _categories.Count();
  stats.collections_ = _collections.Count();
  stats.moodboard_   = _moodboard.Load().card_ids_.size();
  stats.total_bytes_ = _cards.TotalFileSize();
  return stats;
}

auto CatalogController::ExportSnapshot() -> CatalogSnapshot {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  CatalogSnapshot                       snapshot;
  snapshot.cards_       = _cards.GetByPredicate("TRUE ORDER BY date_added, id");
  snapshot.tags_        = _tags.GetByPredicate("TRUE ORDER BY date_created, id");
  snapshot.categories_  = ListCategories();
  snapshot.collections_ = ListCollections();
  snapshot.moodboard_   = _moodboard.GetById(kMoodboardId);
  snapshot.previews_    = _previews.GetByPredicate("TRUE ORDER BY card_id");
  snapshot.export_date_ = TimeProvider::NowIso();
  return snapshot;
}

void CatalogController::ClearTables() {
  for (const char* table : {"Card", "Tag", "Category", "Collection", "Moodboard", "PreviewCache"}) {
    duckorm::execute(_guard._conn, std::string("DELETE FROM ") + table + ";");
  }
}

/**
 * @brief Replace the catalog with the snapshot's records as they are. No cascade rules run; the
 * integrity validator reports whatever inconsistency the snapshot carried.
 */
void CatalogController::ImportSnapshot(const CatalogSnapshot&                      snapshot,
                                       const std::optional<std::filesystem::path>& new_working_dir) {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  TransactionGuard                      tx(_guard);
  ClearTables();

  for (auto card : snapshot.cards_) {
    if (new_working_dir) {
      card.file_path_ = RebasePath(card.file_path_.string(), kDatedTail, *new_working_dir);
      if (!card.preview_.empty() && !card.preview_.starts_with("data:")) {
        card.preview_ = RebasePath(card.preview_, kThumbTail, *new_working_dir);
      }
    }
    _cards.Insert(card);
  }
  for (const auto& tag : snapshot.tags_) _tags.Insert(tag);
  for (const auto& category : snapshot.categories_) _categories.Insert(category);
  for (const auto& collection : snapshot.collections_) _collections.Insert(collection);
  if (snapshot.moodboard_) {
    Moodboard board = *snapshot.moodboard_;
    board.id_       = kMoodboardId;
    _moodboard.Insert(board);
  }
  for (auto preview : snapshot.previews_) {
    if (new_working_dir && !preview.preview_path_.starts_with("data:")) {
      preview.preview_path_ = RebasePath(preview.preview_path_, kThumbTail, *new_working_dir);
    }
    _previews.Insert(preview);
  }
  tx.Commit();
  Logger::Storage()->info("Imported catalog snapshot: {} cards, {} tags, {} collections",
                          snapshot.cards_.size(), snapshot.tags_.size(),
                          snapshot.collections_.size());
}
};  // namespace arcvault
