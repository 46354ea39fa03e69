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

#include "storage/controller/catalog/catalog_controller.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "catalog/entity_json.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/id/id_generator.hpp"
#include "utils/log/logger.hpp"

namespace arcvault {
namespace {
auto Difference(const std::vector<std::string>& lhs, const std::vector<std::string>& rhs)
    -> std::vector<std::string> {
  return id_list::Filter(lhs, [&](const std::string& id) { return !id_list::Contains(rhs, id); });
}

auto Deduplicate(const std::vector<std::string>& ids) -> std::vector<std::string> {
  std::vector<std::string> unique;
  for (const auto& id : ids) id_list::Insert(unique, id);
  return unique;
}
};  // namespace

/**
 * @brief Construct a new Catalog Controller object
 *
 * @param guard
 */
CatalogController::CatalogController(ConnectionGuard&& guard)
    : _guard(std::move(guard)),
      _cards(_guard._conn),
      _tags(_guard._conn),
      _categories(_guard._conn),
      _collections(_guard._conn),
      _moodboard(_guard._conn),
      _previews(_guard._conn) {}

void CatalogController::AdjustTagCounts(const std::vector<tag_id_t>& added,
                                        const std::vector<tag_id_t>& removed) {
  for (const auto& tag_id : added) {
    auto tag = _tags.GetById(tag_id);
    if (!tag) continue;
    tag->card_count_ += 1;
    _tags.Update(*tag, tag_id);
  }
  for (const auto& tag_id : removed) {
    auto tag = _tags.GetById(tag_id);
    if (!tag || tag->card_count_ == 0) continue;
    tag->card_count_ -= 1;
    _tags.Update(*tag, tag_id);
  }
}

auto CatalogController::ExistingTagIds(const std::vector<tag_id_t>& ids) -> std::vector<tag_id_t> {
  return id_list::Filter(Deduplicate(ids), [&](const tag_id_t& id) { return _tags.Exists(id); });
}

auto CatalogController::ExistingCollectionIds(const std::vector<collection_id_t>& ids)
    -> std::vector<collection_id_t> {
  return id_list::Filter(Deduplicate(ids),
                         [&](const collection_id_t& id) { return _collections.Exists(id); });
}

auto CatalogController::ExistingCardIds(const std::vector<card_id_t>& ids)
    -> std::vector<card_id_t> {
  return id_list::Filter(Deduplicate(ids), [&](const card_id_t& id) { return _cards.Exists(id); });
}

/**
 * @brief Mirror a membership change on both the board and the card's flag. The card record is
 * written back by this call.
 */
void CatalogController::SetMoodboardMembership(Card& card, bool member) {
  auto board   = _moodboard.Load();
  bool changed = member ? id_list::Insert(board.card_ids_, card.id_)
                        : id_list::Erase(board.card_ids_, card.id_);
  if (changed) {
    board.date_modified_ = TimeProvider::NowIso();
    _moodboard.Save(board);
  }
  card.in_moodboard_ = member;
  _cards.Update(card, card.id_);
}

// ---------------------------------------------------------------------------------------------
// Cards
// ---------------------------------------------------------------------------------------------

/**
 * @brief Insert a card. Unknown tag and collection ids are dropped; referenced tags get their
 * count bumped and referenced collections list the new card.
 *
 * @param card
 * @return card_id_t
 */
auto CatalogController::AddCard(Card card) -> card_id_t {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  if (card.file_path_.empty()) {
    throw std::invalid_argument("Card has no file path");
  }
  if (card.id_.empty()) {
    card.id_ = EntityID::Generate("card");
  } else if (_cards.Exists(card.id_)) {
    throw std::invalid_argument("Card id already exists: " + card.id_);
  }
  if (card.file_name_.empty()) {
    card.file_name_ = card.file_path_.filename().string();
  }
  if (card.date_added_.empty()) {
    card.date_added_ = TimeProvider::NowIso();
  }
  card.tags_        = ExistingTagIds(card.tags_);
  card.collections_ = ExistingCollectionIds(card.collections_);
  bool pin          = card.in_moodboard_;
  card.in_moodboard_ = false;

  TransactionGuard tx(_guard);
  _cards.Insert(card);
  AdjustTagCounts(card.tags_, {});
  for (const auto& collection_id : card.collections_) {
    auto collection = _collections.GetById(collection_id);
    if (collection && id_list::Insert(collection->card_ids_, card.id_)) {
      collection->date_modified_ = TimeProvider::NowIso();
      _collections.Update(*collection, collection_id);
    }
  }
  if (pin) {
    SetMoodboardMembership(card, true);
  }
  tx.Commit();
  Logger::Storage()->debug("Added card {} ({})", card.id_, card.file_path_.string());
  return card.id_;
}

auto CatalogController::GetCard(const card_id_t& id) -> std::optional<Card> {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  return _cards.GetById(id);
}

auto CatalogController::ListCards() -> std::vector<Card> {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  return _cards.GetAll();
}

auto CatalogController::GetCardsByIds(const std::vector<card_id_t>& ids) -> std::vector<Card> {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  return _cards.GetCardsByIds(ids);
}

auto CatalogController::ListCardsPaginated(uint32_t offset, uint32_t limit, CardOrder order,
                                           bool reverse) -> std::vector<Card> {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  return _cards.GetPage(offset, limit, order, reverse);
}

auto CatalogController::CountCards() -> uint64_t {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  return _cards.Count();
}

auto CatalogController::CountCardsByType() -> CardStatistics {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  CardStatistics stats;
  stats.images_ = _cards.CountByType(MediaType::IMAGE);
  stats.videos_ = _cards.CountByType(MediaType::VIDEO);
  stats.total_  = stats.images_ + stats.videos_;
  return stats;
}

/**
 * @brief Apply a targeted update. A changed tag set adjusts the counts of the added and removed
 * tags; a changed in_moodboard flag is routed through the board so both sides agree.
 *
 * @param id
 * @param patch
 * @return 1 if the card exists, 0 otherwise
 */
auto CatalogController::UpdateCard(const card_id_t& id, const CardPatch& patch) -> uint32_t {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  auto                                  card = _cards.GetById(id);
  if (!card) {
    return 0;
  }
  auto old_tags = card->tags_;
  patch.ApplyTo(*card);
  card->id_ = id;
  if (patch.tags_) {
    card->tags_ = ExistingTagIds(card->tags_);
  }
  if (patch.collections_) {
    card->collections_ = ExistingCollectionIds(card->collections_);
  }
  card->date_modified_ = TimeProvider::NowIso();

  TransactionGuard tx(_guard);
  if (patch.in_moodboard_) {
    SetMoodboardMembership(*card, *patch.in_moodboard_);
  } else {
    _cards.Update(*card, id);
  }
  if (patch.tags_) {
    AdjustTagCounts(Difference(card->tags_, old_tags), Difference(old_tags, card->tags_));
  }
  tx.Commit();
  return 1;
}

/**
 * @brief UpdateCard, plus adding/removing the card id in every collection that entered or left
 * the card's collection set.
 */
auto CatalogController::UpdateCardWithCollections(const card_id_t& id, const CardPatch& patch)
    -> uint32_t {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  auto                                  before = _cards.GetById(id);
  if (!before) {
    return 0;
  }
  TransactionGuard tx(_guard);
  UpdateCard(id, patch);
  if (patch.collections_) {
    auto after   = _cards.GetById(id);
    auto added   = Difference(after->collections_, before->collections_);
    auto removed = Difference(before->collections_, after->collections_);
    auto now     = TimeProvider::NowIso();
    for (const auto& collection_id : added) {
      auto collection = _collections.GetById(collection_id);
      if (collection && id_list::Insert(collection->card_ids_, id)) {
        collection->date_modified_ = now;
        _collections.Update(*collection, collection_id);
      }
    }
    for (const auto& collection_id : removed) {
      auto collection = _collections.GetById(collection_id);
      if (collection && id_list::Erase(collection->card_ids_, id)) {
        collection->date_modified_ = now;
        _collections.Update(*collection, collection_id);
      }
    }
  }
  tx.Commit();
  return 1;
}

/**
 * @brief Remove a card, then its id from every collection, from the moodboard and from the
 * preview cache. Tag counts are left as they are.
 *
 * @param id
 */
void CatalogController::DeleteCard(const card_id_t& id) {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  TransactionGuard                      tx(_guard);
  if (_cards.RemoveById(id) == 0) {
    return;
  }
  auto now = TimeProvider::NowIso();
  for (auto& collection : _collections.GetCollectionsHoldingCard(id)) {
    id_list::Erase(collection.card_ids_, id);
    collection.date_modified_ = now;
    _collections.Update(collection, collection.id_);
  }
  auto board = _moodboard.Load();
  if (id_list::Erase(board.card_ids_, id)) {
    board.date_modified_ = now;
    _moodboard.Save(board);
  }
  _previews.RemoveById(id);
  tx.Commit();
  Logger::Storage()->debug("Deleted card {}", id);
}

auto CatalogController::SearchCards(const CardQuery& query) -> std::vector<Card> {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  std::vector<Card>                     candidates;
  if (query.moodboard_only_) {
    candidates = _cards.GetMoodboardCards();
  } else if (query.type_) {
    candidates = _cards.GetCardsByType(*query.type_);
  } else {
    candidates = _cards.GetAll();
  }
  std::erase_if(candidates, [&](const Card& card) {
    if (query.type_ && card.type_ != *query.type_) return true;
    for (const auto& tag_id : query.tag_ids_) {
      if (!card.HasTag(tag_id)) return true;
    }
    return false;
  });
  return candidates;
}

auto CatalogController::GetCardsByTags(const std::vector<tag_id_t>& tag_ids) -> std::vector<Card> {
  if (tag_ids.empty()) {
    return {};
  }
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  auto                                  candidates = _cards.GetCardsWithTag(tag_ids.front());
  std::erase_if(candidates, [&](const Card& card) {
    return std::any_of(tag_ids.begin(), tag_ids.end(),
                       [&](const tag_id_t& tag_id) { return !card.HasTag(tag_id); });
  });
  return candidates;
}

// ---------------------------------------------------------------------------------------------
// Tags
// ---------------------------------------------------------------------------------------------

/**
 * @brief Insert a tag and append it to its category.
 *
 * @throws std::invalid_argument if the category does not exist
 */
auto CatalogController::AddTag(Tag tag) -> tag_id_t {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  auto                                  category = _categories.GetById(tag.category_id_);
  if (!category) {
    throw std::invalid_argument("Tag refers to an unknown category: " + tag.category_id_);
  }
  if (tag.id_.empty()) {
    tag.id_ = EntityID::Generate("tag");
  } else if (_tags.Exists(tag.id_)) {
    throw std::invalid_argument("Tag id already exists: " + tag.id_);
  }
  if (tag.date_created_.empty()) {
    tag.date_created_ = TimeProvider::NowIso();
  }

  TransactionGuard tx(_guard);
  _tags.Insert(tag);
  if (id_list::Insert(category->tag_ids_, tag.id_)) {
    _categories.Update(*category, category->id_);
  }
  tx.Commit();
  return tag.id_;
}

auto CatalogController::GetTag(const tag_id_t& id) -> std::optional<Tag> {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  return _tags.GetById(id);
}

auto CatalogController::ListTags() -> std::vector<Tag> {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  return _tags.GetAll();
}

auto CatalogController::ListTagsByCategory(const category_id_t& category_id) -> std::vector<Tag> {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  return _tags.GetTagsByCategory(category_id);
}

auto CatalogController::GetTopTags(uint32_t limit) -> std::vector<Tag> {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  return _tags.GetByPredicate(fmt::format("TRUE ORDER BY card_count DESC, name LIMIT {}", limit));
}

/**
 * @brief Apply a targeted update. Moving the tag to another category goes through
 * MoveTagToCategory so both categories stay in sync.
 */
auto CatalogController::UpdateTag(const tag_id_t& id, const TagPatch& patch) -> uint32_t {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  auto                                  tag = _tags.GetById(id);
  if (!tag) {
    return 0;
  }
  TransactionGuard tx(_guard);
  if (patch.category_id_ && *patch.category_id_ != tag->category_id_) {
    MoveTagToCategory(id, *patch.category_id_);
    tag = _tags.GetById(id);
  }
  TagPatch rest     = patch;
  rest.category_id_ = std::nullopt;
  rest.ApplyTo(*tag);
  _tags.Update(*tag, id);
  tx.Commit();
  return 1;
}

void CatalogController::DeleteTag(const tag_id_t& id, bool detach_from_category) {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  auto                                  tag = _tags.GetById(id);
  if (!tag) {
    return;
  }
  TransactionGuard tx(_guard);
  _tags.RemoveById(id);
  uint32_t stripped = 0;
  for (auto& card : _cards.GetCardsWithTag(id)) {
    id_list::Erase(card.tags_, id);
    _cards.Update(card, card.id_);
    ++stripped;
  }
  if (detach_from_category) {
    auto category = _categories.GetById(tag->category_id_);
    if (category && id_list::Erase(category->tag_ids_, id)) {
      _categories.Update(*category, category->id_);
    }
  }
  tx.Commit();
  Logger::Storage()->debug("Deleted tag {} (stripped from {} cards)", id, stripped);
}

/**
 * @brief Re-home a tag: update its category id, drop it from the old category's list and append
 * it to the new one. Moving to the current category is a no-op.
 *
 * @throws std::invalid_argument if the tag or the target category does not exist
 */
void CatalogController::MoveTagToCategory(const tag_id_t& tag_id,
                                          const category_id_t& new_category_id) {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  auto                                  tag = _tags.GetById(tag_id);
  if (!tag) {
    throw std::invalid_argument("Unknown tag: " + tag_id);
  }
  auto target = _categories.GetById(new_category_id);
  if (!target) {
    throw std::invalid_argument("Unknown category: " + new_category_id);
  }
  if (tag->category_id_ == new_category_id) {
    return;
  }

  TransactionGuard tx(_guard);
  auto             source = _categories.GetById(tag->category_id_);
  if (source && id_list::Erase(source->tag_ids_, tag_id)) {
    _categories.Update(*source, source->id_);
  }
  if (id_list::Insert(target->tag_ids_, tag_id)) {
    _categories.Update(*target, target->id_);
  }
  tag->category_id_ = new_category_id;
  _tags.Update(*tag, tag_id);
  tx.Commit();
}

// ---------------------------------------------------------------------------------------------
// Categories
// ---------------------------------------------------------------------------------------------

auto CatalogController::AddCategory(Category category) -> category_id_t {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  if (category.id_.empty()) {
    category.id_ = EntityID::Generate("cat");
  } else if (_categories.Exists(category.id_)) {
    throw std::invalid_argument("Category id already exists: " + category.id_);
  }
  if (category.date_created_.empty()) {
    category.date_created_ = TimeProvider::NowIso();
  }
  // Tags join a category through AddTag/MoveTagToCategory only
  category.tag_ids_.clear();
  if (!category.order_) {
    category.order_ = static_cast<int32_t>(_categories.Count());
  }
  _categories.Insert(category);
  return category.id_;
}

auto CatalogController::GetCategory(const category_id_t& id) -> std::optional<Category> {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  return _categories.GetById(id);
}

/**
 * @brief All categories, ordered by their display order (unordered ones last) then by creation
 * date.
 */
auto CatalogController::ListCategories() -> std::vector<Category> {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  auto                                  categories = _categories.GetAll();
  std::stable_sort(categories.begin(), categories.end(),
                   [](const Category& lhs, const Category& rhs) {
                     if (lhs.order_.has_value() != rhs.order_.has_value()) {
                       return lhs.order_.has_value();
                     }
                     if (lhs.order_ && *lhs.order_ != *rhs.order_) {
                       return *lhs.order_ < *rhs.order_;
                     }
                     return lhs.date_created_ < rhs.date_created_;
                   });
  return categories;
}

/**
 * @brief Apply a targeted update. A replaced tag list keeps only ids of existing tags.
 */
auto CatalogController::UpdateCategory(const category_id_t& id, const CategoryPatch& patch)
    -> uint32_t {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  auto                                  category = _categories.GetById(id);
  if (!category) {
    return 0;
  }
  patch.ApplyTo(*category);
  category->id_ = id;
  if (patch.tag_ids_) {
    category->tag_ids_ = ExistingTagIds(category->tag_ids_);
  }
  return static_cast<uint32_t>(_categories.Update(*category, id));
}

/**
 * @brief Delete every tag the category lists (each with its card back-references), then the
 * category itself.
 *
 * @param id
 */
void CatalogController::DeleteCategory(const category_id_t& id) {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  auto                                  category = _categories.GetById(id);
  if (!category) {
    return;
  }
  TransactionGuard tx(_guard);
  for (const auto& tag_id : category->tag_ids_) {
    DeleteTag(tag_id);
  }
  _categories.RemoveById(id);
  tx.Commit();
  Logger::Storage()->debug("Deleted category {} with {} tags", id, category->tag_ids_.size());
}

/**
 * @brief Renumber the display order 0..n-1 following the current ListCategories() order.
 *
 * @return number of categories whose order changed
 */
auto CatalogController::FixCategoriesOrder() -> uint32_t {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  auto                                  categories = ListCategories();
  TransactionGuard                      tx(_guard);
  uint32_t                              changed = 0;
  for (size_t i = 0; i < categories.size(); ++i) {
    auto& category = categories[i];
    if (category.order_ == static_cast<int32_t>(i)) continue;
    category.order_ = static_cast<int32_t>(i);
    _categories.Update(category, category.id_);
    ++changed;
  }
  tx.Commit();
  return changed;
}

// ---------------------------------------------------------------------------------------------
// Collections
// ---------------------------------------------------------------------------------------------

/**
 * @brief Insert a collection. Listed cards that exist get the collection added to their set.
 */
auto CatalogController::AddCollection(Collection collection) -> collection_id_t {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  if (collection.id_.empty()) {
    collection.id_ = EntityID::Generate("col");
  } else if (_collections.Exists(collection.id_)) {
    throw std::invalid_argument("Collection id already exists: " + collection.id_);
  }
  auto now = TimeProvider::NowIso();
  if (collection.date_created_.empty()) collection.date_created_ = now;
  if (collection.date_modified_.empty()) collection.date_modified_ = now;
  collection.card_ids_ = ExistingCardIds(collection.card_ids_);

  TransactionGuard tx(_guard);
  _collections.Insert(collection);
  for (auto& card : _cards.GetCardsByIds(collection.card_ids_)) {
    if (id_list::Insert(card.collections_, collection.id_)) {
      _cards.Update(card, card.id_);
    }
  }
  tx.Commit();
  return collection.id_;
}

auto CatalogController::GetCollection(const collection_id_t& id) -> std::optional<Collection> {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  return _collections.GetById(id);
}

auto CatalogController::ListCollections() -> std::vector<Collection> {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  return _collections.GetByPredicate("TRUE ORDER BY date_created, id");
}

auto CatalogController::UpdateCollection(const collection_id_t& id, const CollectionPatch& patch)
    -> uint32_t {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  auto                                  collection = _collections.GetById(id);
  if (!collection) {
    return 0;
  }
  patch.ApplyTo(*collection);
  collection->id_ = id;
  if (patch.card_ids_) {
    collection->card_ids_ = ExistingCardIds(collection->card_ids_);
  }
  collection->date_modified_ = TimeProvider::NowIso();
  return static_cast<uint32_t>(_collections.Update(*collection, id));
}

/**
 * @brief Remove a collection, then its id from every card's collection set.
 */
void CatalogController::DeleteCollection(const collection_id_t& id) {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  TransactionGuard                      tx(_guard);
  if (_collections.RemoveById(id) == 0) {
    return;
  }
  for (auto& card : _cards.GetCardsInCollection(id)) {
    id_list::Erase(card.collections_, id);
    _cards.Update(card, card.id_);
  }
  tx.Commit();
  Logger::Storage()->debug("Deleted collection {}", id);
}

auto CatalogController::AddCardToCollection(const card_id_t& card_id,
                                            const collection_id_t& collection_id) -> bool {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  auto                                  card       = _cards.GetById(card_id);
  auto                                  collection = _collections.GetById(collection_id);
  if (!card || !collection) {
    return false;
  }
  TransactionGuard tx(_guard);
  if (id_list::Insert(collection->card_ids_, card_id)) {
    collection->date_modified_ = TimeProvider::NowIso();
    _collections.Update(*collection, collection_id);
  }
  if (id_list::Insert(card->collections_, collection_id)) {
    _cards.Update(*card, card_id);
  }
  tx.Commit();
  return true;
}

auto CatalogController::RemoveCardFromCollection(const card_id_t& card_id,
                                                 const collection_id_t& collection_id) -> bool {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  TransactionGuard                      tx(_guard);
  bool                                  changed    = false;
  auto                                  collection = _collections.GetById(collection_id);
  if (collection && id_list::Erase(collection->card_ids_, card_id)) {
    collection->date_modified_ = TimeProvider::NowIso();
    _collections.Update(*collection, collection_id);
    changed = true;
  }
  auto card = _cards.GetById(card_id);
  if (card && id_list::Erase(card->collections_, collection_id)) {
    _cards.Update(*card, card_id);
    changed = true;
  }
  tx.Commit();
  return changed;
}

// ---------------------------------------------------------------------------------------------
// Moodboard
// ---------------------------------------------------------------------------------------------

auto CatalogController::GetMoodboard() -> Moodboard {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  return _moodboard.Load();
}

auto CatalogController::AddToMoodboard(const card_id_t& card_id) -> bool {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  auto                                  card = _cards.GetById(card_id);
  if (!card) {
    return false;
  }
  TransactionGuard tx(_guard);
  SetMoodboardMembership(*card, true);
  tx.Commit();
  return true;
}

auto CatalogController::RemoveFromMoodboard(const card_id_t& card_id) -> bool {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  TransactionGuard                      tx(_guard);
  auto                                  card = _cards.GetById(card_id);
  if (card) {
    SetMoodboardMembership(*card, false);
  } else {
    // The card is gone, still make sure the board forgets it
    auto board = _moodboard.Load();
    if (id_list::Erase(board.card_ids_, card_id)) {
      board.date_modified_ = TimeProvider::NowIso();
      _moodboard.Save(board);
    }
  }
  tx.Commit();
  return card.has_value();
}

/**
 * @brief Reset the flag on every card the board lists (and every card still flagged), then empty
 * the board.
 */
void CatalogController::ClearMoodboard() {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  TransactionGuard                      tx(_guard);
  auto                                  board   = _moodboard.Load();
  auto                                  flagged = _cards.GetMoodboardCards();
  for (auto& card : _cards.GetCardsByIds(board.card_ids_)) {
    if (card.in_moodboard_) continue;
    flagged.push_back(std::move(card));
  }
  for (auto& card : flagged) {
    card.in_moodboard_ = false;
    _cards.Update(card, card.id_);
  }
  board.card_ids_.clear();
  board.date_modified_ = TimeProvider::NowIso();
  _moodboard.Save(board);
  tx.Commit();
}

void CatalogController::ReplaceMoodboardCards(const std::vector<card_id_t>& card_ids) {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  auto                                  board = _moodboard.Load();
  board.card_ids_                             = Deduplicate(card_ids);
  board.date_modified_                        = TimeProvider::NowIso();
  _moodboard.Save(board);
}

// ---------------------------------------------------------------------------------------------
// Preview cache
// ---------------------------------------------------------------------------------------------

void CatalogController::PutPreview(const card_id_t& card_id, const std::string& preview_path) {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  PreviewEntry                          entry{card_id, preview_path, TimeProvider::NowIso()};
  if (_previews.Update(entry, card_id) == 0) {
    _previews.Insert(entry);
  }
}

auto CatalogController::GetPreview(const card_id_t& card_id) -> std::optional<std::string> {
  std::lock_guard<std::recursive_mutex> lock(_mtx);
  auto                                  entry = _previews.GetById(card_id);
  if (!entry) {
    return std::nullopt;
  }
  return entry->preview_path_;
}
};  // namespace arcvault
