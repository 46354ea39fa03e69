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

#include "integrity/integrity_validator.hpp"

#include <fmt/format.h>

#include <exception>
#include <string>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "catalog/entity_json.hpp"
#include "utils/log/logger.hpp"

namespace arcvault {
namespace {
auto DefaultFileExists(const std::filesystem::path& path) -> bool {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

template <typename IdSet>
auto Missing(const std::vector<std::string>& ids, const IdSet& known) -> std::vector<std::string> {
  return id_list::Filter(ids, [&](const std::string& id) { return !known.contains(id); });
}
};  // namespace

IntegrityValidator::IntegrityValidator(CatalogController& catalog, FileExistsFn file_exists)
    : _catalog(catalog),
      _file_exists(file_exists ? std::move(file_exists) : FileExistsFn(DefaultFileExists)) {}

auto IntegrityValidator::Validate() -> ValidationReport {
  auto                            cards       = _catalog.ListCards();
  auto                            tags        = _catalog.ListTags();
  auto                            categories  = _catalog.ListCategories();
  auto                            collections = _catalog.ListCollections();
  auto                            board       = _catalog.GetMoodboard();

  std::unordered_set<std::string> card_ids, tag_ids, collection_ids;
  std::unordered_map<std::string, const Category*> category_by_id;
  std::unordered_map<std::string, uint64_t>        references;
  for (const auto& card : cards) {
    card_ids.insert(card.id_);
    for (const auto& tag_id : card.tags_) ++references[tag_id];
  }
  for (const auto& tag : tags) tag_ids.insert(tag.id_);
  for (const auto& collection : collections) collection_ids.insert(collection.id_);
  for (const auto& category : categories) category_by_id.emplace(category.id_, &category);
  std::unordered_set<std::string> board_ids(board.card_ids_.begin(), board.card_ids_.end());

  ValidationReport report;
  auto add = [&](IssueKind kind, IssueSeverity severity, EntityKind entity_kind,
                 const std::string& entity_id, std::vector<std::string> affected,
                 std::string description) {
    report.issues_.push_back(
        {kind, severity, entity_kind, entity_id, std::move(affected), std::move(description)});
  };

  for (const auto& card : cards) {
    try {
      if (!_file_exists(card.file_path_)) {
        add(IssueKind::MISSING_FILE, IssueSeverity::ERROR, EntityKind::CARD, card.id_, {card.id_},
            fmt::format("File \"{}\" is missing. Restore the file or delete the card.",
                        card.file_path_.string()));
      }
    } catch (const std::exception& e) {
      Logger::Integrity()->warn("Skipped file check for card {}: {}", card.id_, e.what());
    }

    auto dangling_tags        = Missing(card.tags_, tag_ids);
    auto dangling_collections = Missing(card.collections_, collection_ids);
    if (!dangling_tags.empty() || !dangling_collections.empty()) {
      auto affected = dangling_tags;
      affected.insert(affected.end(), dangling_collections.begin(), dangling_collections.end());
      add(IssueKind::DANGLING_CARD_REFERENCE, IssueSeverity::WARNING, EntityKind::CARD, card.id_,
          std::move(affected),
          fmt::format("Card \"{}\" refers to {} missing tag(s) and {} missing collection(s). They "
                      "will be removed from the card.",
                      card.file_name_, dangling_tags.size(), dangling_collections.size()));
    }

    bool member = board_ids.contains(card.id_);
    if (card.in_moodboard_ != member) {
      add(IssueKind::MOODBOARD_FLAG_MISMATCH, IssueSeverity::WARNING, EntityKind::CARD, card.id_,
          {card.id_},
          fmt::format("Card \"{}\" is {} the moodboard but flagged otherwise. The flag will be "
                      "corrected.",
                      card.file_name_, member ? "on" : "not on"));
    }
  }

  for (const auto& tag : tags) {
    auto     it     = references.find(tag.id_);
    uint64_t actual = it == references.end() ? 0 : it->second;
    if (actual == 0 && tag.card_count_ != 0) {
      add(IssueKind::ORPHANED_TAG, IssueSeverity::WARNING, EntityKind::TAG, tag.id_, {tag.id_},
          fmt::format("Tag \"{}\" counts {} card(s) but no card uses it. Its count will be reset "
                      "to 0.",
                      tag.name_, tag.card_count_));
    } else if (actual != tag.card_count_) {
      add(IssueKind::TAG_COUNT_MISMATCH, IssueSeverity::WARNING, EntityKind::TAG, tag.id_,
          {tag.id_},
          fmt::format("Tag \"{}\" counts {} card(s) but {} use it. Its count will be corrected.",
                      tag.name_, tag.card_count_, actual));
    }

    auto category = category_by_id.find(tag.category_id_);
    if (category == category_by_id.end()) {
      add(IssueKind::ORPHANED_TAG_CATEGORY, IssueSeverity::WARNING, EntityKind::TAG, tag.id_,
          {tag.category_id_},
          fmt::format("Tag \"{}\" belongs to a category that no longer exists. The tag will be "
                      "deleted and removed from all cards.",
                      tag.name_));
    } else if (!id_list::Contains(category->second->tag_ids_, tag.id_)) {
      add(IssueKind::UNLISTED_TAG, IssueSeverity::WARNING, EntityKind::CATEGORY,
          category->second->id_, {tag.id_},
          fmt::format("Category \"{}\" does not list its tag \"{}\". The tag will be added back.",
                      category->second->name_, tag.name_));
    }
  }

  for (const auto& collection : collections) {
    auto missing = Missing(collection.card_ids_, card_ids);
    if (missing.empty()) continue;
    auto summary = fmt::format("{} of {}", missing.size(), collection.card_ids_.size());
    add(IssueKind::ORPHANED_COLLECTION, IssueSeverity::WARNING, EntityKind::COLLECTION,
        collection.id_, std::move(missing),
        fmt::format("Collection \"{}\" lists {} cards that no longer exist. They will be removed "
                    "from the collection.",
                    collection.name_, summary));
  }

  for (const auto& category : categories) {
    auto missing = Missing(category.tag_ids_, tag_ids);
    if (missing.empty()) continue;
    auto summary = fmt::format("{} of {}", missing.size(), category.tag_ids_.size());
    add(IssueKind::ORPHANED_CATEGORY, IssueSeverity::WARNING, EntityKind::CATEGORY, category.id_,
        std::move(missing),
        fmt::format("Category \"{}\" lists {} tags that no longer exist. They will be removed from "
                    "the category.",
                    category.name_, summary));
  }

  auto board_missing = Missing(board.card_ids_, card_ids);
  if (!board_missing.empty()) {
    auto count = board_missing.size();
    add(IssueKind::MOODBOARD_MISMATCH, IssueSeverity::WARNING, EntityKind::MOODBOARD, board.id_,
        std::move(board_missing),
        fmt::format("The moodboard lists {} cards that no longer exist. They will be removed.",
                    count));
  }

  for (const auto& issue : report.issues_) {
    if (issue.severity_ == IssueSeverity::ERROR) {
      report.is_valid_ = false;
      break;
    }
  }
  Logger::Integrity()->info("Validation finished: {} issue(s), valid={}", report.issues_.size(),
                            report.is_valid_);
  return report;
}
};  // namespace arcvault
