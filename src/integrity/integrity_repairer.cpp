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

#include "integrity/integrity_repairer.hpp"

#include <algorithm>
#include <exception>

#include "catalog/entity_json.hpp"
#include "utils/log/logger.hpp"

namespace arcvault {
namespace {
// Deletions go first so later rewrites and counts see the final set of records
auto RepairRank(IssueKind kind) -> int {
  switch (kind) {
    case IssueKind::ORPHANED_TAG_CATEGORY:
      return 0;
    case IssueKind::ORPHANED_COLLECTION:
    case IssueKind::ORPHANED_CATEGORY:
    case IssueKind::MOODBOARD_MISMATCH:
    case IssueKind::DANGLING_CARD_REFERENCE:
    case IssueKind::UNLISTED_TAG:
      return 1;
    case IssueKind::MOODBOARD_FLAG_MISMATCH:
      return 2;
    case IssueKind::ORPHANED_TAG:
    case IssueKind::TAG_COUNT_MISMATCH:
      return 3;
    case IssueKind::MISSING_FILE:
      return 4;
  }
  return 4;
}
};  // namespace

IntegrityRepairer::IntegrityRepairer(CatalogController& catalog) : _catalog(catalog) {}

auto IntegrityRepairer::RepairOne(const IntegrityIssue& issue) -> bool {
  switch (issue.kind_) {
    case IssueKind::MISSING_FILE:
      return false;

    case IssueKind::ORPHANED_TAG:
    case IssueKind::TAG_COUNT_MISMATCH: {
      auto tag = _catalog.GetTag(issue.entity_id_);
      if (!tag) return false;
      uint64_t actual = _catalog.GetCardsByTags({tag->id_}).size();
      if (tag->card_count_ == actual) return false;
      TagPatch patch;
      patch.card_count_ = actual;
      return _catalog.UpdateTag(tag->id_, patch) > 0;
    }

    case IssueKind::ORPHANED_TAG_CATEGORY: {
      auto tag = _catalog.GetTag(issue.entity_id_);
      if (!tag || _catalog.GetCategory(tag->category_id_)) return false;
      _catalog.DeleteTag(tag->id_);
      return true;
    }

    case IssueKind::ORPHANED_COLLECTION: {
      auto collection = _catalog.GetCollection(issue.entity_id_);
      if (!collection) return false;
      CollectionPatch patch;
      patch.card_ids_ = collection->card_ids_;
      _catalog.UpdateCollection(collection->id_, patch);
      auto after = _catalog.GetCollection(collection->id_);
      return after && after->card_ids_.size() != collection->card_ids_.size();
    }

    case IssueKind::ORPHANED_CATEGORY: {
      auto category = _catalog.GetCategory(issue.entity_id_);
      if (!category) return false;
      CategoryPatch patch;
      patch.tag_ids_ = category->tag_ids_;
      _catalog.UpdateCategory(category->id_, patch);
      auto after = _catalog.GetCategory(category->id_);
      return after && after->tag_ids_.size() != category->tag_ids_.size();
    }

    case IssueKind::UNLISTED_TAG: {
      auto category = _catalog.GetCategory(issue.entity_id_);
      if (!category) return false;
      bool changed = false;
      for (const auto& tag_id : issue.affected_ids_) {
        auto tag = _catalog.GetTag(tag_id);
        if (tag && tag->category_id_ == category->id_) {
          changed |= id_list::Insert(category->tag_ids_, tag_id);
        }
      }
      if (!changed) return false;
      CategoryPatch patch;
      patch.tag_ids_ = category->tag_ids_;
      return _catalog.UpdateCategory(category->id_, patch) > 0;
    }

    case IssueKind::MOODBOARD_MISMATCH: {
      auto board = _catalog.GetMoodboard();
      auto kept  = id_list::Filter(board.card_ids_, [&](const card_id_t& id) {
        return _catalog.GetCard(id).has_value();
      });
      if (kept.size() == board.card_ids_.size()) return false;
      _catalog.ReplaceMoodboardCards(kept);
      return true;
    }

    case IssueKind::DANGLING_CARD_REFERENCE: {
      auto card = _catalog.GetCard(issue.entity_id_);
      if (!card) return false;
      CardPatch patch;
      patch.tags_        = card->tags_;
      patch.collections_ = card->collections_;
      _catalog.UpdateCard(card->id_, patch);
      auto after = _catalog.GetCard(card->id_);
      return after && (after->tags_.size() != card->tags_.size() ||
                       after->collections_.size() != card->collections_.size());
    }

    case IssueKind::MOODBOARD_FLAG_MISMATCH: {
      auto card = _catalog.GetCard(issue.entity_id_);
      if (!card) return false;
      bool member = id_list::Contains(_catalog.GetMoodboard().card_ids_, card->id_);
      if (card->in_moodboard_ == member) return false;
      CardPatch patch;
      patch.in_moodboard_ = member;
      return _catalog.UpdateCard(card->id_, patch) > 0;
    }
  }
  return false;
}

auto IntegrityRepairer::RepairDetailed(const std::vector<IntegrityIssue>& issues)
    -> RepairResult {
  std::vector<const IntegrityIssue*> ordered;
  ordered.reserve(issues.size());
  for (const auto& issue : issues) ordered.push_back(&issue);
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const IntegrityIssue* lhs, const IntegrityIssue* rhs) {
                     return RepairRank(lhs->kind_) < RepairRank(rhs->kind_);
                   });

  RepairResult result;
  for (const auto* issue : ordered) {
    if (!issue->AutoFixable()) {
      ++result.skipped_;
      continue;
    }
    try {
      if (RepairOne(*issue)) {
        ++result.fixed_;
        Logger::Integrity()->info("Repaired {} on {}", IssueKindToString(issue->kind_),
                                  issue->entity_id_);
      } else {
        ++result.skipped_;
      }
    } catch (const std::exception& e) {
      Logger::Integrity()->error("Failed to repair {} on {}: {}", IssueKindToString(issue->kind_),
                                 issue->entity_id_, e.what());
      result.failures_.push_back({*issue, e.what()});
    }
  }
  Logger::Integrity()->info("Repair finished: {} fixed, {} skipped, {} failed", result.fixed_,
                            result.skipped_, result.failures_.size());
  return result;
}

auto IntegrityRepairer::Repair(const std::vector<IntegrityIssue>& issues) -> uint32_t {
  return RepairDetailed(issues).fixed_;
}
};  // namespace arcvault
