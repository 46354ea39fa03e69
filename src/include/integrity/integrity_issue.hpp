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

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace arcvault {
enum class IssueKind : uint32_t {
  MISSING_FILE,
  ORPHANED_TAG,
  ORPHANED_TAG_CATEGORY,
  ORPHANED_COLLECTION,
  ORPHANED_CATEGORY,
  MOODBOARD_MISMATCH,
  TAG_COUNT_MISMATCH,
  DANGLING_CARD_REFERENCE,
  MOODBOARD_FLAG_MISMATCH,
  UNLISTED_TAG,
};

enum class IssueSeverity : uint32_t { WARNING, ERROR };

auto IssueKindToString(IssueKind kind) -> const char*;
auto IssueSeverityToString(IssueSeverity severity) -> const char*;

/**
 * @brief One violated cross-reference invariant, found by IntegrityValidator.
 *
 * entity_id_ names the record that will be rewritten by a repair; affected_ids_ lists the ids the
 * issue is about (the dangling references, or the record itself for missing_file).
 */
struct IntegrityIssue {
  IssueKind                kind_;
  IssueSeverity            severity_;
  EntityKind               entity_kind_;
  std::string              entity_id_;
  std::vector<std::string> affected_ids_;
  // Plain-language account of what is wrong and what repair will do
  std::string              description_;

  auto                     AutoFixable() const -> bool { return kind_ != IssueKind::MISSING_FILE; }
  auto                     ToJson() const -> nlohmann::json;
};

struct ValidationReport {
  bool                        is_valid_ = true;
  std::vector<IntegrityIssue> issues_;

  auto                        CountOf(IssueKind kind) const -> size_t;
  auto                        FixableCount() const -> size_t;
  auto                        ToJson() const -> nlohmann::json;
};
};  // namespace arcvault
