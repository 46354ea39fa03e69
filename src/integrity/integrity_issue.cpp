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

#include "integrity/integrity_issue.hpp"

#include <algorithm>

namespace arcvault {
auto IssueKindToString(IssueKind kind) -> const char* {
  switch (kind) {
    case IssueKind::MISSING_FILE:
      return "missing_file";
    case IssueKind::ORPHANED_TAG:
      return "orphaned_tag";
    case IssueKind::ORPHANED_TAG_CATEGORY:
      return "orphaned_tag_category";
    case IssueKind::ORPHANED_COLLECTION:
      return "orphaned_collection";
    case IssueKind::ORPHANED_CATEGORY:
      return "orphaned_category";
    case IssueKind::MOODBOARD_MISMATCH:
      return "moodboard_mismatch";
    case IssueKind::TAG_COUNT_MISMATCH:
      return "tag_count_mismatch";
    case IssueKind::DANGLING_CARD_REFERENCE:
      return "dangling_card_reference";
    case IssueKind::MOODBOARD_FLAG_MISMATCH:
      return "moodboard_flag_mismatch";
    case IssueKind::UNLISTED_TAG:
      return "unlisted_tag";
  }
  return "unknown";
}

auto IssueSeverityToString(IssueSeverity severity) -> const char* {
  return severity == IssueSeverity::ERROR ? "error" : "warning";
}

auto IntegrityIssue::ToJson() const -> nlohmann::json {
  return {{"type", IssueKindToString(kind_)},
          {"severity", IssueSeverityToString(severity_)},
          {"entityId", entity_id_},
          {"affectedIds", affected_ids_},
          {"description", description_},
          {"autoFixable", AutoFixable()}};
}

auto ValidationReport::CountOf(IssueKind kind) const -> size_t {
  return static_cast<size_t>(std::count_if(issues_.begin(), issues_.end(),
                                           [&](const IntegrityIssue& i) { return i.kind_ == kind; }));
}

auto ValidationReport::FixableCount() const -> size_t {
  return static_cast<size_t>(std::count_if(issues_.begin(), issues_.end(),
                                           [](const IntegrityIssue& i) { return i.AutoFixable(); }));
}

auto ValidationReport::ToJson() const -> nlohmann::json {
  auto issues = nlohmann::json::array();
  for (const auto& issue : issues_) issues.push_back(issue.ToJson());
  return {{"isValid", is_valid_}, {"issues", issues}};
}
};  // namespace arcvault
