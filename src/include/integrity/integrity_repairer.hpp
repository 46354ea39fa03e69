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
#include <string>
#include <vector>

#include "integrity/integrity_issue.hpp"
#include "storage/controller/catalog/catalog_controller.hpp"

namespace arcvault {
struct RepairFailure {
  IntegrityIssue issue_;
  std::string    error_;
};

struct RepairResult {
  uint32_t                   fixed_   = 0;
  uint32_t                   skipped_ = 0;
  std::vector<RepairFailure> failures_;
};

/**
 * @brief Applies the automatic repair for each fixable issue. Every issue is repaired on its own:
 * an exception while fixing one is logged and recorded, and the batch continues. Repairs re-read
 * the current records, so issues that are already resolved are skipped.
 */
class IntegrityRepairer {
 private:
  CatalogController& _catalog;

  auto               RepairOne(const IntegrityIssue& issue) -> bool;

 public:
  explicit IntegrityRepairer(CatalogController& catalog);

  /**
   * @brief Repair the given issues.
   *
   * @param issues
   * @return number of issues fixed
   */
  auto Repair(const std::vector<IntegrityIssue>& issues) -> uint32_t;
  auto RepairDetailed(const std::vector<IntegrityIssue>& issues) -> RepairResult;
};
};  // namespace arcvault
