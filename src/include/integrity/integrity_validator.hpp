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

#include <filesystem>
#include <functional>

#include "integrity/integrity_issue.hpp"
#include "storage/controller/catalog/catalog_controller.hpp"

namespace arcvault {
using FileExistsFn = std::function<bool(const std::filesystem::path&)>;

/**
 * @brief Read-only scan of the catalog graph. Produces one issue per offending record; never
 * mutates the store.
 */
class IntegrityValidator {
 private:
  CatalogController& _catalog;
  FileExistsFn       _file_exists;

 public:
  /**
   * @param catalog
   * @param file_exists host callback deciding whether a card's file is present; defaults to a
   * regular-file check on the local filesystem
   */
  explicit IntegrityValidator(CatalogController& catalog, FileExistsFn file_exists = {});

  auto Validate() -> ValidationReport;
};
};  // namespace arcvault
