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

#include "storage/controller/catalog/catalog_controller.hpp"
#include "storage/controller/db_controller.hpp"

namespace arcvault {
/**
 * @brief Entry point to the catalog store: opens the database and owns the controller that works
 * on it.
 */
class StorageService {
 private:
  DBController      _db_ctrl;
  CatalogController _catalog_ctrl;

 public:
  explicit StorageService(std::filesystem::path db_path);

  auto GetDBController() -> DBController&;
  auto GetCatalogController() -> CatalogController&;
};
};  // namespace arcvault
