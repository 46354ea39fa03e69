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

#include "storage/storage_service.hpp"

namespace arcvault {
StorageService::StorageService(std::filesystem::path db_path)
    : _db_ctrl(db_path), _catalog_ctrl(_db_ctrl.GetConnectionGuard()) {}

auto StorageService::GetDBController() -> DBController& { return _db_ctrl; }

auto StorageService::GetCatalogController() -> CatalogController& { return _catalog_ctrl; }
};  // namespace arcvault
