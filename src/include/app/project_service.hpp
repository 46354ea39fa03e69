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
#include <filesystem>
#include <memory>
#include <string>

#include "storage/storage_service.hpp"
#include "type/type.hpp"

namespace arcvault {
/**
 * @brief Everything a catalog session needs to know about its environment. Passed explicitly to
 * the components that use it.
 */
struct CatalogConfig {
  file_path_t db_path_           = "arc_catalog.duckdb";
  file_path_t working_dir_;
  file_path_t temp_dir_;
  file_path_t log_dir_;
  std::string log_level_         = "info";
  int         compression_level_ = 9;
  uint32_t    progress_capacity_ = 64;

  auto        ToJson() const -> nlohmann::json;
  /**
   * @brief Keys missing from j keep the values of defaults.
   */
  static auto FromJson(const nlohmann::json& j, const CatalogConfig& defaults = {})
      -> CatalogConfig;
};

class ProjectService {
 public:
  /**
   * @brief Load the project file at meta_path. A missing or unreadable file starts a fresh
   * project from defaults.
   */
  ProjectService(const std::filesystem::path& meta_path, CatalogConfig defaults = {});

  void SaveProject(const std::filesystem::path& meta_path);
  void LoadProject(const std::filesystem::path& meta_path);

  auto GetStorageService() const -> std::shared_ptr<StorageService> { return storage_service_; }
  auto GetConfig() const -> const CatalogConfig& { return config_; }
  auto GetMetaPath() const -> const std::filesystem::path& { return meta_path_; }

  void SetWorkingDir(const std::filesystem::path& working_dir);

 private:
  void                            OpenStorage();

  CatalogConfig                   config_;
  std::filesystem::path           meta_path_;
  std::shared_ptr<StorageService> storage_service_;
};
};  // namespace arcvault
