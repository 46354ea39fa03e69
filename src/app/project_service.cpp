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

#include "app/project_service.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

#include "utils/log/logger.hpp"

namespace arcvault {
auto CatalogConfig::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["db_path"]           = db_path_.string();
  j["working_dir"]       = working_dir_.string();
  j["temp_dir"]          = temp_dir_.string();
  j["log_dir"]           = log_dir_.string();
  j["log_level"]         = log_level_;
  j["compression_level"] = compression_level_;
  j["progress_capacity"] = progress_capacity_;
  return j;
}

auto CatalogConfig::FromJson(const nlohmann::json& j, const CatalogConfig& defaults)
    -> CatalogConfig {
  if (!j.is_object()) {
    throw std::invalid_argument("Project file is not a JSON object");
  }
  auto path_or = [&j](const char* key, const file_path_t& fallback) -> file_path_t {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    return file_path_t(it->get<std::string>());
  };

  CatalogConfig config      = defaults;
  config.db_path_           = path_or("db_path", defaults.db_path_);
  config.working_dir_       = path_or("working_dir", defaults.working_dir_);
  config.temp_dir_          = path_or("temp_dir", defaults.temp_dir_);
  config.log_dir_           = path_or("log_dir", defaults.log_dir_);
  config.log_level_         = j.value("log_level", defaults.log_level_);
  config.compression_level_ = j.value("compression_level", defaults.compression_level_);
  config.progress_capacity_ = j.value("progress_capacity", defaults.progress_capacity_);
  if (config.compression_level_ < 0 || config.compression_level_ > 9) {
    throw std::invalid_argument("compression_level must be within 0..9");
  }
  return config;
}

ProjectService::ProjectService(const std::filesystem::path& meta_path, CatalogConfig defaults)
    : config_(std::move(defaults)), meta_path_(meta_path) {
  try {
    LoadProject(meta_path);
  } catch (const std::exception& e) {
    // Load failed, create new project
    Logger::App()->info("Starting a new project at {}: {}", meta_path.string(), e.what());
    meta_path_ = meta_path;
    OpenStorage();
  }
}

void ProjectService::SaveProject(const std::filesystem::path& meta_path) {
  meta_path_ = meta_path;
  if (meta_path_.has_parent_path()) {
    std::filesystem::create_directories(meta_path_.parent_path());
  }

  std::ofstream file(meta_path_);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open meta file for writing");
  }
  file << config_.ToJson().dump(4);
  file.close();
  if (!file) {
    throw std::runtime_error("Failed to write meta file " + meta_path_.string());
  }
}

void ProjectService::LoadProject(const std::filesystem::path& meta_path) {
  std::ifstream file(meta_path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open meta file for reading");
  }

  nlohmann::json metadata;
  file >> metadata;

  config_    = CatalogConfig::FromJson(metadata, config_);
  meta_path_ = meta_path;
  OpenStorage();
}

void ProjectService::SetWorkingDir(const std::filesystem::path& working_dir) {
  config_.working_dir_ = working_dir;
}

void ProjectService::OpenStorage() {
  if (!config_.log_dir_.empty()) {
    Logger::Init(config_.log_dir_, Logger::LevelFromString(config_.log_level_));
  }
  storage_service_.reset();
  storage_service_ = std::make_shared<StorageService>(config_.db_path_);
}
};  // namespace arcvault
