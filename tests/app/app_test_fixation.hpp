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

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>

#include "app/project_service.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/id/id_generator.hpp"

namespace arcvault {
class AppServiceTests : public ::testing::Test {
 protected:
  std::filesystem::path test_dir_;
  CatalogConfig         config_;

  void                  SetUp() override {
    TimeProvider::Refresh();
    test_dir_ = std::filesystem::temp_directory_path() / EntityID::Generate("arcvault_app");
    config_.db_path_     = test_dir_ / "catalog.duckdb";
    config_.working_dir_ = test_dir_ / "work";
    config_.temp_dir_    = test_dir_ / "tmp";
    std::filesystem::create_directories(config_.working_dir_);
    std::filesystem::create_directories(config_.temp_dir_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  static void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
  }
};
}  // namespace arcvault
