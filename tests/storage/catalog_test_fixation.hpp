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
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "storage/storage_service.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/id/id_generator.hpp"

namespace arcvault {
class CatalogTests : public ::testing::Test {
 protected:
  std::filesystem::path           test_dir_;
  std::filesystem::path           db_path_;
  std::unique_ptr<StorageService> storage_;

  // Run before any unit test runs
  void                            SetUp() override {
    TimeProvider::Refresh();
    // Create a unique db file location
    test_dir_ = std::filesystem::temp_directory_path() / EntityID::Generate("arcvault_test");
    std::filesystem::create_directories(test_dir_);
    db_path_ = test_dir_ / "catalog.duckdb";
    storage_ = std::make_unique<StorageService>(db_path_);
  }

  void TearDown() override {
    storage_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  auto Catalog() -> CatalogController& { return storage_->GetCatalogController(); }

  auto MakeCard(const std::string& id, const std::string& file_name,
                std::vector<tag_id_t> tags = {}) -> Card {
    Card card;
    card.id_        = id;
    card.file_name_ = file_name;
    card.file_path_ = test_dir_ / "work" / "2024" / "05" / "17" / file_name;
    card.format_    = std::filesystem::path(file_name).extension().string();
    card.file_size_ = 1024;
    card.tags_      = std::move(tags);
    return card;
  }

  auto AddCategory(const std::string& id, const std::string& name) -> category_id_t {
    Category category;
    category.id_   = id;
    category.name_ = name;
    return Catalog().AddCategory(category);
  }

  auto AddTag(const std::string& id, const std::string& name, const category_id_t& category_id,
              uint64_t card_count = 0) -> tag_id_t {
    Tag tag;
    tag.id_          = id;
    tag.name_        = name;
    tag.category_id_ = category_id;
    tag.card_count_  = card_count;
    return Catalog().AddTag(tag);
  }

  auto AddCollection(const std::string& id, const std::string& name,
                     std::vector<card_id_t> card_ids = {}) -> collection_id_t {
    Collection collection;
    collection.id_       = id;
    collection.name_     = name;
    collection.card_ids_ = std::move(card_ids);
    return Catalog().AddCollection(collection);
  }
};
}  // namespace arcvault
