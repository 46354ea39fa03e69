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

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "app/backup_service.hpp"
#include "archive/plain_zip.hpp"
#include "app_test_fixation.hpp"

namespace arcvault {
namespace {
auto AddPhoto(CatalogController& catalog, const std::filesystem::path& work_dir,
              const std::string& id, const std::string& name) -> card_id_t {
  Card card;
  card.id_        = id;
  card.file_path_ = work_dir / "2024" / "05" / "17" / name;
  return catalog.AddCard(card);
}
};  // namespace

TEST_F(AppServiceTests, BackupAndRestoreCatalogWithFiles) {
  auto storage = std::make_shared<StorageService>(config_.db_path_);
  auto& catalog = storage->GetCatalogController();
  WriteFile(config_.working_dir_ / "2024" / "05" / "17" / "a.jpg", "jpeg bytes");
  WriteFile(config_.working_dir_ / "2024" / "05" / "17" / "b.jpg", "more jpeg bytes");
  AddPhoto(catalog, config_.working_dir_, "card_a", "a.jpg");
  AddPhoto(catalog, config_.working_dir_, "card_b", "b.jpg");

  BackupService service(storage, config_);
  auto          archive = test_dir_ / "backups" / "catalog.zip";
  auto          result  = service.Backup(archive, 2);
  EXPECT_EQ(result.files_count_, 2u);
  ASSERT_EQ(result.output_files_.size(), 2u);

  catalog.DeleteCard("card_b");
  std::filesystem::remove(config_.working_dir_ / "2024" / "05" / "17" / "b.jpg");

  auto outcome = service.Restore(result.output_files_.front(), result.manifest_.checksum_);
  EXPECT_TRUE(outcome.result_.success_);
  EXPECT_TRUE(outcome.catalog_imported_);
  auto restored = catalog.GetCard("card_b");
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(restored->file_path_.string(),
            (config_.working_dir_ / "2024" / "05" / "17" / "b.jpg").string());
  EXPECT_TRUE(std::filesystem::exists(restored->file_path_));
  EXPECT_FALSE(service.IsBusy());
}

TEST_F(AppServiceTests, RestoreOfPlainZipLeavesCatalogAlone) {
  auto  storage = std::make_shared<StorageService>(config_.db_path_);
  auto& catalog = storage->GetCatalogController();
  WriteFile(config_.working_dir_ / "2024" / "05" / "17" / "a.jpg", "jpeg bytes");
  AddPhoto(catalog, config_.working_dir_, "card_a", "a.jpg");

  auto archive = test_dir_ / "manual.zip";
  WritePlainZip(archive, {{"2024/06/01/c.jpg", "new bytes"}});

  BackupService service(storage, config_);
  auto          outcome = service.Restore(archive);
  EXPECT_TRUE(outcome.result_.success_);
  EXPECT_FALSE(outcome.result_.serialized_store_.has_value());
  EXPECT_FALSE(outcome.catalog_imported_);
  EXPECT_TRUE(std::filesystem::exists(config_.working_dir_ / "2024" / "06" / "01" / "c.jpg"));

  EXPECT_EQ(catalog.CountCards(), 1u);
  EXPECT_TRUE(catalog.GetCard("card_a").has_value());
  EXPECT_FALSE(service.IsBusy());
}

TEST_F(AppServiceTests, ProgressFlowsThroughChannel) {
  auto storage = std::make_shared<StorageService>(config_.db_path_);
  WriteFile(config_.working_dir_ / "data.bin", std::string(200000, 'x'));
  config_.progress_capacity_ = 2;

  BackupService service(storage, config_);
  auto          future = service.BackupAsync(test_dir_ / "backups" / "async.zip");
  auto          result = future.get();
  EXPECT_EQ(result.files_count_, 1u);

  auto channel = service.GetProgressChannel();
  std::optional<BackupProgress> last = channel->WaitFor(std::chrono::seconds(1));
  ASSERT_TRUE(last.has_value());
  while (auto event = channel->Poll()) last = event;
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->percent_, 100u);
  EXPECT_GT(channel->Dropped(), 0u);
}

TEST_F(AppServiceTests, SecondOperationWhileBusyIsRejected) {
  auto storage = std::make_shared<StorageService>(config_.db_path_);
  WriteFile(config_.working_dir_ / "data.bin", std::string(1000, 'y'));

  BackupService      service(storage, config_);
  std::promise<void> entered;
  std::promise<void> release;
  auto               release_future = release.get_future().share();
  std::atomic<bool>  first{true};
  service.SetProgressObserver([&, release_future](const BackupProgress&) {
    if (first.exchange(false)) {
      entered.set_value();
      release_future.wait();
    }
  });

  auto running = service.BackupAsync(test_dir_ / "backups" / "first.zip");
  entered.get_future().wait();
  EXPECT_TRUE(service.IsBusy());
  try {
    service.Backup(test_dir_ / "backups" / "second.zip");
    FAIL() << "concurrent backup was accepted";
  } catch (const BackupError& e) {
    EXPECT_EQ(e.Kind(), BackupErrorKind::BUSY);
  }
  EXPECT_THROW(service.RestoreAsync(test_dir_ / "backups" / "first.zip"), BackupError);

  release.set_value();
  EXPECT_NO_THROW(running.get());
  EXPECT_FALSE(service.IsBusy());
  EXPECT_FALSE(std::filesystem::exists(test_dir_ / "backups" / "second.zip"));
}

TEST_F(AppServiceTests, FailedAsyncBackupReleasesLock) {
  auto storage = std::make_shared<StorageService>(config_.db_path_);
  config_.working_dir_ = test_dir_ / "missing";

  BackupService service(storage, config_);
  auto          future = service.BackupAsync(test_dir_ / "backups" / "nothing.zip");
  try {
    future.get();
    FAIL() << "backup of a missing directory succeeded";
  } catch (const BackupError& e) {
    EXPECT_EQ(e.Kind(), BackupErrorKind::DIRECTORY_UNAVAILABLE);
  }
  EXPECT_FALSE(service.IsBusy());
}
}  // namespace arcvault
