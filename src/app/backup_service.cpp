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

#include "app/backup_service.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "archive/archive_builder.hpp"
#include "archive/restore_coordinator.hpp"
#include "catalog/catalog_snapshot.hpp"
#include "utils/log/logger.hpp"

namespace arcvault {
BackupService::OperationLock::OperationLock(std::atomic<bool>& flag) : _flag(&flag) {
  bool expected = false;
  if (!_flag->compare_exchange_strong(expected, true)) {
    throw BackupError(BackupErrorKind::BUSY, "Another backup or restore is already running");
  }
}

BackupService::OperationLock::~OperationLock() { _flag->store(false); }

BackupService::BackupService(std::shared_ptr<StorageService> storage, CatalogConfig config)
    : _storage(std::move(storage)),
      _config(std::move(config)),
      _progress(std::make_shared<ProgressChannel>(_config.progress_capacity_)) {
  if (!_storage) {
    throw std::invalid_argument("BackupService requires a storage service");
  }
}

void BackupService::SetProgressObserver(ProgressCallback observer) {
  std::lock_guard<std::mutex> lock(_observer_mtx);
  _observer = std::move(observer);
}

void BackupService::OnProgress(const BackupProgress& progress) {
  _progress->Publish(progress);
  ProgressCallback observer;
  {
    std::lock_guard<std::mutex> lock(_observer_mtx);
    observer = _observer;
  }
  if (observer) observer(progress);
}

auto BackupService::RunBackup(const file_path_t& output_path, uint32_t part_count)
    -> BackupResult {
  BackupRequest request;
  request.output_path_      = output_path;
  request.working_dir_      = _config.working_dir_;
  request.part_count_       = part_count;
  request.serialized_store_ = _storage->GetCatalogController().ExportSnapshot().Dump();

  ArchiveBuilder builder(_config.compression_level_,
                         [this](const BackupProgress& progress) { OnProgress(progress); });
  try {
    return builder.CreateBackup(request);
  } catch (const std::exception& e) {
    Logger::App()->error("Backup to {} failed: {}", output_path.string(), e.what());
    throw;
  }
}

auto BackupService::RunRestore(const file_path_t&         archive_path,
                               std::optional<std::string> expected_checksum) -> RestoreOutcome {
  RestoreRequest request;
  request.archive_path_      = archive_path;
  request.target_dir_        = _config.working_dir_;
  request.expected_checksum_ = std::move(expected_checksum);

  RestoreCoordinator coordinator(_config.temp_dir_);
  RestoreOutcome     outcome;
  try {
    outcome.result_ = coordinator.RestoreBackup(request);
  } catch (const std::exception& e) {
    Logger::App()->error("Restore from {} failed: {}", archive_path.string(), e.what());
    throw;
  }

  if (outcome.result_.serialized_store_) {
    CatalogSnapshot snapshot;
    try {
      snapshot = CatalogSnapshot::Parse(*outcome.result_.serialized_store_);
    } catch (const std::exception& e) {
      throw BackupError(BackupErrorKind::FORMAT,
                        std::string("Archived catalog is not readable: ") + e.what());
    }
    _storage->GetCatalogController().ImportSnapshot(snapshot, _config.working_dir_);
    outcome.catalog_imported_ = true;
    Logger::App()->info("Imported archived catalog with {} cards", snapshot.cards_.size());
  }
  return outcome;
}

auto BackupService::Backup(const file_path_t& output_path, uint32_t part_count) -> BackupResult {
  OperationLock lock(_busy);
  return RunBackup(output_path, part_count);
}

auto BackupService::Restore(const file_path_t&         archive_path,
                            std::optional<std::string> expected_checksum) -> RestoreOutcome {
  OperationLock lock(_busy);
  return RunRestore(archive_path, std::move(expected_checksum));
}

auto BackupService::BackupAsync(const file_path_t& output_path, uint32_t part_count)
    -> std::future<BackupResult> {
  auto lock    = std::make_shared<OperationLock>(_busy);
  auto promise = std::make_shared<std::promise<BackupResult>>();
  auto future  = promise->get_future();
  _pool.Submit([this, lock, promise, output_path, part_count]() mutable {
    try {
      auto result = RunBackup(output_path, part_count);
      lock.reset();
      promise->set_value(std::move(result));
    } catch (const std::exception&) {
      lock.reset();
      promise->set_exception(std::current_exception());
    }
  });
  return future;
}

auto BackupService::RestoreAsync(const file_path_t&         archive_path,
                                 std::optional<std::string> expected_checksum)
    -> std::future<RestoreOutcome> {
  auto lock    = std::make_shared<OperationLock>(_busy);
  auto promise = std::make_shared<std::promise<RestoreOutcome>>();
  auto future  = promise->get_future();
  _pool.Submit([this, lock, promise, archive_path, expected_checksum]() mutable {
    try {
      auto outcome = RunRestore(archive_path, std::move(expected_checksum));
      lock.reset();
      promise->set_value(std::move(outcome));
    } catch (const std::exception&) {
      lock.reset();
      promise->set_exception(std::current_exception());
    }
  });
  return future;
}
};  // namespace arcvault
