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

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "app/project_service.hpp"
#include "archive/archive_types.hpp"
#include "concurrency/thread_pool.hpp"
#include "storage/storage_service.hpp"
#include "utils/queue/queue.hpp"

namespace arcvault {
/**
 * @brief Bounded progress stream. Publishing never blocks; when the consumer falls behind the
 * oldest events are dropped. Completion is never reported here.
 */
class ProgressChannel {
 private:
  ConcurrentBlockingQueue<BackupProgress> _queue;
  std::atomic<uint64_t>                   _dropped{0};

 public:
  explicit ProgressChannel(uint32_t capacity) : _queue(capacity) {}

  void Publish(const BackupProgress& progress) {
    if (!_queue.TryPush(progress)) {
      _dropped.fetch_add(1);
    }
  }

  auto Poll() -> std::optional<BackupProgress> { return _queue.TryPop(); }

  template <typename Rep, typename Period>
  auto WaitFor(const std::chrono::duration<Rep, Period>& timeout)
      -> std::optional<BackupProgress> {
    return _queue.PopFor(timeout);
  }

  auto Dropped() const -> uint64_t { return _dropped.load(); }
};

struct RestoreOutcome {
  RestoreResult result_;
  bool          catalog_imported_ = false;
};

/**
 * @brief Runs backup and restore of the configured working directory. At most one of them runs at
 * any time; a second request while one is active fails with BackupErrorKind::BUSY.
 */
class BackupService {
 private:
  std::shared_ptr<StorageService>  _storage;
  CatalogConfig                    _config;
  std::shared_ptr<ProgressChannel> _progress;
  ProgressCallback                 _observer;
  std::mutex                       _observer_mtx;

  std::atomic<bool>                _busy{false};

  ThreadPool                       _pool{1, "backup"};

  class OperationLock {
   private:
    std::atomic<bool>* _flag;

   public:
    explicit OperationLock(std::atomic<bool>& flag);
    OperationLock(const OperationLock&)            = delete;
    OperationLock& operator=(const OperationLock&) = delete;
    ~OperationLock();
  };

  auto RunBackup(const file_path_t& output_path, uint32_t part_count) -> BackupResult;
  auto RunRestore(const file_path_t& archive_path, std::optional<std::string> expected_checksum)
      -> RestoreOutcome;
  void OnProgress(const BackupProgress& progress);

 public:
  BackupService(std::shared_ptr<StorageService> storage, CatalogConfig config);
  BackupService(const BackupService&)            = delete;
  BackupService& operator=(const BackupService&) = delete;

  auto GetProgressChannel() const -> std::shared_ptr<ProgressChannel> { return _progress; }
  /**
   * @brief Extra progress listener, called on the worker thread after the channel is fed.
   */
  void SetProgressObserver(ProgressCallback observer);
  auto IsBusy() const -> bool { return _busy.load(); }

  /**
   * @brief Archive the working directory together with the current catalog.
   *
   * @param output_path archive file to create
   * @param part_count 1 keeps a single file, N >= 2 splits it into N parts
   * @throws BackupError (BUSY) if another backup or restore is running
   */
  auto Backup(const file_path_t& output_path, uint32_t part_count = 1) -> BackupResult;

  /**
   * @brief Restore the working directory from an archive or its first part and replace the
   * catalog with the one the archive carries. Card paths are rebased onto the working directory.
   */
  auto Restore(const file_path_t&         archive_path,
               std::optional<std::string> expected_checksum = std::nullopt) -> RestoreOutcome;

  // The lock is taken before returning, so BUSY is thrown here rather than through the future.
  auto BackupAsync(const file_path_t& output_path, uint32_t part_count = 1)
      -> std::future<BackupResult>;
  auto RestoreAsync(const file_path_t&         archive_path,
                    std::optional<std::string> expected_checksum = std::nullopt)
      -> std::future<RestoreOutcome>;
};
};  // namespace arcvault
