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

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace arcvault {
/**
 * @brief Fixed-size worker pool for long-running jobs (backup, restore). A task that throws is
 * logged and dropped; the worker keeps serving the queue.
 */
class ThreadPool {
 public:
  ThreadPool(size_t thread_count, std::string name);
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  /**
   * @throws std::runtime_error once Shutdown() has been called
   */
  void Submit(std::function<void()> task);

  /**
   * @brief Queued plus running tasks
   */
  auto Pending() -> size_t;
  void WaitIdle();
  /**
   * @brief Stop accepting tasks, drain the queue and join the workers. Safe to call twice.
   */
  void Shutdown();

 private:
  std::string                       _name;
  std::queue<std::function<void()>> _tasks;
  std::mutex                        _mtx;
  std::condition_variable           _task_cv;
  std::condition_variable           _idle_cv;
  std::vector<std::thread>          _workers;
  size_t                            _running  = 0;
  bool                              _stopping = false;

  void                              WorkerThread();
};
};  // namespace arcvault
