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

#include "concurrency/thread_pool.hpp"

#include <stdexcept>
#include <utility>

#include "utils/log/logger.hpp"

namespace arcvault {
ThreadPool::ThreadPool(size_t thread_count, std::string name) : _name(std::move(name)) {
  if (thread_count == 0) {
    throw std::invalid_argument("ThreadPool needs at least one worker");
  }
  _workers.reserve(thread_count);
  for (size_t i = 0; i < thread_count; ++i) {
    _workers.emplace_back(&ThreadPool::WorkerThread, this);
  }
}

ThreadPool::~ThreadPool() { Shutdown(); }

void ThreadPool::Submit(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_stopping) {
      throw std::runtime_error("ThreadPool " + _name + " is shut down");
    }
    _tasks.push(std::move(task));
  }
  _task_cv.notify_one();
}

auto ThreadPool::Pending() -> size_t {
  std::lock_guard<std::mutex> lock(_mtx);
  return _tasks.size() + _running;
}

void ThreadPool::WaitIdle() {
  std::unique_lock<std::mutex> lock(_mtx);
  _idle_cv.wait(lock, [this] { return _tasks.empty() && _running == 0; });
}

void ThreadPool::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_stopping && _workers.empty()) return;
    _stopping = true;
  }
  _task_cv.notify_all();
  for (auto& worker : _workers) {
    if (worker.joinable()) worker.join();
  }
  _workers.clear();
}

void ThreadPool::WorkerThread() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(_mtx);
      _task_cv.wait(lock, [this] { return _stopping || !_tasks.empty(); });
      if (_tasks.empty()) return;
      task = std::move(_tasks.front());
      _tasks.pop();
      ++_running;
    }
    try {
      task();
    } catch (const std::exception& e) {
      Logger::App()->error("Task on pool {} failed: {}", _name, e.what());
    }
    {
      std::lock_guard<std::mutex> lock(_mtx);
      --_running;
      if (_tasks.empty() && _running == 0) _idle_cv.notify_all();
    }
  }
}
};  // namespace arcvault
