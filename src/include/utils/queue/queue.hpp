/*
 * @file        arc-vault/src/include/utils/queue/queue.hpp
 * @brief       Thread-safe queues used by the worker pool and the progress channel
 * @author      Yurun Zi
 * @date        2026-01-12
 * @license     MIT
 *
 * @copyright   Copyright (c) 2026 Yurun Zi
 */

// Copyright (c) 2026 Yurun Zi
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#pragma once

namespace arcvault {
/**
 * @brief A thread-safe blocking queue. With a capacity limit, TryPush() never blocks: when the
 * queue is full the oldest element is dropped to make room.
 */
template <typename T>
class ConcurrentBlockingQueue {
 public:
  explicit ConcurrentBlockingQueue() { _has_capacity_limit = false; };

  explicit ConcurrentBlockingQueue(uint32_t max_size) : _max_size(max_size) {}

  /**
   * @brief A thread-safe wrapper for push(), waits while the queue is full
   *
   * @param new_request the request to enqueue
   */
  void push(T new_request) {
    {
      std::unique_lock<std::mutex> lock(mtx);
      _producer_cv.wait(lock, [this] { return !_has_capacity_limit || _queue.size() < _max_size; });
      _queue.push_back(std::move(new_request));
    }
    _consumer_cv.notify_all();
  }

  /**
   * @brief Enqueue without blocking.
   *
   * @param new_request
   * @return true if nothing had to be dropped
   */
  bool TryPush(T new_request) {
    bool dropped = false;
    {
      std::unique_lock<std::mutex> lock(mtx);
      if (_has_capacity_limit && _max_size > 0 && _queue.size() >= _max_size) {
        _queue.pop_front();
        dropped = true;
      }
      _queue.push_back(std::move(new_request));
    }
    _consumer_cv.notify_all();
    return !dropped;
  }

  /**
   * @brief A thread-safe wrapper for pop() method
   *
   * @return the front-most element of the queue
   */
  T pop() {
    std::unique_lock<std::mutex> lock(mtx);
    // Wait for the queue to be fill with at least one value
    _consumer_cv.wait(lock, [this] { return !_queue.empty(); });

    auto handled_request = std::move(_queue.front());
    _queue.pop_front();
    lock.unlock();
    _producer_cv.notify_all();

    return handled_request;
  }

  auto TryPop() -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mtx);
    if (_queue.empty()) {
      return std::nullopt;
    }
    auto handled_request = std::move(_queue.front());
    _queue.pop_front();
    lock.unlock();
    _producer_cv.notify_all();
    return handled_request;
  }

  template <typename Rep, typename Period>
  auto PopFor(const std::chrono::duration<Rep, Period>& timeout) -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mtx);
    if (!_consumer_cv.wait_for(lock, timeout, [this] { return !_queue.empty(); })) {
      return std::nullopt;
    }
    auto handled_request = std::move(_queue.front());
    _queue.pop_front();
    lock.unlock();
    _producer_cv.notify_all();
    return handled_request;
  }

  auto size() -> size_t {
    std::lock_guard<std::mutex> lock(mtx);
    return _queue.size();
  }

 private:
  std::uint32_t           _max_size           = 0;
  bool                    _has_capacity_limit = true;
  std::deque<T>           _queue;
  std::mutex              mtx;
  std::condition_variable _producer_cv;
  std::condition_variable _consumer_cv;
};
};  // namespace arcvault
