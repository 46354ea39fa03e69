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
#include <string>

namespace arcvault {
/**
 * @brief Cached wall clock. Refresh() pins the system time once, later calls advance it with the
 * steady clock so timestamps stay monotonic within a session.
 */
class TimeProvider {
 private:
  static std::atomic<std::chrono::system_clock::time_point> _cached_sys_time;
  static std::atomic<std::chrono::steady_clock::time_point> _cached_steady_time;
  static std::atomic<bool>                                  _refreshed;

 public:
  static void Refresh();
  static auto Now() -> std::chrono::system_clock::time_point;
  static auto NowIso() -> std::string;
  static auto NowMillis() -> int64_t;

  static auto TimePointToString(const std::chrono::system_clock::time_point& tp) -> std::string;
  static auto TimePointToIso(const std::chrono::system_clock::time_point& tp) -> std::string;
};
}  // namespace arcvault
