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

#include "utils/clock/time_provider.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace arcvault {
std::atomic<std::chrono::system_clock::time_point> TimeProvider::_cached_sys_time;
std::atomic<std::chrono::steady_clock::time_point> TimeProvider::_cached_steady_time;
std::atomic<bool>                                  TimeProvider::_refreshed{false};

void                                               TimeProvider::Refresh() {
  _cached_sys_time    = std::chrono::system_clock::now();
  _cached_steady_time = std::chrono::steady_clock::now();
  _refreshed          = true;
}

std::chrono::system_clock::time_point TimeProvider::Now() {
  if (!_refreshed.load()) {
    Refresh();
  }
  auto elapsed = std::chrono::steady_clock::now() - _cached_steady_time.load();
  return _cached_sys_time.load() +
         std::chrono::duration_cast<std::chrono::system_clock::duration>(elapsed);
}

std::string TimeProvider::NowIso() { return TimePointToIso(Now()); }

int64_t     TimeProvider::NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Now().time_since_epoch()).count();
}

std::string TimeProvider::TimePointToString(const std::chrono::system_clock::time_point& tp) {
  std::time_t        t = std::chrono::system_clock::to_time_t(tp);
  std::tm            tm{};
  localtime_r(&t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d_%H-%M-%S");
  return oss.str();
}

std::string TimeProvider::TimePointToIso(const std::chrono::system_clock::time_point& tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm     tm{};
  gmtime_r(&t, &tm);
  auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return oss.str();
}
}  // namespace arcvault
