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
#include <cstdint>
#include <random>
#include <string>

#include <fmt/format.h>

#include "utils/clock/time_provider.hpp"

namespace arcvault {
namespace EntityID {
/**
 * @brief Generate a catalog id of the form <prefix>_<epoch millis>_<random suffix>. Ids sort
 * roughly by creation time and do not collide across sessions.
 *
 * @param prefix
 * @return std::string
 */
inline auto Generate(const std::string& prefix) -> std::string {
  static std::atomic<uint32_t>   sequence{0};
  thread_local std::mt19937_64   rng{std::random_device{}()};
  uint32_t                       seq  = sequence.fetch_add(1, std::memory_order_relaxed);
  uint64_t                       salt = rng() & 0xFFFFFFULL;
  return fmt::format("{}_{}_{:06x}{:04x}", prefix, TimeProvider::NowMillis(), salt, seq & 0xFFFF);
}
};  // namespace EntityID
};  // namespace arcvault
