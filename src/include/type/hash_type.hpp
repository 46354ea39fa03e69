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

#include <xxhash.h>

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace arcvault {
/**
 * @brief XXH3-64 digest, printed as 16 lowercase hex digits.
 */
class Checksum64 {
 public:
  Checksum64() : _h(0) {}
  explicit Checksum64(XXH64_hash_t h) : _h(h) {}

  uint64_t    Value() const { return _h; }

  std::string ToString() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << _h;
    return oss.str();
  }

  static Checksum64 FromString(const std::string& str) {
    if (str.length() != 16) {
      throw std::invalid_argument("Checksum64::FromString: Invalid string length");
    }
    return Checksum64(std::stoull(str, nullptr, 16));
  }

  bool              operator==(const Checksum64& other) const noexcept { return _h == other._h; }
  bool              operator!=(const Checksum64& other) const noexcept { return !(*this == other); }

  static Checksum64 Compute(const void* data, size_t length) {
    return Checksum64(XXH3_64bits(data, length));
  }

  /**
   * @brief Stream a file through XXH3-64.
   *
   * @throws std::runtime_error if the file cannot be read
   */
  static Checksum64 ComputeFile(const std::filesystem::path& path);

 private:
  XXH64_hash_t _h;
};
};  // namespace arcvault
