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

#include "type/hash_type.hpp"

#include <fstream>
#include <memory>
#include <vector>

namespace arcvault {
Checksum64 Checksum64::ComputeFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Cannot open file for hashing: " + path.string());
  }
  std::unique_ptr<XXH3_state_t, decltype(&XXH3_freeState)> state(XXH3_createState(),
                                                                  &XXH3_freeState);
  if (!state || XXH3_64bits_reset(state.get()) == XXH_ERROR) {
    throw std::runtime_error("Cannot initialize XXH3 state");
  }
  std::vector<char> buffer(1 << 20);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = in.gcount();
    if (got > 0 && XXH3_64bits_update(state.get(), buffer.data(), static_cast<size_t>(got)) ==
                       XXH_ERROR) {
      throw std::runtime_error("XXH3 update failed for " + path.string());
    }
  }
  if (in.bad()) {
    throw std::runtime_error("Read error while hashing " + path.string());
  }
  return Checksum64(XXH3_64bits_digest(state.get()));
}
};  // namespace arcvault
