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

#include "storage/mapper/catalog/card_mapper.hpp"

#include <stdexcept>

namespace arcvault {
auto CardMapper::FromRawData(std::vector<duckorm::VarTypes>&& data) -> CardMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for Card");
  }
  using Str = std::unique_ptr<std::string>;
  return {duckorm::TakeValue<Str>(data, 0),       duckorm::TakeValue<Str>(data, 1),
          duckorm::TakeValue<Str>(data, 2),       duckorm::TakeValue<uint32_t>(data, 3),
          duckorm::TakeValue<Str>(data, 4),       duckorm::TakeValue<uint64_t>(data, 5),
          duckorm::TakeValue<Str>(data, 6),       duckorm::TakeValue<Str>(data, 7),
          duckorm::TakeValue<Str>(data, 8),       duckorm::TakeValue<Str>(data, 9),
          duckorm::TakeValue<Str>(data, 10),      duckorm::TakeValue<bool>(data, 11),
          duckorm::TakeValue<Str>(data, 12)};
}
};  // namespace arcvault
