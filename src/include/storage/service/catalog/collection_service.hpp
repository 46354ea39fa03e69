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

#include <vector>

#include "catalog/collection.hpp"
#include "storage/mapper/catalog/collection_mapper.hpp"
#include "storage/mapper/catalog/moodboard_mapper.hpp"
#include "storage/mapper/catalog/preview_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace arcvault {
class CollectionService
    : public ServiceInterface<CollectionService, Collection, CollectionMapperParams,
                              CollectionMapper, collection_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const Collection& source) -> CollectionMapperParams;
  static auto FromParams(CollectionMapperParams&& param) -> Collection;

  auto        GetCollectionsHoldingCard(const card_id_t& card_id) -> std::vector<Collection>;
};

class MoodboardService : public ServiceInterface<MoodboardService, Moodboard,
                                                 MoodboardMapperParams, MoodboardMapper,
                                                 std::string> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const Moodboard& source) -> MoodboardMapperParams;
  static auto FromParams(MoodboardMapperParams&& param) -> Moodboard;

  /**
   * @brief Load the singleton board, or an empty one if it was never written
   */
  auto        Load() -> Moodboard;
  /**
   * @brief Insert or replace the singleton board
   */
  void        Save(const Moodboard& board);
};

class PreviewService : public ServiceInterface<PreviewService, PreviewEntry, PreviewMapperParams,
                                               PreviewMapper, card_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const PreviewEntry& source) -> PreviewMapperParams;
  static auto FromParams(PreviewMapperParams&& param) -> PreviewEntry;
};
};  // namespace arcvault
