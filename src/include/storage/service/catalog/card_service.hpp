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

#include <cstdint>
#include <string>
#include <vector>

#include "catalog/card.hpp"
#include "storage/mapper/catalog/card_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace arcvault {
enum class CardOrder : uint32_t { DATE_ADDED, FILE_NAME };

class CardService
    : public ServiceInterface<CardService, Card, CardMapperParams, CardMapper, card_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const Card& source) -> CardMapperParams;
  static auto FromParams(CardMapperParams&& param) -> Card;

  auto        GetCardsByIds(const std::vector<card_id_t>& ids) -> std::vector<Card>;
  auto        GetCardsWithTag(const tag_id_t& tag_id) -> std::vector<Card>;
  auto        GetCardsInCollection(const collection_id_t& collection_id) -> std::vector<Card>;
  auto        GetCardsByType(MediaType type) -> std::vector<Card>;
  auto        GetMoodboardCards() -> std::vector<Card>;
  auto        GetPage(uint32_t offset, uint32_t limit, CardOrder order, bool reverse)
      -> std::vector<Card>;
  auto        CountByType(MediaType type) -> uint64_t;
  auto        TotalFileSize() -> uint64_t;
};
};  // namespace arcvault
