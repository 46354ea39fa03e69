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

#include <duckdb.h>
#include <fmt/format.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"

namespace arcvault {
template <typename Derived, typename InternalType, typename Mappable, typename Mapper, typename ID>
class ServiceInterface {
 protected:
  duckdb_connection& _conn;

 private:
  Mapper             _mapper;

 public:
  ServiceInterface(duckdb_connection& conn) : _conn(conn), _mapper(conn) {}
  void InsertParams(Mappable&& param) { _mapper.Insert(std::move(param)); }
  void Insert(const InternalType& obj) { _mapper.Insert(Derived::ToParams(obj)); }

  /**
   * @brief Get the objects by a SQL predicate (WHERE clause)
   *
   * @param predicate
   * @return std::vector<InternalType>
   */
  auto GetByPredicate(std::string&& predicate) -> std::vector<InternalType> {
    std::vector<Mappable>     param_results = _mapper.Get(predicate.c_str());
    std::vector<InternalType> results;
    results.reserve(param_results.size());
    for (auto& param : param_results) {
      results.emplace_back(Derived::FromParams(std::move(param)));
    }
    return results;
  }

  /**
   * @brief Get the objects by a full SQL query. The query must select the mapper's columns in
   * declaration order.
   *
   * @param query
   * @return std::vector<InternalType>
   */
  auto GetByQuery(std::string&& query) -> std::vector<InternalType> {
    std::vector<Mappable>     param_results = _mapper.GetByQuery(query.c_str());
    std::vector<InternalType> results;
    results.reserve(param_results.size());
    for (auto& param : param_results) {
      results.emplace_back(Derived::FromParams(std::move(param)));
    }
    return results;
  }

  auto GetById(const ID& id) -> std::optional<InternalType> {
    auto found = GetByPredicate(
        fmt::format(fmt::runtime(Mapper::PrimeKeyClause()), duckorm::Quote(id)) + " LIMIT 1");
    if (found.empty()) {
      return std::nullopt;
    }
    return std::move(found.front());
  }

  auto GetAll() -> std::vector<InternalType> { return GetByPredicate("TRUE"); }

  auto Count(const std::string& predicate = "TRUE") -> uint64_t {
    return _mapper.Count(predicate.c_str());
  }

  auto Exists(const ID& id) -> bool {
    return _mapper.Count(
               fmt::format(fmt::runtime(Mapper::PrimeKeyClause()), duckorm::Quote(id)).c_str()) >
           0;
  }

  auto RemoveById(const ID& remove_id) -> idx_t { return _mapper.Remove(remove_id); }
  auto RemoveByClause(const std::string& clause) -> idx_t { return _mapper.RemoveByClause(clause); }
  auto Update(const InternalType& obj, const ID& update_id) -> idx_t {
    return _mapper.Update(update_id, Derived::ToParams(obj));
  }
};
}  // namespace arcvault
