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

#include <span>
#include <string>
#include <utility>
#include <vector>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"

namespace momento {
template <typename Derived, typename InternalType, typename Mappable, typename Mapper, typename ID>
class ServiceInterface {
 protected:
  duckdb_connection& _conn;
  Mapper             _mapper;

 public:
  ServiceInterface(duckdb_connection& conn) : _conn(conn), _mapper(conn) {}
  auto InsertParams(const Mappable& param) -> ID { return _mapper.Insert(param); }
  auto Insert(const InternalType& obj) -> ID { return _mapper.Insert(Derived::ToParams(obj)); }

  /**
   * @brief Get the objects by a parameterized SQL predicate (WHERE clause)
   *
   * @param predicate
   * @param params
   * @return std::vector<InternalType>
   */
  auto GetByPredicate(const std::string&                    predicate,
                      const std::vector<duckorm::VarTypes>& params = {})
      -> std::vector<InternalType> {
    return Convert(_mapper.Get(predicate, params));
  }

  /**
   * @brief Get the objects by a full SQL query. The query must select the mapped columns in
   * their declared order.
   *
   * @param query
   * @param params
   * @return std::vector<InternalType>
   */
  auto GetByQuery(const std::string& query, const std::vector<duckorm::VarTypes>& params = {})
      -> std::vector<InternalType> {
    return Convert(_mapper.GetByQuery(query, params));
  }

  auto RemoveById(const ID remove_id) -> idx_t { return _mapper.Remove(remove_id); }
  auto RemoveByClause(const std::string& clause, const std::vector<duckorm::VarTypes>& params)
      -> idx_t {
    return _mapper.RemoveByClause(clause, params);
  }
  auto Update(const InternalType& obj, const ID update_id,
              std::span<const duckorm::DuckFieldDesc> fields) -> idx_t {
    return _mapper.Update(update_id, Derived::ToParams(obj), fields);
  }

 private:
  static auto Convert(std::vector<Mappable>&& param_results) -> std::vector<InternalType> {
    std::vector<InternalType> results;
    results.reserve(param_results.size());
    for (auto& param : param_results) {
      results.emplace_back(Derived::FromParams(std::move(param)));
    }
    return results;
  }
};
};  // namespace momento
