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

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"

namespace momento {
template <typename Derived, typename Mappable, typename ID>
class MapperInterface {
 public:
  duckdb_connection& _conn;

  MapperInterface(duckdb_connection& conn) : _conn(conn) {}

  /**
   * @brief Insert a new record, letting the table assign the primary key
   *
   * @param obj
   * @return ID the generated key
   */
  auto Insert(const Mappable& obj) -> ID {
    return static_cast<ID>(duckorm::insert_returning(_conn, Derived::TableName(), &obj,
                                                     Derived::InsertDesc(), Derived::KeyColumn()));
  }

  /**
   * @brief Insert a record whose key is already part of the mapped fields
   *
   * @param obj
   */
  void InsertWithKey(const Mappable& obj) {
    duckorm::insert(_conn, Derived::TableName(), &obj, Derived::FieldDesc());
  }

  /**
   * @brief Remove a record from the table by its primary key
   *
   * @param remove_id
   * @return idx_t rows removed
   */
  auto Remove(const ID remove_id) -> idx_t {
    return duckorm::remove(_conn, Derived::TableName(), Derived::PrimeKeyClause(),
                           {duckorm::VarTypes{remove_id}});
  }

  auto RemoveByClause(const std::string& predicate, const std::vector<duckorm::VarTypes>& params)
      -> idx_t {
    return duckorm::remove(_conn, Derived::TableName(), predicate.c_str(), params);
  }

  /**
   * @brief Get records from the table by a parameterized SQL predicate
   *
   * @param where_clause
   * @param params
   * @return std::vector<Mappable>
   */
  auto Get(const std::string& where_clause, const std::vector<duckorm::VarTypes>& params = {})
      -> std::vector<Mappable> {
    std::string query = "SELECT " + duckorm::column_list(Derived::FieldDesc()) + " FROM " +
                        Derived::TableName() + " WHERE " + where_clause;
    return GetByQuery(query, params);
  }

  auto GetByQuery(const std::string& query, const std::vector<duckorm::VarTypes>& params = {})
      -> std::vector<Mappable> {
    auto raw = duckorm::select_by_query(_conn, Derived::FieldDesc(), query, params);
    std::vector<Mappable> result;
    result.reserve(raw.size());
    for (auto& row : raw) {
      result.emplace_back(Derived::FromRawData(std::move(row)));
    }
    return result;
  }

  /**
   * @brief Update the given columns of a record by its primary key
   *
   * @param target_id
   * @param updated
   * @param fields columns to write, a subset of FieldDesc()
   * @return idx_t rows changed
   */
  auto Update(const ID target_id, const Mappable& updated,
              std::span<const duckorm::DuckFieldDesc> fields) -> idx_t {
    return duckorm::update(_conn, Derived::TableName(), &updated, fields,
                           Derived::PrimeKeyClause(), {duckorm::VarTypes{target_id}});
  }
};

template <typename Derived>
struct FieldReflectable {
 public:
  using FieldArrayType = std::span<const duckorm::DuckFieldDesc>;
  static constexpr FieldArrayType FieldDesc() { return Derived::_field_descs; }
  // Every column but the generated key
  static constexpr FieldArrayType InsertDesc() { return FieldDesc().subspan(1); }
  static constexpr uint32_t       FieldCount() { return Derived::_field_count; }
  static constexpr const char*    TableName() { return Derived::_table_name; }
  static constexpr const char*    KeyColumn() { return Derived::_key_column; }
  static constexpr const char*    PrimeKeyClause() { return Derived::_prime_key_clause; }

  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> typename Derived::Params {
    typename Derived::Params params{};
    duckorm::assign_row(&params, FieldDesc(), std::move(data));
    return params;
  }
};
};  // namespace momento
