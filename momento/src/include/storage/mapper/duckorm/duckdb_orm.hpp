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
#include <vector>

#include "duckdb_types.hpp"

namespace duckorm {
using Row = std::vector<VarTypes>;

void    insert(duckdb_connection& conn, const char* table, const void* obj,
               std::span<const DuckFieldDesc> fields);

auto    insert_returning(duckdb_connection& conn, const char* table, const void* obj,
                         std::span<const DuckFieldDesc> fields, const char* returning_column)
    -> int64_t;

auto    update(duckdb_connection& conn, const char* table, const void* obj,
               std::span<const DuckFieldDesc> fields, const char* where_clause,
               const std::vector<VarTypes>& where_params) -> idx_t;

auto    remove(duckdb_connection& conn, const char* table, const char* where_clause,
               const std::vector<VarTypes>& where_params) -> idx_t;

auto    select_by_query(duckdb_connection& conn, std::span<const DuckFieldDesc> fields,
                        const std::string& sql, const std::vector<VarTypes>& params)
    -> std::vector<Row>;

/**
 * @brief Comma separated column list of a field span, for hand-written SELECTs.
 */
auto    column_list(std::span<const DuckFieldDesc> fields) -> std::string;

/**
 * @brief Write a fetched row back into a mapped struct, field by field.
 */
void    assign_row(void* obj, std::span<const DuckFieldDesc> fields, Row&& row);

/**
 * @brief Run a statement that takes no parameters and returns nothing useful.
 *
 * @throws DuckDBError
 */
void    execute(duckdb_connection& conn, const std::string& sql);
}  // namespace duckorm
