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

#include "storage/mapper/duckorm/duckdb_orm.hpp"

#include <duckdb.h>

#include <optional>
#include <sstream>
#include <stdexcept>

namespace duckorm {
namespace {
template <typename T>
void StoreField(void* obj, const DuckFieldDesc& field, VarTypes&& value) {
  char* ptr = reinterpret_cast<char*>(obj) + field.offset;
  if (field.nullable) {
    auto& target = *reinterpret_cast<std::optional<T>*>(ptr);
    if (std::holds_alternative<std::monostate>(value)) {
      target.reset();
    } else {
      target = std::move(std::get<T>(value));
    }
    return;
  }
  if (std::holds_alternative<std::monostate>(value)) {
    throw std::runtime_error(std::string("NULL in non-nullable column ") + field.name);
  }
  *reinterpret_cast<T*>(ptr) = std::move(std::get<T>(value));
}

auto BuildInsert(const char* table, std::span<const DuckFieldDesc> fields) -> std::ostringstream {
  std::ostringstream sql;
  sql << "INSERT INTO " << table << " (";
  for (size_t i = 0; i < fields.size(); ++i) {
    sql << fields[i].name;
    if (i < fields.size() - 1) {
      sql << ", ";
    }
  }
  sql << ") VALUES (";
  for (size_t i = 0; i < fields.size(); ++i) {
    sql << "?";
    if (i < fields.size() - 1) {
      sql << ", ";
    }
  }
  sql << ")";
  return sql;
}

auto ChangedRows(PreparedStatement& stmt) -> idx_t {
  return static_cast<idx_t>(duckdb_rows_changed(&stmt._result));
}
}  // namespace

void insert(duckdb_connection& conn, const char* table, const void* obj,
            std::span<const DuckFieldDesc> fields) {
  PreparedStatement insert_pre(conn, BuildInsert(table, fields).str());
  for (size_t i = 0; i < fields.size(); ++i) {
    insert_pre.BindField(i + 1, obj, fields[i]);
  }
  insert_pre.Execute();
}

auto insert_returning(duckdb_connection& conn, const char* table, const void* obj,
                      std::span<const DuckFieldDesc> fields, const char* returning_column)
    -> int64_t {
  auto sql = BuildInsert(table, fields);
  sql << " RETURNING " << returning_column;
  PreparedStatement insert_pre(conn, sql.str());
  for (size_t i = 0; i < fields.size(); ++i) {
    insert_pre.BindField(i + 1, obj, fields[i]);
  }
  insert_pre.Execute();
  if (insert_pre.RowCount() != 1) {
    throw DuckDBError("INSERT ... RETURNING produced no row");
  }
  auto id = insert_pre.Read(0, 0, DuckDBType::INT64);
  return std::get<int64_t>(id);
}

auto update(duckdb_connection& conn, const char* table, const void* obj,
            std::span<const DuckFieldDesc> fields, const char* where_clause,
            const std::vector<VarTypes>& where_params) -> idx_t {
  std::ostringstream sql;
  sql << "UPDATE " << table << " SET ";
  for (size_t i = 0; i < fields.size(); ++i) {
    sql << fields[i].name << " = ?";
    if (i < fields.size() - 1) {
      sql << ", ";
    }
  }
  sql << " WHERE " << where_clause;

  PreparedStatement update_pre(conn, sql.str());
  idx_t             index = 1;
  for (const auto& field : fields) {
    update_pre.BindField(index++, obj, field);
  }
  for (const auto& param : where_params) {
    update_pre.Bind(index++, param);
  }
  update_pre.Execute();
  return ChangedRows(update_pre);
}

auto remove(duckdb_connection& conn, const char* table, const char* where_clause,
            const std::vector<VarTypes>& where_params) -> idx_t {
  std::ostringstream sql;
  sql << "DELETE FROM " << table << " WHERE " << where_clause;

  PreparedStatement delete_pre(conn, sql.str());
  idx_t             index = 1;
  for (const auto& param : where_params) {
    delete_pre.Bind(index++, param);
  }
  delete_pre.Execute();
  return ChangedRows(delete_pre);
}

auto select_by_query(duckdb_connection& conn, std::span<const DuckFieldDesc> fields,
                     const std::string& sql, const std::vector<VarTypes>& params)
    -> std::vector<Row> {
  PreparedStatement select_pre(conn, sql);
  idx_t             index = 1;
  for (const auto& param : params) {
    select_pre.Bind(index++, param);
  }
  auto& result = select_pre.Execute();

  if (duckdb_column_count(&result) != fields.size()) {
    throw std::runtime_error("Column count mismatch in select query");
  }

  std::vector<Row> rows;
  idx_t            row_count = select_pre.RowCount();
  rows.resize(row_count);
  for (idx_t i = 0; i < row_count; ++i) {
    rows[i].reserve(fields.size());
    for (size_t j = 0; j < fields.size(); ++j) {
      rows[i].push_back(select_pre.Read(j, i, fields[j].type));
    }
  }
  return rows;
}

auto column_list(std::span<const DuckFieldDesc> fields) -> std::string {
  std::string columns;
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) columns += ", ";
    columns += fields[i].name;
  }
  return columns;
}

void assign_row(void* obj, std::span<const DuckFieldDesc> fields, Row&& row) {
  if (row.size() != fields.size()) {
    throw std::runtime_error("Row width does not match the field description");
  }
  for (size_t i = 0; i < fields.size(); ++i) {
    switch (fields[i].type) {
      case DuckDBType::INT32:
        StoreField<int32_t>(obj, fields[i], std::move(row[i]));
        break;
      case DuckDBType::INT64:
        StoreField<int64_t>(obj, fields[i], std::move(row[i]));
        break;
      case DuckDBType::DOUBLE:
        StoreField<double>(obj, fields[i], std::move(row[i]));
        break;
      case DuckDBType::BOOLEAN:
        StoreField<bool>(obj, fields[i], std::move(row[i]));
        break;
      case DuckDBType::VARCHAR:
        StoreField<std::string>(obj, fields[i], std::move(row[i]));
        break;
      default:
        throw std::runtime_error("Unsupported DuckFieldType in assign_row()");
    }
  }
}

void execute(duckdb_connection& conn, const std::string& sql) {
  duckdb_result result;
  if (duckdb_query(conn, sql.c_str(), &result) != DuckDBSuccess) {
    const char* err     = duckdb_result_error(&result);
    std::string message = err ? err : "duckdb_query failed";
    duckdb_destroy_result(&result);
    throw DuckDBError(message);
  }
  duckdb_destroy_result(&result);
}
};  // namespace duckorm
