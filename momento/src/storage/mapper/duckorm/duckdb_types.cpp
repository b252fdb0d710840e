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

#include "storage/mapper/duckorm/duckdb_types.hpp"

#include <duckdb.h>

#include <cstring>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace duckorm {
namespace {
template <typename T>
auto FieldRef(const void* obj, const DuckFieldDesc& field) -> const T& {
  return *reinterpret_cast<const T*>(reinterpret_cast<const char*>(obj) + field.offset);
}

template <typename T>
auto LoadField(const void* obj, const DuckFieldDesc& field) -> VarTypes {
  if (field.nullable) {
    const auto& value = FieldRef<std::optional<T>>(obj, field);
    if (!value.has_value()) return std::monostate{};
    return *value;
  }
  return FieldRef<T>(obj, field);
}
}  // namespace

void PreparedStatement::RecycleResult() {
  if (_has_result) {
    duckdb_destroy_result(&_result);
    _has_result = false;
  }
}

void PreparedStatement::RecycleResources() {
  RecycleResult();
  if (_stmt) {
    duckdb_destroy_prepare(&_stmt);
    _stmt = nullptr;
  }
}

PreparedStatement::PreparedStatement(duckdb_connection& con, const std::string& prepare_query)
    : _con(con) {
  std::memset(&_result, 0, sizeof(_result));

  if (duckdb_prepare(_con, prepare_query.c_str(), &_stmt) != DuckDBSuccess) {
    const char* err = duckdb_prepare_error(_stmt);
    std::string msg = "PreparedStatement failed";
    if (err && std::strlen(err) > 0) {
      msg += ": ";
      msg += err;
    }
    RecycleResources();
    throw DuckDBError(msg);
  }
  _prepared = true;
}

PreparedStatement::~PreparedStatement() { RecycleResources(); }

void PreparedStatement::Bind(idx_t index, const VarTypes& value) {
  duckdb_state state = std::visit(
      [this, index](const auto& v) -> duckdb_state {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::monostate>) {
          return duckdb_bind_null(_stmt, index);
        } else if constexpr (std::is_same_v<V, int32_t>) {
          return duckdb_bind_int32(_stmt, index, v);
        } else if constexpr (std::is_same_v<V, int64_t>) {
          return duckdb_bind_int64(_stmt, index, v);
        } else if constexpr (std::is_same_v<V, double>) {
          return duckdb_bind_double(_stmt, index, v);
        } else if constexpr (std::is_same_v<V, bool>) {
          return duckdb_bind_boolean(_stmt, index, v);
        } else {
          return duckdb_bind_varchar_length(_stmt, index, v.data(), v.size());
        }
      },
      value);
  if (state != DuckDBSuccess) {
    throw DuckDBError("Failed to bind parameter " + std::to_string(index));
  }
}

void PreparedStatement::BindField(idx_t index, const void* obj, const DuckFieldDesc& field) {
  switch (field.type) {
    case DuckDBType::INT32:
      Bind(index, LoadField<int32_t>(obj, field));
      break;
    case DuckDBType::INT64:
      Bind(index, LoadField<int64_t>(obj, field));
      break;
    case DuckDBType::DOUBLE:
      Bind(index, LoadField<double>(obj, field));
      break;
    case DuckDBType::BOOLEAN:
      Bind(index, LoadField<bool>(obj, field));
      break;
    case DuckDBType::VARCHAR:
      Bind(index, LoadField<std::string>(obj, field));
      break;
    default:
      throw std::runtime_error("Unsupported DuckFieldType in BindField()");
  }
}

auto PreparedStatement::Execute() -> duckdb_result& {
  RecycleResult();
  duckdb_state state = duckdb_execute_prepared(_stmt, &_result);
  _has_result        = true;
  if (state != DuckDBSuccess) {
    const char* err = duckdb_result_error(&_result);
    throw DuckDBError(err ? err : "duckdb_execute_prepared failed");
  }
  return _result;
}

auto PreparedStatement::RowCount() -> idx_t { return _has_result ? duckdb_row_count(&_result) : 0; }

auto PreparedStatement::Read(idx_t col, idx_t row, DuckDBType type) -> VarTypes {
  if (duckdb_value_is_null(&_result, col, row)) {
    return std::monostate{};
  }
  switch (type) {
    case DuckDBType::INT32:
      return duckdb_value_int32(&_result, col, row);
    case DuckDBType::INT64:
      return duckdb_value_int64(&_result, col, row);
    case DuckDBType::DOUBLE:
      return duckdb_value_double(&_result, col, row);
    case DuckDBType::BOOLEAN:
      return duckdb_value_boolean(&_result, col, row);
    case DuckDBType::VARCHAR: {
      char*       raw = duckdb_value_varchar(&_result, col, row);
      std::string value(raw ? raw : "");
      duckdb_free(raw);
      return value;
    }
    default:
      throw std::runtime_error("Unsupported DuckFieldType in Read()");
  }
}
};  // namespace duckorm
