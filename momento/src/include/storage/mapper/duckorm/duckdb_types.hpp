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

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

namespace duckorm {
enum class DuckDBType : uint8_t {
  INT32,
  INT64,
  DOUBLE,
  VARCHAR,
  BOOLEAN,
};

// std::monostate is SQL NULL
using VarTypes = std::variant<std::monostate, int32_t, int64_t, double, bool, std::string>;

/**
 * @brief Column description of a mapped struct. A non-nullable field is stored as the plain
 * C++ type (int32_t, int64_t, double, bool, std::string); a nullable one as std::optional of it.
 */
struct DuckFieldDesc {
  const char* name;
  DuckDBType  type;
  size_t      offset;
  bool        nullable;
};

#define FIELD(type, field, field_type) \
  duckorm::DuckFieldDesc { #field, duckorm::DuckDBType::field_type, offsetof(type, field), false }

#define NULLABLE_FIELD(type, field, field_type) \
  duckorm::DuckFieldDesc { #field, duckorm::DuckDBType::field_type, offsetof(type, field), true }

class DuckDBError : public std::runtime_error {
 public:
  explicit DuckDBError(const std::string& message)
      : std::runtime_error(message),
        constraint_violation_(message.find("Constraint Error") != std::string::npos) {}

  auto IsConstraintViolation() const -> bool { return constraint_violation_; }

 private:
  bool constraint_violation_;
};

/**
 * @brief RAII owner of a prepared statement and its last result.
 */
class PreparedStatement {
 private:
  void RecycleResult();
  void RecycleResources();

 public:
  duckdb_result             _result;
  duckdb_prepared_statement _stmt = nullptr;
  duckdb_connection&        _con;

  bool                      _prepared   = false;
  bool                      _has_result = false;

  PreparedStatement(duckdb_connection& con, const std::string& prepare_query);
  ~PreparedStatement();

  PreparedStatement(const PreparedStatement&)            = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;

  void Bind(idx_t index, const VarTypes& value);
  void BindField(idx_t index, const void* obj, const DuckFieldDesc& field);

  /**
   * @brief Execute with the current bindings. The result stays owned by this statement until
   * the next Execute or destruction.
   *
   * @throws DuckDBError
   */
  auto Execute() -> duckdb_result&;

  auto RowCount() -> idx_t;
  auto Read(idx_t col, idx_t row, DuckDBType type) -> VarTypes;
};
};  // namespace duckorm
