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

#include "storage/controller/db_controller.hpp"

#include <duckdb.h>
#include <spdlog/spdlog.h>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"

namespace momento {
DBController::DBController(const file_path_t& db_path) : _db_path(db_path) { InitializeDB(); }

DBController::~DBController() {
  if (_db != nullptr) {
    duckdb_close(&_db);
  }
}

/**
 * @brief Get a connection guard for the database.
 *
 * @return ConnectionGuard
 */
auto DBController::GetConnectionGuard() -> ConnectionGuard {
  ConnectionGuard guard{nullptr};

  if (duckdb_connect(_db, &guard._conn) != DuckDBSuccess) {
    throw duckorm::DuckDBError("DB cannot be connected");
  }

  return guard;
}

void DBController::InitializeDB() {
  std::string path_str = _db_path.string();
  char*       open_err = nullptr;
  if (duckdb_open_ext(path_str.c_str(), &_db, nullptr, &open_err) != DuckDBSuccess) {
    std::string message = open_err ? open_err : "DB cannot be opened";
    duckdb_free(open_err);
    _db = nullptr;
    throw duckorm::DuckDBError(message);
  }

  // Every statement is IF NOT EXISTS, so reopening an existing library is a no-op
  try {
    auto guard = GetConnectionGuard();
    duckorm::execute(guard._conn, init_table_query);
  } catch (const duckorm::DuckDBError&) {
    duckdb_close(&_db);
    _db = nullptr;
    throw;
  }
  spdlog::debug("Library database ready at {}", path_str);
}
};  // namespace momento
