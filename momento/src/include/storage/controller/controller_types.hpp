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

namespace momento {
class ConnectionGuard {
 public:
  duckdb_connection _conn;

  ConnectionGuard(duckdb_connection conn);
  ConnectionGuard(ConnectionGuard&& other) noexcept;
  ~ConnectionGuard();

  ConnectionGuard(const ConnectionGuard&)            = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;
};

/**
 * @brief Scoped transaction on one connection. Rolls back on destruction unless Commit() ran.
 */
class TransactionGuard {
 public:
  explicit TransactionGuard(duckdb_connection& conn);
  ~TransactionGuard();

  TransactionGuard(const TransactionGuard&)            = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  void Commit();

 private:
  duckdb_connection& _conn;
  bool               _finished = false;
};
};  // namespace momento
