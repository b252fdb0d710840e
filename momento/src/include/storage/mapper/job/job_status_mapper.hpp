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

#include <array>
#include <cstdint>
#include <string>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"

namespace momento {
// CREATE TABLE job_status (kind TEXT PRIMARY KEY, payload TEXT, updated_at TEXT)
struct JobStatusMapperParams {
  std::string kind;
  std::string payload;
  std::string updated_at;
};

class JobStatusMapper : public MapperInterface<JobStatusMapper, JobStatusMapperParams, std::string>,
                        public FieldReflectable<JobStatusMapper> {
 public:
  using Params = JobStatusMapperParams;

 private:
  static constexpr uint32_t    _field_count      = 3;
  static constexpr const char* _table_name       = "job_status";
  static constexpr const char* _key_column       = "kind";
  static constexpr const char* _prime_key_clause = "kind = ?";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs = {
      FIELD(JobStatusMapperParams, kind, VARCHAR), FIELD(JobStatusMapperParams, payload, VARCHAR),
      FIELD(JobStatusMapperParams, updated_at, VARCHAR)};

 public:
  friend struct FieldReflectable<JobStatusMapper>;
  using MapperInterface::MapperInterface;
};
};  // namespace momento
