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

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "storage/controller/controller_types.hpp"
#include "storage/controller/db_controller.hpp"
#include "storage/library_repository.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "type/type.hpp"

namespace momento {
/**
 * @brief DuckDB-backed library. One connection is shared and every statement runs under
 * _db_lock, so each public call is atomic with respect to the others.
 */
class LibraryController final : public LibraryRepository {
 private:
  DBController    _db_ctr;
  ConnectionGuard _guard;
  std::mutex      _db_lock;

  auto            MergeTags(media_id_t id, const std::vector<std::string>& keywords) -> uint32_t;
  auto            FetchPage(media_id_t after_id, size_t limit) -> std::vector<MediaAsset>;
  [[noreturn]] void RethrowWriteError(const duckorm::DuckDBError&    e,
                                      const std::optional<hash_str_t>& hash, media_id_t self);

  friend class LibraryCursor;

 public:
  explicit LibraryController(const file_path_t& db_path);

  auto FindByHash(const hash_str_t& hash) -> std::optional<MediaAsset> override;
  auto FindById(media_id_t id) -> std::optional<MediaAsset> override;
  auto Insert(const MediaAsset& asset) -> media_id_t override;
  auto Update(media_id_t id, const MediaPatch& patch) -> uint32_t override;
  auto ListAll(size_t page_size) -> std::unique_ptr<MediaCursor> override;
  auto Count() -> int64_t override;
  void ClearDerivedData(media_id_t id) override;
  void ClearAllDerivedData() override;
  void MoveToTrash(media_id_t id) override;
  void Restore(media_id_t id) override;
  void Purge(media_id_t id) override;
  void SaveJobStatus(const std::string& kind, const nlohmann::json& status) override;
  auto LoadJobStatus(const std::string& kind) -> std::optional<nlohmann::json> override;

  /**
   * @brief Tag names linked to a row, sorted.
   */
  auto GetTags(media_id_t id) -> std::vector<std::string>;
};
};  // namespace momento
