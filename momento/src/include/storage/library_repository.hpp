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

#include <cstddef>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

#include "media/media_asset.hpp"
#include "type/type.hpp"

namespace momento {
/**
 * @brief Insert lost the race on the unique content hash.
 */
class DuplicateHashError : public std::runtime_error {
 public:
  explicit DuplicateHashError(const hash_str_t& hash)
      : std::runtime_error("Duplicate content hash " + hash), hash_(hash) {}

  auto Hash() const -> const hash_str_t& { return hash_; }

 private:
  hash_str_t hash_;
};

/**
 * @brief Any repository write failure other than a duplicate hash.
 */
class StorageIntegrityError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Forward-only walk over the library in id order. Rows are fetched one page at a time.
 */
class MediaCursor {
 public:
  virtual ~MediaCursor()                    = default;
  virtual auto Next() -> std::optional<MediaAsset> = 0;
};

class LibraryRepository {
 public:
  virtual ~LibraryRepository()                                                = default;

  virtual auto FindByHash(const hash_str_t& hash) -> std::optional<MediaAsset> = 0;
  virtual auto FindById(media_id_t id) -> std::optional<MediaAsset>            = 0;

  /**
   * @brief Insert a new row and link its keywords as tags, in one transaction.
   *
   * @return media_id_t the new row id
   * @throws DuplicateHashError, StorageIntegrityError
   */
  virtual auto Insert(const MediaAsset& asset) -> media_id_t                   = 0;

  /**
   * @brief Apply the set fields of a patch and merge keyword tags, in one transaction.
   *
   * @return uint32_t number of media-tag links created
   * @throws DuplicateHashError, StorageIntegrityError
   */
  virtual auto Update(media_id_t id, const MediaPatch& patch) -> uint32_t      = 0;

  virtual auto ListAll(size_t page_size) -> std::unique_ptr<MediaCursor>       = 0;
  virtual auto Count() -> int64_t                                              = 0;

  virtual void ClearDerivedData(media_id_t id)                                 = 0;
  virtual void ClearAllDerivedData()                                           = 0;

  virtual void MoveToTrash(media_id_t id)                                      = 0;
  virtual void Restore(media_id_t id)                                          = 0;

  /**
   * @brief Hard delete of a row and its tag links.
   */
  virtual void Purge(media_id_t id)                                            = 0;

  virtual void SaveJobStatus(const std::string& kind, const nlohmann::json& status) = 0;
  virtual auto LoadJobStatus(const std::string& kind) -> std::optional<nlohmann::json> = 0;
};
};  // namespace momento
