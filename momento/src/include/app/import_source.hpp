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

#include <stdexcept>
#include <string>
#include <vector>

#include "type/type.hpp"
#include "utils/import/import_log.hpp"

namespace momento {
struct ImportItem {
  // Adapter-specific handle: an absolute path or a remote href
  std::string source_id_;
  // Name used in logs and as original_filename
  std::string display_name_;
};

class SourceUnavailableError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Thrown by Fetch when a remote item cannot be downloaded.
 */
class FetchError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ImportSource {
 public:
  virtual ~ImportSource()                                                  = default;

  virtual auto Name() const -> std::string                                 = 0;

  /**
   * @brief Cheap reachability check run before a job is accepted.
   *
   * @throws SourceUnavailableError
   */
  virtual void Probe()                                                     = 0;

  /**
   * @brief List importable items in a stable order.
   *
   * @throws SourceUnavailableError
   */
  virtual auto Enumerate() -> std::vector<ImportItem>                      = 0;

  /**
   * @brief Make the item available as a local file.
   *
   * @throws FetchError, std::runtime_error
   */
  virtual auto Fetch(const ImportItem& item) -> file_path_t                = 0;

  /**
   * @brief Cleanup once the item is settled. local is the path Fetch returned; after an
   * IMPORTED result it no longer exists because the file was moved into the library.
   */
  virtual void Release(const ImportItem& item, const file_path_t& local, ItemResult result) = 0;
};
};  // namespace momento
