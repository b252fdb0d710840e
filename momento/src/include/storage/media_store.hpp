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

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

#include "type/type.hpp"

namespace momento {
/**
 * @brief Filesystem side of the library. Every path handed out or accepted as "relative" is
 * relative to the data root and uses '/' separators, which is what the media rows store.
 *
 *   originals/YYYY-MM/YYYYmmdd_HHMMSS_<hash12>.<ext>
 *   thumbnails/YYYY-MM/<stem>.jpg
 *   previews/YYYY-MM/<stem>.jpg
 *   imports/            staging, consumed by local import
 *   imports/.webdav/    per-item downloads of a WebDAV import
 */
class MediaStore {
 public:
  explicit MediaStore(file_path_t data_root);

  void EnsureLayout() const;

  auto DataRoot() const -> const file_path_t& { return data_root_; }
  auto StagingDir() const -> file_path_t { return data_root_ / "imports"; }
  auto DownloadDir() const -> file_path_t { return StagingDir() / ".webdav"; }

  auto Resolve(const std::string& relative) const -> file_path_t;
  auto Exists(const std::optional<std::string>& relative) const -> bool;

  /**
   * @brief Pick a free name under originals/ for a new import.
   *
   * @param hash content hash in hex
   * @param date_taken normalized capture date, the import time is used when absent
   * @param source the staged file, only its extension is used
   * @return std::string relative path that does not exist yet
   */
  auto AllocateOriginalPath(const hash_str_t& hash, const std::optional<std::string>& date_taken,
                            const file_path_t& source) const -> std::string;

  static auto ThumbnailRelPath(const std::string& original_relative) -> std::string;
  static auto PreviewRelPath(const std::string& original_relative) -> std::string;

  /**
   * @brief Write bytes to a sibling temp file, fsync it, rename it over the target, then fsync
   * the parent directory.
   *
   * @throws std::runtime_error
   */
  void WriteDurably(const std::string& relative, std::span<const uint8_t> bytes) const;

  /**
   * @brief Move a file to an absolute destination, creating parent directories. Falls back to
   * copy and remove when rename cannot cross devices.
   *
   * @throws std::filesystem::filesystem_error
   */
  static void MoveInto(const file_path_t& from, const file_path_t& to);

  static void RemoveQuietly(const file_path_t& path);

 private:
  file_path_t data_root_;
};
};  // namespace momento
