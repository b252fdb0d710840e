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
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "media/media_metadata.hpp"
#include "type/type.hpp"

namespace momento {
/**
 * @brief One library row. Paths are relative to the storage data root.
 */
struct MediaAsset {
  media_id_t                 id_ = 0;
  std::optional<hash_str_t>  content_hash_;

  std::string                filename_;
  std::string                original_filename_;
  std::string                file_path_;
  std::optional<std::string> thumbnail_path_;
  std::optional<std::string> preview_path_;

  MediaKind                  media_type_ = MediaKind::IMAGE;
  std::optional<std::string> mime_type_;
  int64_t                    file_size_  = 0;

  MetadataRecord             metadata_;

  std::string                created_at_;
  std::optional<std::string> deleted_at_;

  auto IsTrashed() const -> bool { return deleted_at_.has_value(); }
  auto ToJson() const -> nlohmann::json;
};

/**
 * @brief Partial update applied by LibraryRepository::Update. Unset members are left alone;
 * metadata_ replaces the whole enrichment block.
 */
struct MediaPatch {
  std::optional<hash_str_t>     content_hash_;
  std::optional<MetadataRecord> metadata_;
  std::optional<std::string>    thumbnail_path_;
  std::optional<std::string>    preview_path_;
  std::optional<std::string>    mime_type_;

  auto Empty() const -> bool {
    return !content_hash_ && !metadata_ && !thumbnail_path_ && !preview_path_ && !mime_type_;
  }
};
};  // namespace momento
