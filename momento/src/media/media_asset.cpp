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

#include "media/media_asset.hpp"

namespace momento {
auto MediaAsset::ToJson() const -> nlohmann::json {
  nlohmann::json j   = metadata_.ToJson();
  j["id"]            = id_;
  j["contentHash"]   = content_hash_ ? nlohmann::json(*content_hash_) : nlohmann::json(nullptr);
  j["filename"]      = filename_;
  j["originalFilename"] = original_filename_;
  j["filePath"]      = file_path_;
  j["thumbnailPath"] = thumbnail_path_ ? nlohmann::json(*thumbnail_path_) : nlohmann::json(nullptr);
  j["previewPath"]   = preview_path_ ? nlohmann::json(*preview_path_) : nlohmann::json(nullptr);
  j["mediaType"]     = MediaKindToString(media_type_);
  j["mimeType"]      = mime_type_ ? nlohmann::json(*mime_type_) : nlohmann::json(nullptr);
  j["fileSize"]      = file_size_;
  j["createdAt"]     = created_at_;
  j["deletedAt"]     = deleted_at_ ? nlohmann::json(*deleted_at_) : nlohmann::json(nullptr);
  return j;
}
};  // namespace momento
