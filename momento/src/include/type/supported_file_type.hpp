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

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "type/type.hpp"

namespace fs = std::filesystem;

namespace momento {
static const std::unordered_set<std::string> image_extensions = {
    ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tif", ".tiff", ".webp", ".heic", ".heif"};

static const std::unordered_set<std::string> raw_extensions = {
    ".arw", ".cr2", ".cr3", ".nef", ".dng", ".raw", ".raf", ".3fr", ".rw2"};

static const std::unordered_set<std::string> video_extensions = {".mp4", ".mov", ".avi",
                                                                 ".mkv", ".webm", ".m4v"};

static const std::unordered_map<std::string, std::string> mime_types = {
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".png", "image/png"},
    {".gif", "image/gif"},
    {".bmp", "image/bmp"},
    {".tif", "image/tiff"},
    {".tiff", "image/tiff"},
    {".webp", "image/webp"},
    {".heic", "image/heic"},
    {".heif", "image/heic"},
    {".arw", "image/x-sony-arw"},
    {".cr2", "image/x-canon-cr2"},
    {".cr3", "image/x-canon-cr3"},
    {".nef", "image/x-nikon-nef"},
    {".dng", "image/x-adobe-dng"},
    {".raw", "image/x-raw"},
    {".raf", "image/x-fuji-raf"},
    {".3fr", "image/x-hasselblad-3fr"},
    {".rw2", "image/x-panasonic-rw2"},
    {".mp4", "video/mp4"},
    {".mov", "video/quicktime"},
    {".avi", "video/x-msvideo"},
    {".mkv", "video/x-matroska"},
    {".webm", "video/webm"},
    {".m4v", "video/x-m4v"}};

inline auto LowercaseExtension(const fs::path& path) -> std::string {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

inline auto IsRawFile(const fs::path& path) -> bool {
  return raw_extensions.count(LowercaseExtension(path)) > 0;
}

/**
 * @brief Classify a path by its extension. RAW formats are images.
 */
inline auto ClassifyMediaKind(const fs::path& path) -> std::optional<MediaKind> {
  std::string ext = LowercaseExtension(path);
  if (image_extensions.count(ext) > 0 || raw_extensions.count(ext) > 0) {
    return MediaKind::IMAGE;
  }
  if (video_extensions.count(ext) > 0) {
    return MediaKind::VIDEO;
  }
  return std::nullopt;
}

inline auto HasSupportedExtension(const fs::path& path) -> bool {
  return ClassifyMediaKind(path).has_value();
}

inline bool is_supported_file(const fs::path& path) {
  if (!fs::is_regular_file(path)) return false;
  return HasSupportedExtension(path);
}

inline auto MimeTypeFor(const fs::path& path, MediaKind kind) -> std::string {
  auto it = mime_types.find(LowercaseExtension(path));
  if (it != mime_types.end()) {
    return it->second;
  }
  return kind == MediaKind::VIDEO ? "video/mp4" : "image/jpeg";
}
};  // namespace momento
