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
#include <string>

namespace momento {

#define file_path_t  std::filesystem::path

// Library row id, DuckDB BIGINT
#define media_id_t   int64_t

// Tag row id
#define tag_id_t     int64_t

// Hex rendering of a content digest
#define hash_str_t   std::string

enum class MediaKind : uint8_t { IMAGE = 0, VIDEO = 1 };

inline auto MediaKindToString(MediaKind kind) -> const char* {
  return kind == MediaKind::VIDEO ? "video" : "image";
}

inline auto MediaKindFromString(const std::string& str) -> MediaKind {
  return str == "video" ? MediaKind::VIDEO : MediaKind::IMAGE;
}
};  // namespace momento
