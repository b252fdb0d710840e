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

#include <filesystem>

#include "media/media_metadata.hpp"
#include "type/type.hpp"

namespace momento {
/**
 * @brief Reads capture metadata from a file. Implementations must not throw for a valid file
 * that simply carries no metadata; they return whatever could be learned.
 */
class MetadataExtractor {
 public:
  virtual ~MetadataExtractor() = default;

  virtual auto Extract(const std::filesystem::path& path, MediaKind kind) -> MetadataRecord = 0;
};

/**
 * @brief Production extractor. Exiv2 for still images, LibRaw for camera RAW files and OpenCV
 * for video containers.
 */
class ExivMetadataExtractor final : public MetadataExtractor {
 public:
  ExivMetadataExtractor();
  ~ExivMetadataExtractor() override = default;

  auto Extract(const std::filesystem::path& path, MediaKind kind) -> MetadataRecord override;

 private:
  static void ExtractImage(const std::filesystem::path& path, MetadataRecord& record);
  static auto ExtractRaw(const std::filesystem::path& path, MetadataRecord& record) -> bool;
  static void ExtractVideo(const std::filesystem::path& path, MetadataRecord& record);
  static void ExtractVideoXmp(const std::filesystem::path& path, MetadataRecord& record);
  static void FillDateFromFile(const std::filesystem::path& path, MetadataRecord& record);
};
};  // namespace momento
