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
#include <memory>
#include <stdexcept>
#include <string>

#include "config/app_config.hpp"
#include "media/media_asset.hpp"
#include "media/metadata_extractor.hpp"
#include "media/reverse_geocoder.hpp"
#include "renderer/asset_renderer.hpp"
#include "storage/library_repository.hpp"
#include "storage/media_store.hpp"
#include "type/type.hpp"
#include "utils/import/import_log.hpp"

namespace momento {
/**
 * @brief The original file of a library row is gone.
 */
class MissingFileError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct ImportOutcome {
  ItemResult result_   = ItemResult::IMPORTED;
  // The new row, or the row that already holds the content
  media_id_t media_id_ = 0;
};

struct RegenerationOutcome {
  ItemResult result_              = ItemResult::UPDATED;
  bool       metadata_changed_    = false;
  bool       thumbnail_generated_ = false;
  uint32_t   new_tags_            = 0;
};

/**
 * @brief Per-item work shared by import and regeneration: hash, extract, enrich, render and
 * persist one file. Failures are thrown to the caller, which owns counting and logging.
 */
class MediaProcessor {
 public:
  MediaProcessor(std::shared_ptr<LibraryRepository> repository, std::shared_ptr<MediaStore> store,
                 std::shared_ptr<MetadataExtractor> extractor,
                 std::shared_ptr<AssetRenderer> renderer, std::shared_ptr<ReverseGeocoder> geocoder,
                 const AppConfig& config);

  /**
   * @brief Bring one staged file into the library. On IMPORTED the file has been moved under
   * originals/; on DUPLICATE it is left in place.
   *
   * @param local staged copy of the file
   * @param original_name name the file had at its source
   */
  auto ImportFile(const file_path_t& local, const std::string& original_name) -> ImportOutcome;

  /**
   * @brief Re-extract and re-render one row. With missing_only, rows that already have
   * dimensions and a thumbnail on disk are SKIPPED, and only missing derived files are rendered.
   *
   * @throws MissingFileError when the original is not on disk
   */
  auto RegenerateAsset(const MediaAsset& asset, bool missing_only) -> RegenerationOutcome;

 private:
  auto ExtractSafely(const file_path_t& path, MediaKind kind) -> MetadataRecord;
  void Enrich(MetadataRecord& record);

  std::shared_ptr<LibraryRepository> repository_;
  std::shared_ptr<MediaStore>        store_;
  std::shared_ptr<MetadataExtractor> extractor_;
  std::shared_ptr<AssetRenderer>     renderer_;
  // Null when reverse geocoding is disabled
  std::shared_ptr<ReverseGeocoder>   geocoder_;
  ThumbnailConfig                    thumbnails_;
  PreviewConfig                      previews_;
};
};  // namespace momento
