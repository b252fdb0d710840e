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

#include "app/media_processor.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

#include "media/content_hasher.hpp"
#include "type/supported_file_type.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/geo/geohash.hpp"

namespace momento {
namespace {
// Derived files written for one item, removed again if the item cannot be committed
class DerivedFiles {
 public:
  explicit DerivedFiles(const MediaStore& store) : store_(store) {}

  void Write(const std::string& relative, const std::vector<uint8_t>& bytes) {
    store_.WriteDurably(relative, bytes);
    written_.push_back(store_.Resolve(relative));
  }

  void RemoveAll() {
    for (const auto& path : written_) {
      MediaStore::RemoveQuietly(path);
    }
    written_.clear();
  }

 private:
  const MediaStore&     store_;
  std::vector<fs::path> written_;
};

// Put a moved original back where the source expects it
void ReturnOriginal(const fs::path& moved_to, const fs::path& source) {
  try {
    MediaStore::MoveInto(moved_to, source);
  } catch (const fs::filesystem_error& e) {
    spdlog::error("Could not return {} to {}: {}", moved_to.string(), source.string(), e.what());
  }
}
}  // namespace

MediaProcessor::MediaProcessor(std::shared_ptr<LibraryRepository> repository,
                               std::shared_ptr<MediaStore>        store,
                               std::shared_ptr<MetadataExtractor> extractor,
                               std::shared_ptr<AssetRenderer>     renderer,
                               std::shared_ptr<ReverseGeocoder> geocoder, const AppConfig& config)
    : repository_(std::move(repository)),
      store_(std::move(store)),
      extractor_(std::move(extractor)),
      renderer_(std::move(renderer)),
      geocoder_(std::move(geocoder)),
      thumbnails_(config.thumbnails_),
      previews_(config.previews_) {}

auto MediaProcessor::ExtractSafely(const file_path_t& path, MediaKind kind) -> MetadataRecord {
  try {
    auto record = extractor_->Extract(path, kind);
    record.SanitizeGps();
    return record;
  } catch (const std::exception& e) {
    spdlog::warn("Metadata extraction failed for {}: {}", path.string(), e.what());
    return {};
  }
}

void MediaProcessor::Enrich(MetadataRecord& record) {
  if (!record.HasGps()) {
    record.geohash_.reset();
    return;
  }
  record.geohash_ = geohash::Encode(*record.gps_latitude_, *record.gps_longitude_);

  if (!geocoder_ || !record.NeedsGeocoding()) return;
  try {
    auto place = geocoder_->Lookup(*record.gps_latitude_, *record.gps_longitude_);
    if (!place.has_value()) return;
    if (!record.location_city_) record.location_city_ = place->city_;
    if (!record.location_state_) record.location_state_ = place->state_;
    if (!record.location_country_) record.location_country_ = place->country_;
  } catch (const std::exception& e) {
    spdlog::warn("Reverse geocoding failed: {}", e.what());
  }
}

auto MediaProcessor::ImportFile(const file_path_t& local, const std::string& original_name)
    -> ImportOutcome {
  auto kind = ClassifyMediaKind(local);
  if (!kind.has_value()) {
    throw std::runtime_error("Unsupported file type");
  }

  hash_str_t hash = ContentHasher::HashFile(local).ToString();
  if (auto existing = repository_->FindByHash(hash)) {
    spdlog::debug("{} duplicates media {}", original_name, existing->id_);
    return {ItemResult::DUPLICATE, existing->id_};
  }

  MediaAsset asset;
  asset.content_hash_ = hash;
  asset.media_type_   = *kind;
  asset.mime_type_    = MimeTypeFor(local, *kind);
  asset.file_size_    = static_cast<int64_t>(fs::file_size(local));
  asset.metadata_     = ExtractSafely(local, *kind);
  Enrich(asset.metadata_);

  asset.file_path_         = store_->AllocateOriginalPath(hash, asset.metadata_.date_taken_, local);
  asset.filename_          = fs::path(asset.file_path_).filename().string();
  asset.original_filename_ = original_name;
  asset.created_at_        = TimeProvider::NowIso8601();

  // Render everything before touching the library so a decode failure leaves no trace
  auto thumbnail           = renderer_->RenderThumbnail(local, *kind, thumbnails_.max_size_,
                                                        thumbnails_.quality_);
  std::optional<PreviewOutput> preview;
  if (previews_.enabled_) {
    preview = renderer_->RenderPreview(local, *kind);
  }

  DerivedFiles derived(*store_);
  fs::path     original_abs = store_->Resolve(asset.file_path_);
  bool         moved        = false;
  try {
    asset.thumbnail_path_ = MediaStore::ThumbnailRelPath(asset.file_path_);
    derived.Write(*asset.thumbnail_path_, thumbnail);
    if (preview.has_value()) {
      if (auto* bytes = std::get_if<std::vector<uint8_t>>(&*preview)) {
        asset.preview_path_ = MediaStore::PreviewRelPath(asset.file_path_);
        derived.Write(*asset.preview_path_, *bytes);
      } else {
        asset.preview_path_ = asset.file_path_;
      }
    }

    MediaStore::MoveInto(local, original_abs);
    moved = true;

    media_id_t id = repository_->Insert(asset);
    spdlog::debug("Imported {} as media {}", original_name, id);
    return {ItemResult::IMPORTED, id};
  } catch (const DuplicateHashError&) {
    // Lost a race with another writer; the existing row wins
    if (moved) ReturnOriginal(original_abs, local);
    derived.RemoveAll();
    auto existing = repository_->FindByHash(hash);
    return {ItemResult::DUPLICATE, existing ? existing->id_ : 0};
  } catch (...) {
    if (moved) ReturnOriginal(original_abs, local);
    derived.RemoveAll();
    throw;
  }
}

auto MediaProcessor::RegenerateAsset(const MediaAsset& asset, bool missing_only)
    -> RegenerationOutcome {
  RegenerationOutcome outcome;
  if (missing_only && asset.metadata_.HasDimensions() && store_->Exists(asset.thumbnail_path_)) {
    outcome.result_ = ItemResult::SKIPPED;
    return outcome;
  }

  fs::path        original = store_->Resolve(asset.file_path_);
  std::error_code ec;
  if (!fs::is_regular_file(original, ec)) {
    throw MissingFileError("Missing file: " + asset.file_path_);
  }

  MediaPatch patch;
  if (!asset.content_hash_.has_value()) {
    patch.content_hash_ = ContentHasher::HashFile(original).ToString();
  }
  if (!asset.mime_type_.has_value()) {
    patch.mime_type_ = MimeTypeFor(original, asset.media_type_);
  }

  auto merged = asset.metadata_.MergedWith(ExtractSafely(original, asset.media_type_));
  Enrich(merged);
  outcome.metadata_changed_ = merged != asset.metadata_;
  patch.metadata_           = std::move(merged);

  // Renders land at the canonical paths, replacing what a previous run wrote there
  if (!missing_only || !store_->Exists(asset.thumbnail_path_)) {
    auto bytes = renderer_->RenderThumbnail(original, asset.media_type_, thumbnails_.max_size_,
                                            thumbnails_.quality_);
    patch.thumbnail_path_ = MediaStore::ThumbnailRelPath(asset.file_path_);
    store_->WriteDurably(*patch.thumbnail_path_, bytes);
    outcome.thumbnail_generated_ = true;
  }
  if (previews_.enabled_ && (!missing_only || !store_->Exists(asset.preview_path_))) {
    auto preview = renderer_->RenderPreview(original, asset.media_type_);
    if (auto* bytes = std::get_if<std::vector<uint8_t>>(&preview)) {
      patch.preview_path_ = MediaStore::PreviewRelPath(asset.file_path_);
      store_->WriteDurably(*patch.preview_path_, *bytes);
    } else {
      patch.preview_path_ = asset.file_path_;
    }
  }

  try {
    outcome.new_tags_ = repository_->Update(asset.id_, patch);
  } catch (const DuplicateHashError& e) {
    // Another row already owns this content; leave this one as it was
    spdlog::warn("Media {} duplicates existing content {}, left unchanged", asset.id_, e.Hash());
    outcome.result_              = ItemResult::DUPLICATE;
    outcome.metadata_changed_    = false;
    outcome.thumbnail_generated_ = false;
  }
  return outcome;
}
};  // namespace momento
