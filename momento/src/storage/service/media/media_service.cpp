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

#include "storage/service/media/media_service.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/mapper/media/media_mapper.hpp"

namespace momento {
namespace {
void WriteMetadata(MediaMapperParams& params, const MetadataRecord& m) {
  params.width             = m.width_;
  params.height            = m.height_;
  params.duration_seconds  = m.duration_seconds_;
  params.date_taken        = m.date_taken_;
  params.gps_latitude      = m.gps_latitude_;
  params.gps_longitude     = m.gps_longitude_;
  params.gps_altitude      = m.gps_altitude_;
  params.geohash           = m.geohash_;
  params.location_city     = m.location_city_;
  params.location_state    = m.location_state_;
  params.location_country  = m.location_country_;
  params.camera_make       = m.camera_make_;
  params.camera_model      = m.camera_model_;
  params.lens_make         = m.lens_make_;
  params.lens_model        = m.lens_model_;
  params.iso               = m.iso_;
  params.exposure_time     = m.exposure_time_;
  params.f_number          = m.f_number_;
  params.focal_length      = m.focal_length_;
  params.focal_length_35mm = m.focal_length_35mm_;
  params.video_codec       = m.video_codec_;
  params.keywords          = m.keywords_;
}

auto ReadMetadata(MediaMapperParams& p) -> MetadataRecord {
  MetadataRecord m;
  m.width_             = p.width;
  m.height_            = p.height;
  m.duration_seconds_  = p.duration_seconds;
  m.date_taken_        = std::move(p.date_taken);
  m.gps_latitude_      = p.gps_latitude;
  m.gps_longitude_     = p.gps_longitude;
  m.gps_altitude_      = p.gps_altitude;
  m.geohash_           = std::move(p.geohash);
  m.location_city_     = std::move(p.location_city);
  m.location_state_    = std::move(p.location_state);
  m.location_country_  = std::move(p.location_country);
  m.camera_make_       = std::move(p.camera_make);
  m.camera_model_      = std::move(p.camera_model);
  m.lens_make_         = std::move(p.lens_make);
  m.lens_model_        = std::move(p.lens_model);
  m.iso_               = p.iso;
  m.exposure_time_     = std::move(p.exposure_time);
  m.f_number_          = p.f_number;
  m.focal_length_      = p.focal_length;
  m.focal_length_35mm_ = p.focal_length_35mm;
  m.video_codec_       = std::move(p.video_codec);
  m.keywords_          = std::move(p.keywords);
  return m;
}

constexpr duckorm::DuckFieldDesc kCountDesc[] = {
    duckorm::DuckFieldDesc{"count", duckorm::DuckDBType::INT64, 0, false}};

auto SelectMedia(const char* tail) -> std::string {
  return "SELECT " + duckorm::column_list(MediaMapper::FieldDesc()) + " FROM media " + tail;
}
}  // namespace

auto MediaService::ToParams(const MediaAsset& source) -> MediaMapperParams {
  MediaMapperParams params{};
  params.id                = source.id_;
  params.content_hash      = source.content_hash_;
  params.filename          = source.filename_;
  params.original_filename = source.original_filename_;
  params.file_path         = source.file_path_;
  params.thumbnail_path    = source.thumbnail_path_;
  params.preview_path      = source.preview_path_;
  params.media_type        = MediaKindToString(source.media_type_);
  params.mime_type         = source.mime_type_;
  params.file_size         = source.file_size_;
  WriteMetadata(params, source.metadata_);
  params.created_at = source.created_at_;
  params.deleted_at = source.deleted_at_;
  return params;
}

auto MediaService::FromParams(MediaMapperParams&& param) -> MediaAsset {
  MediaAsset asset;
  asset.id_                = param.id;
  asset.content_hash_      = std::move(param.content_hash);
  asset.filename_          = std::move(param.filename);
  asset.original_filename_ = std::move(param.original_filename);
  asset.file_path_         = std::move(param.file_path);
  asset.thumbnail_path_    = std::move(param.thumbnail_path);
  asset.preview_path_      = std::move(param.preview_path);
  asset.media_type_        = MediaKindFromString(param.media_type);
  asset.mime_type_         = std::move(param.mime_type);
  asset.file_size_         = param.file_size;
  asset.metadata_          = ReadMetadata(param);
  asset.created_at_        = std::move(param.created_at);
  asset.deleted_at_        = std::move(param.deleted_at);
  return asset;
}

auto MediaService::GetById(media_id_t id) -> std::optional<MediaAsset> {
  auto found = GetByPredicate("id = ?", {duckorm::VarTypes{id}});
  if (found.empty()) return std::nullopt;
  return std::move(found.front());
}

auto MediaService::GetByHash(const hash_str_t& hash) -> std::optional<MediaAsset> {
  auto found = GetByPredicate("content_hash = ?", {duckorm::VarTypes{hash}});
  if (found.empty()) return std::nullopt;
  return std::move(found.front());
}

auto MediaService::GetPage(media_id_t after_id, size_t limit) -> std::vector<MediaAsset> {
  return GetByQuery(SelectMedia("WHERE id > ? ORDER BY id LIMIT ?"),
                    {duckorm::VarTypes{after_id}, duckorm::VarTypes{static_cast<int64_t>(limit)}});
}

auto MediaService::Count() -> int64_t {
  auto rows = duckorm::select_by_query(_conn, kCountDesc, "SELECT COUNT(*) FROM media", {});
  if (rows.empty()) return 0;
  return std::get<int64_t>(rows.front().front());
}

auto MediaService::ApplyPatch(media_id_t id, const MediaPatch& patch) -> idx_t {
  MediaMapperParams                   params{};
  std::vector<duckorm::DuckFieldDesc> fields;
  auto append = [&fields](MediaMapper::FieldArrayType descs) {
    fields.insert(fields.end(), descs.begin(), descs.end());
  };

  if (patch.content_hash_) {
    params.content_hash = patch.content_hash_;
    append(MediaMapper::ContentHashDesc());
  }
  if (patch.mime_type_) {
    params.mime_type = patch.mime_type_;
    append(MediaMapper::MimeTypeDesc());
  }
  if (patch.thumbnail_path_) {
    params.thumbnail_path = patch.thumbnail_path_;
    append(MediaMapper::ThumbnailDesc());
  }
  if (patch.preview_path_) {
    params.preview_path = patch.preview_path_;
    append(MediaMapper::PreviewDesc());
  }
  if (patch.metadata_) {
    WriteMetadata(params, *patch.metadata_);
    append(MediaMapper::MetadataDesc());
  }
  if (fields.empty()) return 0;
  return _mapper.Update(id, params, fields);
}

auto MediaService::SetDeletedAt(media_id_t id, const std::optional<std::string>& deleted_at)
    -> idx_t {
  MediaMapperParams params{};
  params.deleted_at = deleted_at;
  return _mapper.Update(id, params, MediaMapper::DeletedAtDesc());
}

auto MediaService::ClearDerived(std::optional<media_id_t> id) -> idx_t {
  // A default params object is NULL in every nullable column
  MediaMapperParams                   cleared{};
  std::vector<duckorm::DuckFieldDesc> fields;
  for (auto descs : {MediaMapper::ThumbnailDesc(), MediaMapper::PreviewDesc(),
                     MediaMapper::MetadataDesc()}) {
    fields.insert(fields.end(), descs.begin(), descs.end());
  }
  if (id.has_value()) {
    return _mapper.Update(*id, cleared, fields);
  }
  return duckorm::update(_conn, MediaMapper::TableName(), &cleared, fields, "TRUE", {});
}
};  // namespace momento
