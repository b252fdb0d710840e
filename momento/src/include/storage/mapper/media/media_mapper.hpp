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

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"
#include "type/type.hpp"

namespace momento {
// Flat image of one media row. Member names are the column names.
struct MediaMapperParams {
  media_id_t                 id;
  std::optional<std::string> content_hash;
  std::string                filename;
  std::string                original_filename;
  std::string                file_path;
  std::optional<std::string> thumbnail_path;
  std::optional<std::string> preview_path;
  std::string                media_type;
  std::optional<std::string> mime_type;
  int64_t                    file_size;
  std::optional<int32_t>     width;
  std::optional<int32_t>     height;
  std::optional<double>      duration_seconds;
  std::optional<std::string> date_taken;
  std::optional<double>      gps_latitude;
  std::optional<double>      gps_longitude;
  std::optional<double>      gps_altitude;
  std::optional<std::string> geohash;
  std::optional<std::string> location_city;
  std::optional<std::string> location_state;
  std::optional<std::string> location_country;
  std::optional<std::string> camera_make;
  std::optional<std::string> camera_model;
  std::optional<std::string> lens_make;
  std::optional<std::string> lens_model;
  std::optional<int32_t>     iso;
  std::optional<std::string> exposure_time;
  std::optional<double>      f_number;
  std::optional<double>      focal_length;
  std::optional<double>      focal_length_35mm;
  std::optional<std::string> video_codec;
  std::optional<std::string> keywords;
  std::string                created_at;
  std::optional<std::string> deleted_at;
};

class MediaMapper : public MapperInterface<MediaMapper, MediaMapperParams, media_id_t>,
                    public FieldReflectable<MediaMapper> {
 public:
  using Params = MediaMapperParams;

 private:
  using P                                                      = MediaMapperParams;
  static constexpr uint32_t    _field_count                    = 34;
  static constexpr const char* _table_name                     = "media";
  static constexpr const char* _key_column                     = "id";
  static constexpr const char* _prime_key_clause               = "id = ?";

  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs = {
      FIELD(P, id, INT64),
      NULLABLE_FIELD(P, content_hash, VARCHAR),
      FIELD(P, filename, VARCHAR),
      FIELD(P, original_filename, VARCHAR),
      FIELD(P, file_path, VARCHAR),
      NULLABLE_FIELD(P, thumbnail_path, VARCHAR),
      NULLABLE_FIELD(P, preview_path, VARCHAR),
      FIELD(P, media_type, VARCHAR),
      NULLABLE_FIELD(P, mime_type, VARCHAR),
      FIELD(P, file_size, INT64),
      // Enrichment block, see MetadataDesc()
      NULLABLE_FIELD(P, width, INT32),
      NULLABLE_FIELD(P, height, INT32),
      NULLABLE_FIELD(P, duration_seconds, DOUBLE),
      NULLABLE_FIELD(P, date_taken, VARCHAR),
      NULLABLE_FIELD(P, gps_latitude, DOUBLE),
      NULLABLE_FIELD(P, gps_longitude, DOUBLE),
      NULLABLE_FIELD(P, gps_altitude, DOUBLE),
      NULLABLE_FIELD(P, geohash, VARCHAR),
      NULLABLE_FIELD(P, location_city, VARCHAR),
      NULLABLE_FIELD(P, location_state, VARCHAR),
      NULLABLE_FIELD(P, location_country, VARCHAR),
      NULLABLE_FIELD(P, camera_make, VARCHAR),
      NULLABLE_FIELD(P, camera_model, VARCHAR),
      NULLABLE_FIELD(P, lens_make, VARCHAR),
      NULLABLE_FIELD(P, lens_model, VARCHAR),
      NULLABLE_FIELD(P, iso, INT32),
      NULLABLE_FIELD(P, exposure_time, VARCHAR),
      NULLABLE_FIELD(P, f_number, DOUBLE),
      NULLABLE_FIELD(P, focal_length, DOUBLE),
      NULLABLE_FIELD(P, focal_length_35mm, DOUBLE),
      NULLABLE_FIELD(P, video_codec, VARCHAR),
      NULLABLE_FIELD(P, keywords, VARCHAR),
      FIELD(P, created_at, VARCHAR),
      NULLABLE_FIELD(P, deleted_at, VARCHAR)};

  static constexpr size_t _metadata_begin = 10;
  static constexpr size_t _metadata_count = 22;

 public:
  static constexpr auto ContentHashDesc() -> FieldArrayType { return FieldDesc().subspan(1, 1); }
  static constexpr auto ThumbnailDesc() -> FieldArrayType { return FieldDesc().subspan(5, 1); }
  static constexpr auto PreviewDesc() -> FieldArrayType { return FieldDesc().subspan(6, 1); }
  static constexpr auto MimeTypeDesc() -> FieldArrayType { return FieldDesc().subspan(8, 1); }
  static constexpr auto MetadataDesc() -> FieldArrayType {
    return FieldDesc().subspan(_metadata_begin, _metadata_count);
  }
  static constexpr auto DeletedAtDesc() -> FieldArrayType { return FieldDesc().subspan(33, 1); }

  friend struct FieldReflectable<MediaMapper>;
  using MapperInterface::MapperInterface;
};
};  // namespace momento
