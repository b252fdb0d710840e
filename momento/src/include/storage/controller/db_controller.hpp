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

#include <duckdb.h>

#include "storage/controller/controller_types.hpp"
#include "type/type.hpp"

namespace momento {
class DBController {
 private:
  duckdb_database              _db = nullptr;

  file_path_t                  _db_path;

  constexpr static const char* init_table_query =
      "CREATE SEQUENCE IF NOT EXISTS media_id_seq START 1;"
      "CREATE SEQUENCE IF NOT EXISTS tags_id_seq START 1;"
      "CREATE TABLE IF NOT EXISTS media ("
      "id BIGINT PRIMARY KEY DEFAULT nextval('media_id_seq'), content_hash TEXT UNIQUE, "
      "filename TEXT NOT NULL, original_filename TEXT NOT NULL, file_path TEXT NOT NULL, "
      "thumbnail_path TEXT, preview_path TEXT, media_type TEXT NOT NULL, mime_type TEXT, "
      "file_size BIGINT NOT NULL, width INTEGER, height INTEGER, duration_seconds DOUBLE, "
      "date_taken TEXT, gps_latitude DOUBLE, gps_longitude DOUBLE, gps_altitude DOUBLE, "
      "geohash TEXT, location_city TEXT, location_state TEXT, location_country TEXT, "
      "camera_make TEXT, camera_model TEXT, lens_make TEXT, lens_model TEXT, iso INTEGER, "
      "exposure_time TEXT, f_number DOUBLE, focal_length DOUBLE, focal_length_35mm DOUBLE, "
      "video_codec TEXT, keywords TEXT, created_at TEXT NOT NULL, deleted_at TEXT);"
      "CREATE INDEX IF NOT EXISTS idx_media_date_taken ON media (date_taken, id);"
      "CREATE INDEX IF NOT EXISTS idx_media_file_path ON media (file_path);"
      "CREATE TABLE IF NOT EXISTS tags ("
      "id BIGINT PRIMARY KEY DEFAULT nextval('tags_id_seq'), name TEXT NOT NULL UNIQUE);"
      "CREATE TABLE IF NOT EXISTS media_tags (media_id BIGINT NOT NULL, tag_id BIGINT NOT NULL, "
      "PRIMARY KEY (media_id, tag_id));"
      "CREATE TABLE IF NOT EXISTS job_status (kind TEXT PRIMARY KEY, payload TEXT NOT NULL, "
      "updated_at TEXT NOT NULL)";

 public:
  /**
   * @brief Open (or create) the database file and make sure the schema exists.
   *
   * @throws duckorm::DuckDBError
   */
  explicit DBController(const file_path_t& db_path);
  ~DBController();

  DBController(const DBController&)            = delete;
  DBController& operator=(const DBController&) = delete;

  void InitializeDB();

  auto GetConnectionGuard() -> ConnectionGuard;
};
};  // namespace momento
