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
#include <string>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"
#include "type/type.hpp"

namespace momento {
// CREATE TABLE tags (id BIGINT PRIMARY KEY DEFAULT nextval('tags_id_seq'), name TEXT UNIQUE)
struct TagMapperParams {
  tag_id_t    id;
  std::string name;
};

class TagMapper : public MapperInterface<TagMapper, TagMapperParams, tag_id_t>,
                  public FieldReflectable<TagMapper> {
 public:
  using Params = TagMapperParams;

 private:
  static constexpr uint32_t                                         _field_count      = 2;
  static constexpr const char*                                      _table_name       = "tags";
  static constexpr const char*                                      _key_column       = "id";
  static constexpr const char*                                      _prime_key_clause = "id = ?";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      FIELD(TagMapperParams, id, INT64), FIELD(TagMapperParams, name, VARCHAR)};

 public:
  friend struct FieldReflectable<TagMapper>;
  using MapperInterface::MapperInterface;
};

// CREATE TABLE media_tags (media_id BIGINT, tag_id BIGINT, PRIMARY KEY (media_id, tag_id))
struct MediaTagMapperParams {
  media_id_t media_id;
  tag_id_t   tag_id;
};

class MediaTagMapper : public MapperInterface<MediaTagMapper, MediaTagMapperParams, media_id_t>,
                       public FieldReflectable<MediaTagMapper> {
 public:
  using Params = MediaTagMapperParams;

 private:
  static constexpr uint32_t                                         _field_count = 2;
  static constexpr const char*                                      _table_name  = "media_tags";
  static constexpr const char*                                      _key_column  = "media_id";
  static constexpr const char* _prime_key_clause = "media_id = ?";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs = {
      FIELD(MediaTagMapperParams, media_id, INT64), FIELD(MediaTagMapperParams, tag_id, INT64)};

 public:
  friend struct FieldReflectable<MediaTagMapper>;
  using MapperInterface::MapperInterface;
};
};  // namespace momento
