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

#include <optional>
#include <string>
#include <vector>

#include "media/media_asset.hpp"
#include "storage/mapper/media/media_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace momento {
class MediaService : public ServiceInterface<MediaService, MediaAsset, MediaMapperParams,
                                             MediaMapper, media_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const MediaAsset& source) -> MediaMapperParams;
  static auto FromParams(MediaMapperParams&& param) -> MediaAsset;

  auto        GetById(media_id_t id) -> std::optional<MediaAsset>;
  auto        GetByHash(const hash_str_t& hash) -> std::optional<MediaAsset>;

  /**
   * @brief One keyset page: rows with id > after_id, ascending.
   */
  auto        GetPage(media_id_t after_id, size_t limit) -> std::vector<MediaAsset>;
  auto        Count() -> int64_t;

  /**
   * @brief Write the columns selected by a patch. Returns the number of rows changed.
   */
  auto        ApplyPatch(media_id_t id, const MediaPatch& patch) -> idx_t;
  auto        SetDeletedAt(media_id_t id, const std::optional<std::string>& deleted_at) -> idx_t;

  /**
   * @brief Null the derived paths and every enrichment column. A missing id clears every row.
   */
  auto        ClearDerived(std::optional<media_id_t> id) -> idx_t;
};
};  // namespace momento
