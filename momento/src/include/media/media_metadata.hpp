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
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace momento {
/**
 * @brief Everything the extractor and the geocoder can learn about a file. Each field is
 * independent; an empty record is a valid result.
 */
struct MetadataRecord {
  std::optional<int32_t>     width_;
  std::optional<int32_t>     height_;
  std::optional<double>      duration_seconds_;
  std::optional<std::string> date_taken_;

  std::optional<double>      gps_latitude_;
  std::optional<double>      gps_longitude_;
  std::optional<double>      gps_altitude_;
  std::optional<std::string> geohash_;

  std::optional<std::string> location_city_;
  std::optional<std::string> location_state_;
  std::optional<std::string> location_country_;

  std::optional<std::string> camera_make_;
  std::optional<std::string> camera_model_;
  std::optional<std::string> lens_make_;
  std::optional<std::string> lens_model_;
  std::optional<int32_t>     iso_;
  std::optional<std::string> exposure_time_;
  std::optional<double>      f_number_;
  std::optional<double>      focal_length_;
  std::optional<double>      focal_length_35mm_;

  std::optional<std::string> video_codec_;
  std::optional<std::string> keywords_;

  bool operator==(const MetadataRecord&) const = default;

  auto HasDimensions() const -> bool { return width_.has_value() && height_.has_value(); }
  auto HasGps() const -> bool { return gps_latitude_.has_value() && gps_longitude_.has_value(); }
  auto NeedsGeocoding() const -> bool {
    return HasGps() && (!location_state_.has_value() || !location_country_.has_value());
  }

  /**
   * @brief Merge a freshly extracted record into this one. Existing values are kept, except GPS
   * where the fresh reading wins.
   */
  auto MergedWith(const MetadataRecord& fresh) const -> MetadataRecord;

  /**
   * @brief Drop coordinates (and the altitude and geohash tied to them) that fall outside
   * latitude [-90, 90] or longitude [-180, 180].
   */
  void SanitizeGps();

  auto KeywordList() const -> std::vector<std::string>;

  auto ToJson() const -> nlohmann::json;
};

namespace metadata {
auto FormatExposureTime(double seconds) -> std::optional<std::string>;

/**
 * @brief Normalize an EXIF or container date string to YYYY-MM-DDTHH:MM:SS.
 */
auto NormalizeDateTime(const std::string& raw) -> std::optional<std::string>;

/**
 * @brief Parse an ISO 6709 location such as "+40.7128-074.0060+010.000/".
 */
auto ParseIso6709(const std::string& raw)
    -> std::optional<std::tuple<double, double, std::optional<double>>>;

auto JoinKeywords(const std::vector<std::string>& keywords) -> std::optional<std::string>;
auto SplitKeywords(const std::string& joined) -> std::vector<std::string>;
};  // namespace metadata
};  // namespace momento
