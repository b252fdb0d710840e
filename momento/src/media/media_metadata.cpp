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

#include "media/media_metadata.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <format>
#include <iomanip>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace momento {
namespace {
template <typename T>
auto KeepExisting(const std::optional<T>& existing, const std::optional<T>& fresh)
    -> std::optional<T> {
  return existing.has_value() ? existing : fresh;
}

template <typename T>
auto PreferFresh(const std::optional<T>& existing, const std::optional<T>& fresh)
    -> std::optional<T> {
  return fresh.has_value() ? fresh : existing;
}

auto Trim(const std::string& value) -> std::string {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

template <typename T>
auto OptToJson(const std::optional<T>& value) -> nlohmann::json {
  if (!value.has_value()) return nullptr;
  return *value;
}
}  // namespace

auto MetadataRecord::MergedWith(const MetadataRecord& fresh) const -> MetadataRecord {
  MetadataRecord merged;
  merged.width_             = KeepExisting(width_, fresh.width_);
  merged.height_            = KeepExisting(height_, fresh.height_);
  merged.duration_seconds_  = KeepExisting(duration_seconds_, fresh.duration_seconds_);
  merged.date_taken_        = KeepExisting(date_taken_, fresh.date_taken_);

  merged.gps_latitude_      = PreferFresh(gps_latitude_, fresh.gps_latitude_);
  merged.gps_longitude_     = PreferFresh(gps_longitude_, fresh.gps_longitude_);
  merged.gps_altitude_      = PreferFresh(gps_altitude_, fresh.gps_altitude_);
  merged.geohash_           = PreferFresh(geohash_, fresh.geohash_);

  merged.location_city_     = KeepExisting(location_city_, fresh.location_city_);
  merged.location_state_    = KeepExisting(location_state_, fresh.location_state_);
  merged.location_country_  = KeepExisting(location_country_, fresh.location_country_);

  merged.camera_make_       = KeepExisting(camera_make_, fresh.camera_make_);
  merged.camera_model_      = KeepExisting(camera_model_, fresh.camera_model_);
  merged.lens_make_         = KeepExisting(lens_make_, fresh.lens_make_);
  merged.lens_model_        = KeepExisting(lens_model_, fresh.lens_model_);
  merged.iso_               = KeepExisting(iso_, fresh.iso_);
  merged.exposure_time_     = KeepExisting(exposure_time_, fresh.exposure_time_);
  merged.f_number_          = KeepExisting(f_number_, fresh.f_number_);
  merged.focal_length_      = KeepExisting(focal_length_, fresh.focal_length_);
  merged.focal_length_35mm_ = KeepExisting(focal_length_35mm_, fresh.focal_length_35mm_);

  merged.video_codec_       = KeepExisting(video_codec_, fresh.video_codec_);
  merged.keywords_          = KeepExisting(keywords_, fresh.keywords_);
  return merged;
}

void MetadataRecord::SanitizeGps() {
  bool valid = gps_latitude_.has_value() && gps_longitude_.has_value() &&
               std::isfinite(*gps_latitude_) && std::isfinite(*gps_longitude_) &&
               *gps_latitude_ >= -90.0 && *gps_latitude_ <= 90.0 && *gps_longitude_ >= -180.0 &&
               *gps_longitude_ <= 180.0;
  if (!valid) {
    gps_latitude_.reset();
    gps_longitude_.reset();
    gps_altitude_.reset();
    geohash_.reset();
    return;
  }
  if (gps_altitude_.has_value() && !std::isfinite(*gps_altitude_)) {
    gps_altitude_.reset();
  }
}

auto MetadataRecord::KeywordList() const -> std::vector<std::string> {
  if (!keywords_.has_value()) return {};
  return metadata::SplitKeywords(*keywords_);
}

auto MetadataRecord::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["width"]           = OptToJson(width_);
  j["height"]          = OptToJson(height_);
  j["durationSeconds"] = OptToJson(duration_seconds_);
  j["dateTaken"]       = OptToJson(date_taken_);
  j["gpsLatitude"]     = OptToJson(gps_latitude_);
  j["gpsLongitude"]    = OptToJson(gps_longitude_);
  j["gpsAltitude"]     = OptToJson(gps_altitude_);
  j["geohash"]         = OptToJson(geohash_);
  j["locationCity"]    = OptToJson(location_city_);
  j["locationState"]   = OptToJson(location_state_);
  j["locationCountry"] = OptToJson(location_country_);
  j["cameraMake"]      = OptToJson(camera_make_);
  j["cameraModel"]     = OptToJson(camera_model_);
  j["lensMake"]        = OptToJson(lens_make_);
  j["lensModel"]       = OptToJson(lens_model_);
  j["iso"]             = OptToJson(iso_);
  j["exposureTime"]    = OptToJson(exposure_time_);
  j["fNumber"]         = OptToJson(f_number_);
  j["focalLength"]     = OptToJson(focal_length_);
  j["focalLength35mm"] = OptToJson(focal_length_35mm_);
  j["videoCodec"]      = OptToJson(video_codec_);
  j["keywords"]        = OptToJson(keywords_);
  return j;
}

namespace metadata {
auto FormatExposureTime(double seconds) -> std::optional<std::string> {
  if (!std::isfinite(seconds) || seconds <= 0.0) {
    return std::nullopt;
  }
  if (seconds < 1.0) {
    auto denominator = static_cast<int64_t>(std::llround(1.0 / seconds));
    return std::format("1/{}", denominator);
  }
  return std::format("{}", seconds);
}

auto NormalizeDateTime(const std::string& raw) -> std::optional<std::string> {
  static const char* formats[] = {"%Y:%m:%d %H:%M:%S", "%Y-%m-%d %H:%M:%S", "%Y-%m-%dT%H:%M:%S",
                                  "%Y:%m:%d", "%Y-%m-%d"};
  const std::string  value     = Trim(raw);
  if (value.empty()) {
    return std::nullopt;
  }
  for (const char* format : formats) {
    std::tm            tm{};
    std::istringstream iss(value);
    iss >> std::get_time(&tm, format);
    if (iss.fail()) {
      continue;
    }
    if (tm.tm_year + 1900 < 1800) {
      continue;
    }
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
  }
  return std::nullopt;
}

auto ParseIso6709(const std::string& raw)
    -> std::optional<std::tuple<double, double, std::optional<double>>> {
  static const std::regex pattern(R"(^([+-]\d+(?:\.\d+)?)([+-]\d+(?:\.\d+)?)([+-]\d+(?:\.\d+)?)?)");
  std::smatch             match;
  const std::string       value = Trim(raw);
  if (!std::regex_search(value, match, pattern)) {
    return std::nullopt;
  }
  double lat = std::stod(match[1].str());
  double lon = std::stod(match[2].str());
  if (lat < -90.0 || lat > 90.0 || lon < -180.0 || lon > 180.0) {
    return std::nullopt;
  }
  std::optional<double> alt;
  if (match[3].matched) {
    alt = std::stod(match[3].str());
  }
  return std::make_tuple(lat, lon, alt);
}

auto JoinKeywords(const std::vector<std::string>& keywords) -> std::optional<std::string> {
  std::string                     joined;
  std::unordered_set<std::string> seen;
  for (const auto& raw : keywords) {
    std::string keyword = Trim(raw);
    // Commas would split a keyword on the way back out
    std::replace(keyword.begin(), keyword.end(), ',', ' ');
    if (keyword.empty() || !seen.insert(keyword).second) {
      continue;
    }
    if (!joined.empty()) joined += ',';
    joined += keyword;
  }
  if (joined.empty()) return std::nullopt;
  return joined;
}

auto SplitKeywords(const std::string& joined) -> std::vector<std::string> {
  std::vector<std::string>        result;
  std::unordered_set<std::string> seen;
  std::istringstream              iss(joined);
  std::string                     token;
  while (std::getline(iss, token, ',')) {
    std::string keyword = Trim(token);
    if (keyword.empty() || !seen.insert(keyword).second) {
      continue;
    }
    result.push_back(std::move(keyword));
  }
  return result;
}
};  // namespace metadata
};  // namespace momento
