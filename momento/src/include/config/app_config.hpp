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
#include <nlohmann/json.hpp>
#include <string>

namespace momento {
struct StorageConfig {
  std::filesystem::path data_root_     = "./data";
  std::string           database_file_ = "momento.duckdb";

  auto DatabasePath() const -> std::filesystem::path { return data_root_ / database_file_; }
};

struct ThumbnailConfig {
  int max_size_ = 400;
  int quality_  = 85;
};

struct PreviewConfig {
  bool enabled_                  = true;
  int  max_size_                 = 1920;
  int  quality_                  = 82;
  // Videos point their preview at the original stream instead of a rendered still
  bool video_reference_original_ = true;
};

struct GeocodingConfig {
  bool        enabled_            = true;
  std::string base_url_           = "https://nominatim.openstreetmap.org/reverse";
  std::string user_agent_         = "Momento/1.0 (self-hosted)";
  int         timeout_seconds_    = 10;
  double      rate_limit_seconds_ = 1.0;
};

struct WebDavConfig {
  bool        enabled_         = false;
  std::string url_;
  std::string username_;
  std::string password_;
  std::string root_path_       = "/";
  int         timeout_seconds_ = 30;
};

struct ImportConfig {
  bool   remove_duplicates_ = true;
  size_t max_errors_        = 100;
};

struct LoggingConfig {
  std::string level_ = "info";
};

class AppConfig {
 public:
  StorageConfig   storage_;
  ThumbnailConfig thumbnails_;
  PreviewConfig   previews_;
  GeocodingConfig reverse_geocoding_;
  WebDavConfig    webdav_;
  ImportConfig    import_;
  LoggingConfig   logging_;

  /**
   * @brief Parse a configuration document. Every key is optional; missing keys keep their
   * defaults. A relative data_root is resolved against base_dir.
   *
   * @param json
   * @param base_dir
   * @return AppConfig
   */
  static auto FromJson(const nlohmann::json&        json,
                       const std::filesystem::path& base_dir = {}) -> AppConfig;

  /**
   * @brief Load from a JSON file.
   *
   * @throws std::runtime_error if the file cannot be opened or parsed, or holds an invalid value
   */
  static auto LoadFromFile(const std::filesystem::path& path) -> AppConfig;

  auto        ToJson() const -> nlohmann::json;

  void        Validate() const;
};
};  // namespace momento
