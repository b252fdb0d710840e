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

#include "config/app_config.hpp"

#include <format>
#include <fstream>
#include <stdexcept>

namespace momento {
namespace {
auto Section(const nlohmann::json& json, const char* name) -> nlohmann::json {
  auto it = json.find(name);
  if (it == json.end() || it->is_null()) {
    return nlohmann::json::object();
  }
  if (!it->is_object()) {
    throw std::runtime_error(std::format("Config section '{}' must be an object", name));
  }
  return *it;
}
}  // namespace

auto AppConfig::FromJson(const nlohmann::json& json, const std::filesystem::path& base_dir)
    -> AppConfig {
  AppConfig config;
  try {
    auto storage = Section(json, "storage");
    config.storage_.data_root_ =
        std::filesystem::path(storage.value("data_root", config.storage_.data_root_.string()));
    if (config.storage_.data_root_.is_relative() && !base_dir.empty()) {
      config.storage_.data_root_ = base_dir / config.storage_.data_root_;
    }
    config.storage_.database_file_ = storage.value("database", config.storage_.database_file_);

    auto thumbnails                = Section(json, "thumbnails");
    config.thumbnails_.max_size_   = thumbnails.value("max_size", config.thumbnails_.max_size_);
    config.thumbnails_.quality_    = thumbnails.value("quality", config.thumbnails_.quality_);

    auto previews                  = Section(json, "previews");
    config.previews_.enabled_      = previews.value("enabled", config.previews_.enabled_);
    config.previews_.max_size_     = previews.value("max_size", config.previews_.max_size_);
    config.previews_.quality_      = previews.value("quality", config.previews_.quality_);
    config.previews_.video_reference_original_ =
        previews.value("video_reference_original", config.previews_.video_reference_original_);

    auto geocoding                      = Section(json, "reverse_geocoding");
    config.reverse_geocoding_.enabled_ =
        geocoding.value("enabled", config.reverse_geocoding_.enabled_);
    config.reverse_geocoding_.base_url_ =
        geocoding.value("base_url", config.reverse_geocoding_.base_url_);
    config.reverse_geocoding_.user_agent_ =
        geocoding.value("user_agent", config.reverse_geocoding_.user_agent_);
    config.reverse_geocoding_.timeout_seconds_ =
        geocoding.value("timeout_seconds", config.reverse_geocoding_.timeout_seconds_);
    config.reverse_geocoding_.rate_limit_seconds_ =
        geocoding.value("rate_limit_seconds", config.reverse_geocoding_.rate_limit_seconds_);

    auto webdav                      = Section(json, "webdav");
    config.webdav_.enabled_          = webdav.value("enabled", config.webdav_.enabled_);
    config.webdav_.url_              = webdav.value("url", config.webdav_.url_);
    config.webdav_.username_         = webdav.value("username", config.webdav_.username_);
    config.webdav_.password_         = webdav.value("password", config.webdav_.password_);
    config.webdav_.root_path_        = webdav.value("root_path", config.webdav_.root_path_);
    config.webdav_.timeout_seconds_ =
        webdav.value("timeout_seconds", config.webdav_.timeout_seconds_);

    auto import_section              = Section(json, "import");
    config.import_.remove_duplicates_ =
        import_section.value("remove_duplicates", config.import_.remove_duplicates_);
    config.import_.max_errors_ =
        import_section.value("max_errors", config.import_.max_errors_);

    auto logging                     = Section(json, "logging");
    config.logging_.level_           = logging.value("level", config.logging_.level_);
  } catch (const nlohmann::json::type_error& e) {
    throw std::runtime_error(std::format("Invalid config value: {}", e.what()));
  }
  config.Validate();
  return config;
}

auto AppConfig::LoadFromFile(const std::filesystem::path& path) -> AppConfig {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error(std::format("Failed to open config file {}", path.string()));
  }
  nlohmann::json json;
  try {
    file >> json;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error(std::format("Failed to parse config file {}: {}", path.string(),
                                         e.what()));
  }
  return FromJson(json, path.parent_path());
}

auto AppConfig::ToJson() const -> nlohmann::json {
  nlohmann::json json;
  json["storage"]           = {{"data_root", storage_.data_root_.string()},
                               {"database", storage_.database_file_}};
  json["thumbnails"]        = {{"max_size", thumbnails_.max_size_},
                               {"quality", thumbnails_.quality_}};
  json["previews"]          = {{"enabled", previews_.enabled_},
                               {"max_size", previews_.max_size_},
                               {"quality", previews_.quality_},
                               {"video_reference_original", previews_.video_reference_original_}};
  json["reverse_geocoding"] = {{"enabled", reverse_geocoding_.enabled_},
                               {"base_url", reverse_geocoding_.base_url_},
                               {"user_agent", reverse_geocoding_.user_agent_},
                               {"timeout_seconds", reverse_geocoding_.timeout_seconds_},
                               {"rate_limit_seconds", reverse_geocoding_.rate_limit_seconds_}};
  // Credentials are never echoed back
  json["webdav"]            = {{"enabled", webdav_.enabled_},
                               {"url", webdav_.url_},
                               {"username", webdav_.username_},
                               {"root_path", webdav_.root_path_},
                               {"timeout_seconds", webdav_.timeout_seconds_}};
  json["import"]            = {{"remove_duplicates", import_.remove_duplicates_},
                               {"max_errors", import_.max_errors_}};
  json["logging"]           = {{"level", logging_.level_}};
  return json;
}

void AppConfig::Validate() const {
  if (thumbnails_.max_size_ <= 0) {
    throw std::runtime_error("thumbnails.max_size must be positive");
  }
  if (thumbnails_.quality_ < 1 || thumbnails_.quality_ > 100) {
    throw std::runtime_error("thumbnails.quality must be in [1, 100]");
  }
  if (previews_.max_size_ <= 0) {
    throw std::runtime_error("previews.max_size must be positive");
  }
  if (previews_.quality_ < 1 || previews_.quality_ > 100) {
    throw std::runtime_error("previews.quality must be in [1, 100]");
  }
  if (reverse_geocoding_.rate_limit_seconds_ < 0.0) {
    throw std::runtime_error("reverse_geocoding.rate_limit_seconds must not be negative");
  }
  if (webdav_.enabled_ && webdav_.url_.empty()) {
    throw std::runtime_error("webdav.url is required when webdav.enabled is true");
  }
}
};  // namespace momento
