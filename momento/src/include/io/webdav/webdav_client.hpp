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
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/app_config.hpp"
#include "type/type.hpp"

namespace momento {
class WebDavError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct WebDavEntry {
  // Decoded absolute server path, e.g. "/dav/Photos/2024/IMG 0001.JPG"
  std::string            path_;
  bool                   is_collection_ = false;
  std::optional<int64_t> size_;
};

/**
 * @brief The few WebDAV calls an import needs: PROPFIND listing and GET download, with basic
 * auth over cpp-httplib.
 */
class WebDavClient {
 public:
  explicit WebDavClient(const WebDavConfig& config);

  /**
   * @brief PROPFIND Depth 0 on the configured root.
   *
   * @throws WebDavError
   */
  void CheckConnection();

  /**
   * @brief Direct children of a collection, the collection itself excluded.
   */
  auto List(const std::string& path) -> std::vector<WebDavEntry>;

  /**
   * @brief Every non-collection entry below the configured root, walking one Depth 1 PROPFIND
   * per collection.
   */
  auto ListFilesRecursive() -> std::vector<WebDavEntry>;

  void Download(const std::string& path, const file_path_t& local);

  auto RootPath() const -> const std::string& { return root_path_; }

  static auto ParseMultistatus(const std::string& body) -> std::vector<WebDavEntry>;

  /**
   * @brief "" -> "/", "photos" -> "/photos". Backslashes become slashes and repeated slashes
   * collapse.
   */
  static auto NormalizePath(const std::string& path) -> std::string;
  static auto EncodePath(const std::string& path) -> std::string;
  static auto DecodePath(const std::string& path) -> std::string;

 private:
  auto Propfind(const std::string& path, int depth) -> std::vector<WebDavEntry>;

  WebDavConfig config_;
  // "https://host:port"
  std::string  origin_;
  // Server-side path of the configured root, normalized
  std::string  root_path_;
};
};  // namespace momento
