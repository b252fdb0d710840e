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

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "app/import_source.hpp"
#include "io/webdav/webdav_client.hpp"
#include "type/type.hpp"

namespace momento {
/**
 * @brief Non-consuming import from a WebDAV share. Each item is downloaded into a private
 * staging directory and the local copy is deleted once the item settles.
 */
class WebDavSource final : public ImportSource {
 public:
  WebDavSource(std::unique_ptr<WebDavClient> client, file_path_t download_dir);

  auto Name() const -> std::string override { return "webdav"; }
  void Probe() override;
  auto Enumerate() -> std::vector<ImportItem> override;
  auto Fetch(const ImportItem& item) -> file_path_t override;
  void Release(const ImportItem& item, const file_path_t& local, ItemResult result) override;

 private:
  std::unique_ptr<WebDavClient> client_;
  file_path_t                   download_dir_;
  std::atomic<uint64_t>         download_seq_{0};
};
};  // namespace momento
