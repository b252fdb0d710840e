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

#include "app/webdav_source.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <utility>

#include "storage/media_store.hpp"
#include "type/supported_file_type.hpp"

namespace momento {
WebDavSource::WebDavSource(std::unique_ptr<WebDavClient> client, file_path_t download_dir)
    : client_(std::move(client)), download_dir_(std::move(download_dir)) {}

void WebDavSource::Probe() {
  try {
    client_->CheckConnection();
  } catch (const WebDavError& e) {
    throw SourceUnavailableError(e.what());
  }
}

auto WebDavSource::Enumerate() -> std::vector<ImportItem> {
  std::vector<WebDavEntry> entries;
  try {
    entries = client_->ListFilesRecursive();
  } catch (const WebDavError& e) {
    throw SourceUnavailableError(e.what());
  }

  std::vector<ImportItem> items;
  for (auto& entry : entries) {
    fs::path remote(entry.path_);
    if (!HasSupportedExtension(remote)) continue;
    items.push_back({entry.path_, remote.filename().string()});
  }
  std::sort(items.begin(), items.end(), [](const ImportItem& a, const ImportItem& b) {
    return a.source_id_ < b.source_id_;
  });
  spdlog::info("WebDAV share {} lists {} importable files", client_->RootPath(), items.size());
  return items;
}

auto WebDavSource::Fetch(const ImportItem& item) -> file_path_t {
  // Sequence prefix keeps same-named files from different folders apart
  file_path_t local =
      download_dir_ / std::format("{:06}_{}", download_seq_.fetch_add(1), item.display_name_);
  try {
    client_->Download(item.source_id_, local);
  } catch (const WebDavError& e) {
    throw FetchError(e.what());
  } catch (const std::filesystem::filesystem_error& e) {
    throw FetchError(e.what());
  }
  return local;
}

void WebDavSource::Release(const ImportItem&, const file_path_t& local, ItemResult) {
  std::error_code ec;
  if (fs::exists(local, ec)) {
    MediaStore::RemoveQuietly(local);
  }
}
};  // namespace momento
