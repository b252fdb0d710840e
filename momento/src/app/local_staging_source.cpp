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

#include "app/local_staging_source.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "storage/media_store.hpp"
#include "type/supported_file_type.hpp"

namespace momento {
namespace {
auto IsHidden(const fs::path& path) -> bool {
  std::string name = path.filename().string();
  return !name.empty() && name.front() == '.';
}
}  // namespace

LocalStagingSource::LocalStagingSource(file_path_t staging_dir, bool remove_duplicates)
    : staging_dir_(std::move(staging_dir)), remove_duplicates_(remove_duplicates) {}

void LocalStagingSource::Probe() {
  std::error_code ec;
  if (!fs::is_directory(staging_dir_, ec)) {
    throw SourceUnavailableError("Staging directory " + staging_dir_.string() +
                                 " does not exist");
  }
}

auto LocalStagingSource::Enumerate() -> std::vector<ImportItem> {
  Probe();
  std::vector<fs::path> files;
  std::error_code       ec;
  fs::recursive_directory_iterator it(staging_dir_,
                                      fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    throw SourceUnavailableError("Cannot read " + staging_dir_.string() + ": " + ec.message());
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      spdlog::warn("Skipping unreadable staging entry: {}", ec.message());
      ec.clear();
      continue;
    }
    const fs::path& path = it->path();
    if (IsHidden(path)) {
      if (it->is_directory(ec)) it.disable_recursion_pending();
      continue;
    }
    if (is_supported_file(path)) {
      files.push_back(path);
    }
  }
  std::sort(files.begin(), files.end());

  std::vector<ImportItem> items;
  items.reserve(files.size());
  for (const auto& file : files) {
    items.push_back({file.string(), file.filename().string()});
  }
  return items;
}

auto LocalStagingSource::Fetch(const ImportItem& item) -> file_path_t {
  fs::path        path(item.source_id_);
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw std::runtime_error("File disappeared from staging");
  }
  return path;
}

void LocalStagingSource::Release(const ImportItem& item, const file_path_t& local,
                                 ItemResult result) {
  if (result == ItemResult::DUPLICATE && remove_duplicates_) {
    spdlog::debug("Removing staged duplicate {}", item.display_name_);
    MediaStore::RemoveQuietly(local);
  }
}
};  // namespace momento
