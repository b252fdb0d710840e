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

#include <string>
#include <vector>

#include "app/import_source.hpp"
#include "type/type.hpp"

namespace momento {
/**
 * @brief Consuming import from a staging directory. Imported files are moved into the library;
 * failed files stay where they are.
 */
class LocalStagingSource final : public ImportSource {
 public:
  LocalStagingSource(file_path_t staging_dir, bool remove_duplicates);

  auto Name() const -> std::string override { return "local"; }
  void Probe() override;
  auto Enumerate() -> std::vector<ImportItem> override;
  auto Fetch(const ImportItem& item) -> file_path_t override;
  void Release(const ImportItem& item, const file_path_t& local, ItemResult result) override;

 private:
  file_path_t staging_dir_;
  bool        remove_duplicates_;
};
};  // namespace momento
