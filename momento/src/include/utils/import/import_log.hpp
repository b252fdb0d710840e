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
#include <mutex>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace momento {
enum class ItemResult : uint8_t { IMPORTED = 0, UPDATED, SKIPPED, DUPLICATE, FAILED };

inline auto ItemResultToString(ItemResult result) -> const char* {
  switch (result) {
    case ItemResult::IMPORTED:
      return "imported";
    case ItemResult::UPDATED:
      return "updated";
    case ItemResult::SKIPPED:
      return "skipped";
    case ItemResult::DUPLICATE:
      return "duplicate";
    case ItemResult::FAILED:
      return "failed";
  }
  return "failed";
}

struct ImportLogEntry {
  std::string name_{};
  ItemResult  result_   = ItemResult::FAILED;
  // Row written or matched, 0 when none
  media_id_t  media_id_ = 0;
  std::string message_{};
};

/**
 * @brief Ordered per-item outcomes of one job. Written by the worker, read by anyone.
 */
class ImportLog {
 public:
  void Record(std::string name, ItemResult result, media_id_t media_id = 0,
              std::string message = {}) {
    std::lock_guard<std::mutex> lock(mtx_);
    entries_.push_back({std::move(name), result, media_id, std::move(message)});
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    entries_.clear();
  }

  auto Snapshot() const -> std::vector<ImportLogEntry> {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_;
  }

  auto Count(ItemResult result) const -> size_t {
    std::lock_guard<std::mutex> lock(mtx_);
    size_t                      n = 0;
    for (const auto& entry : entries_) {
      if (entry.result_ == result) ++n;
    }
    return n;
  }

 private:
  mutable std::mutex          mtx_{};
  std::vector<ImportLogEntry> entries_{};
};
};  // namespace momento
