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

#include <cstddef>
#include <filesystem>

#include "type/hash_type.hpp"

namespace momento {
class ContentHasher {
 public:
  static constexpr size_t kReadBufferSize = 64 * 1024;

  /**
   * @brief Stream the whole file through XXH3-128. Memory use is bounded by kReadBufferSize
   * regardless of file size.
   *
   * @param path
   * @return Hash128
   */
  static auto HashFile(const std::filesystem::path& path) -> Hash128;
};
};  // namespace momento
