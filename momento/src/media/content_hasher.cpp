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

#include "media/content_hasher.hpp"

#include <xxhash.h>

#include <format>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace momento {
namespace {
struct StateDeleter {
  void operator()(XXH3_state_t* state) const { XXH3_freeState(state); }
};
}  // namespace

auto ContentHasher::HashFile(const std::filesystem::path& path) -> Hash128 {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error(std::format("Cannot open {} for hashing", path.string()));
  }

  std::unique_ptr<XXH3_state_t, StateDeleter> state(XXH3_createState());
  if (!state || XXH3_128bits_reset(state.get()) == XXH_ERROR) {
    throw std::runtime_error("ContentHasher: failed to initialize XXH3 state");
  }

  std::vector<char> buffer(kReadBufferSize);
  while (file) {
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize got = file.gcount();
    if (got <= 0) break;
    if (XXH3_128bits_update(state.get(), buffer.data(), static_cast<size_t>(got)) == XXH_ERROR) {
      throw std::runtime_error("ContentHasher: XXH3 update failed");
    }
  }
  if (file.bad()) {
    throw std::runtime_error(std::format("Read error while hashing {}", path.string()));
  }
  return Hash128(XXH3_128bits_digest(state.get()));
}
};  // namespace momento
