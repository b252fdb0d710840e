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

#include <xxhash.h>

#include <cstdint>
#include <functional>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace momento {
/**
 * @brief 128-bit content digest produced by XXH3. The hex form (high word first) is what the
 * library stores as content_hash.
 */
class Hash128 {
 public:
  Hash128() : h_{0, 0} {}
  explicit Hash128(const XXH128_hash_t& h) : h_(h) {}

  Hash128(uint64_t low, uint64_t high) : h_{low, high} {}

  uint64_t    low64() const { return h_.low64; }
  uint64_t    high64() const { return h_.high64; }

  std::string ToString() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(16) << h_.high64;
    oss << std::setw(16) << h_.low64;
    return oss.str();
  }

  static Hash128 FromString(const std::string& str) {
    if (str.length() != 32) {
      throw std::invalid_argument("Hash128::FromString: Invalid string length");
    }
    uint64_t high = std::stoull(str.substr(0, 16), nullptr, 16);
    uint64_t low  = std::stoull(str.substr(16, 16), nullptr, 16);
    return Hash128(XXH128_hash_t{low, high});
  }

  bool operator==(const Hash128& other) const noexcept {
    return h_.low64 == other.h_.low64 && h_.high64 == other.h_.high64;
  }
  bool operator!=(const Hash128& other) const noexcept { return !(*this == other); }

  static Hash128 Compute(const void* data, size_t length) {
    return Hash128(XXH3_128bits(data, length));
  }

 private:
  XXH128_hash_t h_;
};
};  // namespace momento

namespace std {
template <>
struct hash<momento::Hash128> {
  std::size_t operator()(const momento::Hash128& h) const noexcept {
    auto h1 = std::hash<uint64_t>{}(h.low64());
    auto h2 = std::hash<uint64_t>{}(h.high64());
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
  }
};
}  // namespace std
