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

#include "utils/geo/geohash.hpp"

#include <stdexcept>

namespace momento {
namespace geohash {
namespace {
constexpr char kBase32[] = "0123456789bcdefghjkmnpqrstuvwxyz";
}  // namespace

auto Encode(double latitude, double longitude, int precision) -> std::string {
  if (precision <= 0 || precision > 12) {
    throw std::invalid_argument("geohash::Encode: precision must be in [1, 12]");
  }
  double      lat_range[2] = {-90.0, 90.0};
  double      lon_range[2] = {-180.0, 180.0};
  std::string hash;
  hash.reserve(static_cast<size_t>(precision));

  bool even_bit = true;
  int  bit      = 0;
  int  ch       = 0;
  while (static_cast<int>(hash.size()) < precision) {
    // Bits alternate between longitude and latitude, longitude first
    double* range = even_bit ? lon_range : lat_range;
    double  value = even_bit ? longitude : latitude;
    double  mid   = (range[0] + range[1]) / 2.0;
    if (value >= mid) {
      ch       = (ch << 1) | 1;
      range[0] = mid;
    } else {
      ch       = ch << 1;
      range[1] = mid;
    }
    even_bit = !even_bit;
    if (++bit == 5) {
      hash.push_back(kBase32[ch]);
      bit = 0;
      ch  = 0;
    }
  }
  return hash;
}
};  // namespace geohash
};  // namespace momento
