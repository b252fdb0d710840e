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

#include <chrono>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "config/app_config.hpp"

namespace momento {
struct GeoLocation {
  std::optional<std::string> city_;
  std::optional<std::string> state_;
  std::optional<std::string> country_;
};

class ReverseGeocoder {
 public:
  virtual ~ReverseGeocoder() = default;

  /**
   * @brief Resolve coordinates to a place. Returns nullopt on any failure; callers treat a
   * missing answer as "no enrichment", never as an error.
   */
  virtual auto Lookup(double latitude, double longitude) -> std::optional<GeoLocation> = 0;
};

/**
 * @brief OpenStreetMap Nominatim client. Calls are serialized and spaced by the configured
 * rate limit, as the public instance requires.
 */
class NominatimGeocoder final : public ReverseGeocoder {
 public:
  explicit NominatimGeocoder(const GeocodingConfig& config);

  auto Lookup(double latitude, double longitude) -> std::optional<GeoLocation> override;

  static auto ParseResponse(const nlohmann::json& body) -> std::optional<GeoLocation>;

 private:
  void                                  WaitForRateLimit();

  GeocodingConfig                       config_;
  std::string                           scheme_host_port_;
  std::string                           path_;

  std::mutex                            request_lock_;
  std::chrono::steady_clock::time_point last_request_{};
  bool                                  has_requested_ = false;
};
};  // namespace momento
