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

#include "media/reverse_geocoder.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <format>
#include <thread>

namespace momento {
namespace {
auto FirstString(const nlohmann::json& object, std::initializer_list<const char*> keys)
    -> std::optional<std::string> {
  for (const char* key : keys) {
    auto it = object.find(key);
    if (it != object.end() && it->is_string() && !it->get<std::string>().empty()) {
      return it->get<std::string>();
    }
  }
  return std::nullopt;
}
}  // namespace

NominatimGeocoder::NominatimGeocoder(const GeocodingConfig& config) : config_(config) {
  // Split "https://host[:port]/path" into the client base and the request path
  const std::string& url        = config_.base_url_;
  auto               scheme_end = url.find("://");
  auto               path_begin =
      url.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
  if (path_begin == std::string::npos) {
    scheme_host_port_ = url;
    path_             = "/";
  } else {
    scheme_host_port_ = url.substr(0, path_begin);
    path_             = url.substr(path_begin);
  }
}

void NominatimGeocoder::WaitForRateLimit() {
  if (has_requested_) {
    auto min_gap = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(config_.rate_limit_seconds_));
    auto next_allowed = last_request_ + min_gap;
    auto now          = std::chrono::steady_clock::now();
    if (now < next_allowed) {
      std::this_thread::sleep_for(next_allowed - now);
    }
  }
  last_request_  = std::chrono::steady_clock::now();
  has_requested_ = true;
}

auto NominatimGeocoder::Lookup(double latitude, double longitude) -> std::optional<GeoLocation> {
  if (!config_.enabled_) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(request_lock_);
  WaitForRateLimit();

  httplib::Client client(scheme_host_port_);
  client.set_connection_timeout(config_.timeout_seconds_, 0);
  client.set_read_timeout(config_.timeout_seconds_, 0);
  client.set_follow_location(true);

  const std::string query =
      std::format("{}?format=json&lat={}&lon={}&zoom=10&addressdetails=1", path_, latitude,
                  longitude);
  httplib::Headers headers = {{"User-Agent", config_.user_agent_}};
  auto             res     = client.Get(query, headers);
  if (!res) {
    spdlog::warn("Reverse geocoding request failed: {}", httplib::to_string(res.error()));
    return std::nullopt;
  }
  if (res->status != 200) {
    spdlog::warn("Reverse geocoding returned HTTP {}", res->status);
    return std::nullopt;
  }

  try {
    return ParseResponse(nlohmann::json::parse(res->body));
  } catch (const nlohmann::json::exception& e) {
    spdlog::warn("Reverse geocoding response is not valid JSON: {}", e.what());
    return std::nullopt;
  }
}

auto NominatimGeocoder::ParseResponse(const nlohmann::json& body) -> std::optional<GeoLocation> {
  auto address = body.find("address");
  if (address == body.end() || !address->is_object()) {
    return std::nullopt;
  }
  GeoLocation location;
  location.city_    = FirstString(*address, {"city", "town", "village", "hamlet"});
  location.state_   = FirstString(*address, {"state", "region", "province"});
  location.country_ = FirstString(*address, {"country"});
  if (!location.city_ && !location.state_ && !location.country_) {
    return std::nullopt;
  }
  return location;
}
};  // namespace momento
