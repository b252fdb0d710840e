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

#include <atomic>
#include <chrono>
#include <string>

namespace momento {
/**
 * @brief Process-wide wall clock. Refresh() re-anchors the cached system time; Now() advances
 * it with the steady clock so job timestamps never run backwards.
 */
class TimeProvider {
 private:
  static std::atomic<std::chrono::system_clock::time_point> _cached_sys_time;
  static std::atomic<std::chrono::steady_clock::time_point> _cached_steady_time;

 public:
  static void Refresh();
  static auto Now() -> std::chrono::system_clock::time_point;

  // UTC, "2026-10-19T08:30:00Z"
  static auto ToIso8601(const std::chrono::system_clock::time_point& tp) -> std::string;
  static auto NowIso8601() -> std::string;

  // UTC, strftime-style pattern
  static auto FormatUtc(const std::chrono::system_clock::time_point& tp, const char* pattern)
      -> std::string;
  static auto FormatLocal(const std::chrono::system_clock::time_point& tp, const char* pattern)
      -> std::string;
};
};  // namespace momento
