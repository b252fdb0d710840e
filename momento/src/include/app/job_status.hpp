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
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace momento {
enum class JobState : uint8_t { IDLE = 0, RUNNING, COMPLETED, FAILED, CANCELLED };

auto JobStateToString(JobState state) -> const char*;
auto JobStateFromString(const std::string& str) -> JobState;

namespace job_status {
constexpr size_t      kDefaultMaxErrors = 100;
constexpr const char* kTruncatedMarker  = "(additional errors truncated)";

/**
 * @brief Append to a capped error log. Once max_errors entries exist a single truncation
 * marker is added and later messages are dropped.
 */
void AppendError(std::vector<std::string>& errors, std::string message,
                 size_t max_errors = kDefaultMaxErrors);
};  // namespace job_status

struct ImportJobStatus {
  JobState                   state_              = JobState::IDLE;
  uint32_t                   total_files_        = 0;
  uint32_t                   processed_files_    = 0;
  uint32_t                   successful_imports_ = 0;
  uint32_t                   failed_imports_     = 0;
  uint32_t                   skipped_duplicates_ = 0;
  std::optional<std::string> started_at_;
  std::optional<std::string> completed_at_;
  std::vector<std::string>   errors_;

  auto        IsTerminal() const -> bool;
  auto        ToJson() const -> nlohmann::json;
  static auto FromJson(const nlohmann::json& j) -> ImportJobStatus;
};

struct RegenerationJobStatus {
  JobState                   state_                = JobState::IDLE;
  uint32_t                   total_media_          = 0;
  uint32_t                   processed_media_      = 0;
  uint32_t                   updated_metadata_     = 0;
  uint32_t                   generated_thumbnails_ = 0;
  uint32_t                   updated_tags_         = 0;
  uint32_t                   failed_media_         = 0;
  uint32_t                   skipped_media_        = 0;
  std::optional<std::string> started_at_;
  std::optional<std::string> completed_at_;
  std::vector<std::string>   errors_;

  auto        IsTerminal() const -> bool;
  auto        ToJson() const -> nlohmann::json;
  static auto FromJson(const nlohmann::json& j) -> RegenerationJobStatus;
};
};  // namespace momento
