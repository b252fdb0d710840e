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

#include "app/job_status.hpp"

#include <utility>

namespace momento {
namespace {
auto OptString(const nlohmann::json& j, const char* key) -> std::optional<std::string> {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return std::nullopt;
  return it->get<std::string>();
}

auto OptToJson(const std::optional<std::string>& value) -> nlohmann::json {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

auto ErrorsFromJson(const nlohmann::json& j) -> std::vector<std::string> {
  std::vector<std::string> errors;
  auto                     it = j.find("errors");
  if (it == j.end() || !it->is_array()) return errors;
  for (const auto& entry : *it) {
    if (entry.is_string()) errors.push_back(entry.get<std::string>());
  }
  return errors;
}

auto IsTerminalState(JobState state) -> bool {
  return state == JobState::COMPLETED || state == JobState::FAILED ||
         state == JobState::CANCELLED;
}
}  // namespace

auto JobStateToString(JobState state) -> const char* {
  switch (state) {
    case JobState::IDLE:
      return "idle";
    case JobState::RUNNING:
      return "running";
    case JobState::COMPLETED:
      return "completed";
    case JobState::FAILED:
      return "failed";
    case JobState::CANCELLED:
      return "cancelled";
  }
  return "idle";
}

auto JobStateFromString(const std::string& str) -> JobState {
  if (str == "running") return JobState::RUNNING;
  if (str == "completed") return JobState::COMPLETED;
  if (str == "failed") return JobState::FAILED;
  if (str == "cancelled") return JobState::CANCELLED;
  return JobState::IDLE;
}

namespace job_status {
void AppendError(std::vector<std::string>& errors, std::string message, size_t max_errors) {
  if (errors.size() < max_errors) {
    errors.push_back(std::move(message));
  } else if (errors.size() == max_errors) {
    errors.emplace_back(kTruncatedMarker);
  }
}
};  // namespace job_status

auto ImportJobStatus::IsTerminal() const -> bool { return IsTerminalState(state_); }

auto ImportJobStatus::ToJson() const -> nlohmann::json {
  return {{"status", JobStateToString(state_)},
          {"totalFiles", total_files_},
          {"processedFiles", processed_files_},
          {"successfulImports", successful_imports_},
          {"failedImports", failed_imports_},
          {"skippedDuplicates", skipped_duplicates_},
          {"startedAt", OptToJson(started_at_)},
          {"completedAt", OptToJson(completed_at_)},
          {"errors", errors_}};
}

auto ImportJobStatus::FromJson(const nlohmann::json& j) -> ImportJobStatus {
  ImportJobStatus status;
  status.state_              = JobStateFromString(j.value("status", std::string("idle")));
  status.total_files_        = j.value("totalFiles", 0u);
  status.processed_files_    = j.value("processedFiles", 0u);
  status.successful_imports_ = j.value("successfulImports", 0u);
  status.failed_imports_     = j.value("failedImports", 0u);
  status.skipped_duplicates_ = j.value("skippedDuplicates", 0u);
  status.started_at_         = OptString(j, "startedAt");
  status.completed_at_       = OptString(j, "completedAt");
  status.errors_             = ErrorsFromJson(j);
  return status;
}

auto RegenerationJobStatus::IsTerminal() const -> bool { return IsTerminalState(state_); }

auto RegenerationJobStatus::ToJson() const -> nlohmann::json {
  return {{"status", JobStateToString(state_)},
          {"totalMedia", total_media_},
          {"processedMedia", processed_media_},
          {"updatedMetadata", updated_metadata_},
          {"generatedThumbnails", generated_thumbnails_},
          {"updatedTags", updated_tags_},
          {"failedMedia", failed_media_},
          {"skippedMedia", skipped_media_},
          {"startedAt", OptToJson(started_at_)},
          {"completedAt", OptToJson(completed_at_)},
          {"errors", errors_}};
}

auto RegenerationJobStatus::FromJson(const nlohmann::json& j) -> RegenerationJobStatus {
  RegenerationJobStatus status;
  status.state_                = JobStateFromString(j.value("status", std::string("idle")));
  status.total_media_          = j.value("totalMedia", 0u);
  status.processed_media_      = j.value("processedMedia", 0u);
  status.updated_metadata_     = j.value("updatedMetadata", 0u);
  status.generated_thumbnails_ = j.value("generatedThumbnails", 0u);
  status.updated_tags_         = j.value("updatedTags", 0u);
  status.failed_media_         = j.value("failedMedia", 0u);
  status.skipped_media_        = j.value("skippedMedia", 0u);
  status.started_at_           = OptString(j, "startedAt");
  status.completed_at_         = OptString(j, "completedAt");
  status.errors_               = ErrorsFromJson(j);
  return status;
}
};  // namespace momento
