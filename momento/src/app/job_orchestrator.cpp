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

#include "app/job_orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <functional>
#include <string>
#include <utility>

#include "utils/clock/time_provider.hpp"

namespace momento {
namespace {
constexpr const char* kImportKind       = "import";
constexpr const char* kRegenerationKind = "regeneration";

template <typename Status>
void MarkInterrupted(Status& status, size_t max_errors) {
  if (status.state_ != JobState::RUNNING) return;
  status.state_ = JobState::FAILED;
  job_status::AppendError(status.errors_, "Interrupted before completion", max_errors);
}
}  // namespace

auto JobStartResultToString(JobStartResult result) -> const char* {
  switch (result) {
    case JobStartResult::ACCEPTED:
      return "accepted";
    case JobStartResult::ALREADY_RUNNING:
      return "already_running";
    case JobStartResult::SOURCE_UNAVAILABLE:
      return "source_unavailable";
  }
  return "accepted";
}

JobOrchestrator::JobOrchestrator(std::shared_ptr<LibraryRepository> repository,
                                 std::shared_ptr<MediaStore>        store,
                                 std::shared_ptr<MetadataExtractor> extractor,
                                 std::shared_ptr<AssetRenderer>     renderer,
                                 std::shared_ptr<ReverseGeocoder>   geocoder,
                                 const AppConfig&                   config)
    : repository_(repository),
      store_(store),
      processor_(repository, store, std::move(extractor), std::move(renderer),
                 std::move(geocoder), config),
      max_errors_(config.import_.max_errors_),
      import_status_(std::make_shared<const ImportJobStatus>()),
      regeneration_status_(std::make_shared<const RegenerationJobStatus>()) {
  LoadPersisted();
}

JobOrchestrator::~JobOrchestrator() {
  if (running_.load()) {
    spdlog::info("Shutting down; cancelling the running job");
    cancel_requested_ = true;
  }
}

void JobOrchestrator::LoadPersisted() {
  try {
    if (auto saved = repository_->LoadJobStatus(kImportKind)) {
      auto status = ImportJobStatus::FromJson(*saved);
      MarkInterrupted(status, max_errors_);
      import_status_.store(std::make_shared<const ImportJobStatus>(std::move(status)));
    }
    if (auto saved = repository_->LoadJobStatus(kRegenerationKind)) {
      auto status = RegenerationJobStatus::FromJson(*saved);
      MarkInterrupted(status, max_errors_);
      regeneration_status_.store(std::make_shared<const RegenerationJobStatus>(std::move(status)));
    }
  } catch (const StorageIntegrityError& e) {
    spdlog::error("Could not load saved job status: {}", e.what());
  } catch (const nlohmann::json::exception& e) {
    spdlog::warn("Ignoring malformed saved job status: {}", e.what());
  }

  auto import_started = import_status_.load()->started_at_.value_or("");
  auto regen_started  = regeneration_status_.load()->started_at_.value_or("");
  last_kind_          = regen_started > import_started ? JobKind::REGENERATION : JobKind::IMPORT;
}

auto JobOrchestrator::ClaimSlot() -> bool {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return false;
  }
  cancel_requested_ = false;
  item_log_.Clear();
  TimeProvider::Refresh();
  return true;
}

void JobOrchestrator::ReleaseSlot() {
  {
    std::lock_guard<std::mutex> lock(idle_mtx_);
    running_ = false;
  }
  idle_cv_.notify_all();
}

void JobOrchestrator::Publish(const ImportJobStatus& status) {
  import_status_.store(std::make_shared<const ImportJobStatus>(status));
}

void JobOrchestrator::Publish(const RegenerationJobStatus& status) {
  regeneration_status_.store(std::make_shared<const RegenerationJobStatus>(status));
}

void JobOrchestrator::Finish(ImportJobStatus& status) {
  status.completed_at_ = TimeProvider::NowIso8601();
  try {
    Publish(status);
    repository_->SaveJobStatus(kImportKind, status.ToJson());
  } catch (const std::exception& e) {
    spdlog::error("Could not persist import status: {}", e.what());
  }
  spdlog::info("Import {}: {} imported, {} duplicates, {} failed of {}",
               JobStateToString(status.state_), status.successful_imports_,
               status.skipped_duplicates_, status.failed_imports_, status.total_files_);
  ReleaseSlot();
}

void JobOrchestrator::Finish(RegenerationJobStatus& status) {
  status.completed_at_ = TimeProvider::NowIso8601();
  try {
    Publish(status);
    repository_->SaveJobStatus(kRegenerationKind, status.ToJson());
  } catch (const std::exception& e) {
    spdlog::error("Could not persist regeneration status: {}", e.what());
  }
  spdlog::info("Regeneration {}: {} processed, {} skipped, {} failed of {}",
               JobStateToString(status.state_), status.processed_media_, status.skipped_media_,
               status.failed_media_, status.total_media_);
  ReleaseSlot();
}

template <typename Status>
void JobOrchestrator::Launch(Status& status, std::function<void()> job) {
  try {
    Publish(status);
    worker_.Submit(std::move(job));
  } catch (const std::exception& e) {
    spdlog::error("Could not start job: {}", e.what());
    status.state_ = JobState::FAILED;
    job_status::AppendError(status.errors_, std::string("Could not start job: ") + e.what(),
                            max_errors_);
    Finish(status);
  }
}

auto JobOrchestrator::StartImport(std::shared_ptr<ImportSource> source) -> JobStartResult {
  if (!ClaimSlot()) {
    return JobStartResult::ALREADY_RUNNING;
  }
  last_kind_ = JobKind::IMPORT;

  ImportJobStatus status;
  status.state_      = JobState::RUNNING;
  status.started_at_ = TimeProvider::NowIso8601();

  try {
    source->Probe();
  } catch (const std::exception& e) {
    spdlog::error("Import source {} unavailable: {}", source->Name(), e.what());
    status.state_ = JobState::FAILED;
    job_status::AppendError(status.errors_, std::string("Import source unavailable: ") + e.what(),
                            max_errors_);
    Finish(status);
    return JobStartResult::SOURCE_UNAVAILABLE;
  }

  spdlog::info("Import from {} started", source->Name());
  Launch(status, [this, source, status]() { RunImport(source, status); });
  return JobStartResult::ACCEPTED;
}

auto JobOrchestrator::StartRegeneration(bool missing_only) -> JobStartResult {
  if (!ClaimSlot()) {
    return JobStartResult::ALREADY_RUNNING;
  }
  last_kind_ = JobKind::REGENERATION;

  RegenerationJobStatus status;
  status.state_      = JobState::RUNNING;
  status.started_at_ = TimeProvider::NowIso8601();
  spdlog::info("Regeneration started{}", missing_only ? " (missing only)" : "");
  Launch(status,
         [this, missing_only, status]() { RunRegeneration(missing_only, false, status); });
  return JobStartResult::ACCEPTED;
}

auto JobOrchestrator::ResetLibrary() -> JobStartResult {
  if (!ClaimSlot()) {
    return JobStartResult::ALREADY_RUNNING;
  }
  last_kind_ = JobKind::REGENERATION;

  RegenerationJobStatus status;
  status.state_      = JobState::RUNNING;
  status.started_at_ = TimeProvider::NowIso8601();
  spdlog::info("Library reset started");
  Launch(status, [this, status]() { RunRegeneration(false, true, status); });
  return JobStartResult::ACCEPTED;
}

auto JobOrchestrator::Cancel() -> CancelResult {
  if (!running_.load()) {
    return CancelResult::NOT_RUNNING;
  }
  cancel_requested_ = true;
  spdlog::info("Cancellation requested");
  return CancelResult::ACCEPTED;
}

auto JobOrchestrator::GetStatus() const -> JobStatus {
  if (last_kind_.load() == JobKind::REGENERATION) {
    return *regeneration_status_.load();
  }
  return *import_status_.load();
}

auto JobOrchestrator::GetImportStatus() const -> ImportJobStatus { return *import_status_.load(); }

auto JobOrchestrator::GetRegenerationStatus() const -> RegenerationJobStatus {
  return *regeneration_status_.load();
}

auto JobOrchestrator::WaitForIdle(std::chrono::milliseconds timeout) -> bool {
  std::unique_lock<std::mutex> lock(idle_mtx_);
  return idle_cv_.wait_for(lock, timeout, [this] { return !running_.load(); });
}

void JobOrchestrator::RunImport(const std::shared_ptr<ImportSource>& source,
                                ImportJobStatus                      status) {
  try {
    std::vector<ImportItem> items;
    try {
      items = source->Enumerate();
    } catch (const std::exception& e) {
      spdlog::error("Import source {} failed: {}", source->Name(), e.what());
      status.state_ = JobState::FAILED;
      job_status::AppendError(status.errors_, std::string("Import source failed: ") + e.what(),
                              max_errors_);
      Finish(status);
      return;
    }

    status.total_files_ = static_cast<uint32_t>(items.size());
    Publish(status);

    for (const auto& item : items) {
      if (cancel_requested_.load()) {
        status.state_ = JobState::CANCELLED;
        break;
      }
      ProcessImportItem(*source, item, status);
      Publish(status);
    }

    if (status.state_ == JobState::RUNNING) {
      bool all_failed = status.processed_files_ > 0 &&
                        status.failed_imports_ == status.processed_files_;
      status.state_   = all_failed ? JobState::FAILED : JobState::COMPLETED;
    }
  } catch (const std::exception& e) {
    spdlog::error("Import aborted: {}", e.what());
    status.state_ = JobState::FAILED;
    job_status::AppendError(status.errors_, std::string("Import aborted: ") + e.what(),
                            max_errors_);
  }
  Finish(status);
}

void JobOrchestrator::ProcessImportItem(ImportSource& source, const ImportItem& item,
                                        ImportJobStatus& status) {
  auto fail = [&](const std::string& message) {
    spdlog::warn("{}", message);
    ++status.failed_imports_;
    job_status::AppendError(status.errors_, message, max_errors_);
  };

  file_path_t local;
  try {
    local = source.Fetch(item);
  } catch (const FetchError& e) {
    fail("Failed to download " + item.display_name_ + ": " + e.what());
    item_log_.Record(item.display_name_, ItemResult::FAILED, 0, e.what());
    ++status.processed_files_;
    return;
  } catch (const std::exception& e) {
    fail("Failed to process " + item.display_name_ + ": " + e.what());
    item_log_.Record(item.display_name_, ItemResult::FAILED, 0, e.what());
    ++status.processed_files_;
    return;
  }

  ItemResult result = ItemResult::FAILED;
  try {
    auto outcome = processor_.ImportFile(local, item.display_name_);
    result       = outcome.result_;
    if (result == ItemResult::DUPLICATE) {
      ++status.skipped_duplicates_;
    } else {
      ++status.successful_imports_;
    }
    item_log_.Record(item.display_name_, result, outcome.media_id_);
  } catch (const std::exception& e) {
    fail("Failed to process " + item.display_name_ + ": " + e.what());
    item_log_.Record(item.display_name_, ItemResult::FAILED, 0, e.what());
  }
  ++status.processed_files_;

  try {
    source.Release(item, local, result);
  } catch (const std::exception& e) {
    spdlog::warn("Cleanup of {} failed: {}", item.display_name_, e.what());
  }
}

void JobOrchestrator::RunRegeneration(bool missing_only, bool reset,
                                      RegenerationJobStatus status) {
  try {
    if (reset) {
      repository_->ClearAllDerivedData();
    }
    status.total_media_ = static_cast<uint32_t>(repository_->Count());
    Publish(status);

    auto cursor = repository_->ListAll(kRegenerationPageSize);
    while (auto asset = cursor->Next()) {
      if (cancel_requested_.load()) {
        status.state_ = JobState::CANCELLED;
        break;
      }
      ProcessRegenerationItem(*asset, missing_only, status);
      Publish(status);
    }

    if (status.state_ == JobState::RUNNING) {
      // Rows skipped without work are not attempts
      uint32_t attempted = status.processed_media_ - status.skipped_media_;
      status.state_ = attempted > 0 && status.failed_media_ == attempted ? JobState::FAILED
                                                                          : JobState::COMPLETED;
    }
  } catch (const std::exception& e) {
    spdlog::error("Regeneration aborted: {}", e.what());
    status.state_ = JobState::FAILED;
    job_status::AppendError(status.errors_, std::string("Regeneration aborted: ") + e.what(),
                            max_errors_);
  }
  Finish(status);
}

void JobOrchestrator::ProcessRegenerationItem(const MediaAsset& asset, bool missing_only,
                                              RegenerationJobStatus& status) {
  try {
    auto outcome = processor_.RegenerateAsset(asset, missing_only);
    switch (outcome.result_) {
      case ItemResult::SKIPPED:
      case ItemResult::DUPLICATE:
        ++status.skipped_media_;
        break;
      default:
        if (outcome.metadata_changed_) ++status.updated_metadata_;
        if (outcome.thumbnail_generated_) ++status.generated_thumbnails_;
        status.updated_tags_ += outcome.new_tags_;
        break;
    }
    item_log_.Record(asset.filename_, outcome.result_, asset.id_);
  } catch (const MissingFileError& e) {
    spdlog::warn("{}", e.what());
    ++status.failed_media_;
    job_status::AppendError(status.errors_, e.what(), max_errors_);
    item_log_.Record(asset.filename_, ItemResult::FAILED, asset.id_, e.what());
  } catch (const std::exception& e) {
    std::string message = "Failed to process " + asset.filename_ + ": " + e.what();
    spdlog::warn("{}", message);
    ++status.failed_media_;
    job_status::AppendError(status.errors_, message, max_errors_);
    item_log_.Record(asset.filename_, ItemResult::FAILED, asset.id_, e.what());
  }
  ++status.processed_media_;
}
};  // namespace momento
