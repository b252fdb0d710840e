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
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <variant>
#include <vector>

#include "app/import_source.hpp"
#include "app/job_status.hpp"
#include "app/media_processor.hpp"
#include "concurrency/thread_pool.hpp"
#include "config/app_config.hpp"
#include "storage/library_repository.hpp"
#include "utils/import/import_log.hpp"

namespace momento {
enum class JobKind : uint8_t { IMPORT = 0, REGENERATION = 1 };

enum class JobStartResult : uint8_t { ACCEPTED = 0, ALREADY_RUNNING, SOURCE_UNAVAILABLE };

enum class CancelResult : uint8_t { ACCEPTED = 0, NOT_RUNNING };

using JobStatus = std::variant<ImportJobStatus, RegenerationJobStatus>;

auto JobStartResultToString(JobStartResult result) -> const char*;

/**
 * @brief Owns the single background job slot. At most one import or regeneration runs at a
 * time, on a dedicated worker; everything else reads immutable status snapshots.
 */
class JobOrchestrator {
 public:
  static constexpr size_t kRegenerationPageSize = 200;

  JobOrchestrator(std::shared_ptr<LibraryRepository> repository, std::shared_ptr<MediaStore> store,
                  std::shared_ptr<MetadataExtractor> extractor,
                  std::shared_ptr<AssetRenderer> renderer, std::shared_ptr<ReverseGeocoder> geocoder,
                  const AppConfig& config);
  // Requests cancellation and waits for the running job to settle
  ~JobOrchestrator();

  JobOrchestrator(const JobOrchestrator&)            = delete;
  JobOrchestrator& operator=(const JobOrchestrator&) = delete;

  /**
   * @brief Claim the slot and import everything the source lists. The source is probed before
   * the job is accepted.
   */
  auto StartImport(std::shared_ptr<ImportSource> source) -> JobStartResult;

  auto StartRegeneration(bool missing_only) -> JobStartResult;

  /**
   * @brief Clear every derived path and enrichment field, then run a full regeneration.
   */
  auto ResetLibrary() -> JobStartResult;

  /**
   * @brief Ask the running job to stop after its current item.
   */
  auto Cancel() -> CancelResult;

  auto GetStatus() const -> JobStatus;
  auto GetImportStatus() const -> ImportJobStatus;
  auto GetRegenerationStatus() const -> RegenerationJobStatus;
  auto IsRunning() const -> bool { return running_.load(); }

  /**
   * @brief Block until no job holds the slot.
   *
   * @return false on timeout
   */
  auto WaitForIdle(std::chrono::milliseconds timeout) -> bool;

  auto GetItemLog() const -> std::vector<ImportLogEntry> { return item_log_.Snapshot(); }

 private:
  auto ClaimSlot() -> bool;
  void ReleaseSlot();

  void RunImport(const std::shared_ptr<ImportSource>& source, ImportJobStatus status);
  void ProcessImportItem(ImportSource& source, const ImportItem& item, ImportJobStatus& status);
  void RunRegeneration(bool missing_only, bool reset, RegenerationJobStatus status);
  void ProcessRegenerationItem(const MediaAsset& asset, bool missing_only,
                               RegenerationJobStatus& status);

  void Publish(const ImportJobStatus& status);
  void Publish(const RegenerationJobStatus& status);
  void Finish(ImportJobStatus& status);
  void Finish(RegenerationJobStatus& status);
  template <typename Status>
  void Launch(Status& status, std::function<void()> job);
  void LoadPersisted();

  std::shared_ptr<LibraryRepository>                        repository_;
  std::shared_ptr<MediaStore>                               store_;
  MediaProcessor                                            processor_;
  size_t                                                    max_errors_;

  std::atomic<bool>                                         running_{false};
  std::atomic<bool>                                         cancel_requested_{false};
  std::atomic<JobKind>                                      last_kind_{JobKind::IMPORT};
  std::atomic<std::shared_ptr<const ImportJobStatus>>       import_status_;
  std::atomic<std::shared_ptr<const RegenerationJobStatus>> regeneration_status_;

  ImportLog                                                 item_log_;

  std::mutex                                                idle_mtx_;
  std::condition_variable                                   idle_cv_;

  // Last member: joined first on destruction, while everything above is still alive
  ThreadPool                                                worker_{1};
};
};  // namespace momento
