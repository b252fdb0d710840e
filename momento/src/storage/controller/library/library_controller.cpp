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

#include "storage/controller/library/library_controller.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <format>
#include <utility>

#include "media/media_metadata.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/job/job_status_mapper.hpp"
#include "storage/mapper/tag/tag_mapper.hpp"
#include "storage/service/media/media_service.hpp"
#include "utils/clock/time_provider.hpp"

namespace momento {
namespace {
void RequireRow(idx_t changed, media_id_t id) {
  if (changed == 0) {
    throw StorageIntegrityError(std::format("No media row with id {}", id));
  }
}
}  // namespace

class LibraryCursor final : public MediaCursor {
 public:
  LibraryCursor(LibraryController& owner, size_t page_size)
      : owner_(owner), page_size_(std::max<size_t>(page_size, 1)) {}

  auto Next() -> std::optional<MediaAsset> override {
    if (buffer_.empty() && !exhausted_) {
      auto page  = owner_.FetchPage(last_id_, page_size_);
      exhausted_ = page.size() < page_size_;
      for (auto& asset : page) {
        buffer_.push_back(std::move(asset));
      }
    }
    if (buffer_.empty()) {
      return std::nullopt;
    }
    MediaAsset next = std::move(buffer_.front());
    buffer_.pop_front();
    last_id_ = next.id_;
    return next;
  }

 private:
  LibraryController&     owner_;
  size_t                 page_size_;
  media_id_t             last_id_   = 0;
  bool                   exhausted_ = false;
  std::deque<MediaAsset> buffer_;
};

LibraryController::LibraryController(const file_path_t& db_path)
    : _db_ctr(db_path), _guard(_db_ctr.GetConnectionGuard()) {}

auto LibraryController::MergeTags(media_id_t id, const std::vector<std::string>& keywords)
    -> uint32_t {
  TagMapper      tags(_guard._conn);
  MediaTagMapper links(_guard._conn);
  uint32_t       created = 0;
  for (const auto& name : keywords) {
    tag_id_t tag_id;
    auto     existing = tags.Get("name = ?", {duckorm::VarTypes{name}});
    if (existing.empty()) {
      tag_id = tags.Insert(TagMapperParams{0, name});
    } else {
      tag_id = existing.front().id;
    }

    auto linked = links.Get("media_id = ? AND tag_id = ?",
                            {duckorm::VarTypes{id}, duckorm::VarTypes{tag_id}});
    if (linked.empty()) {
      links.InsertWithKey(MediaTagMapperParams{id, tag_id});
      ++created;
    }
  }
  return created;
}

void LibraryController::RethrowWriteError(const duckorm::DuckDBError&    e,
                                          const std::optional<hash_str_t>& hash,
                                          media_id_t                       self) {
  // Runs after rollback: the hash is only a duplicate if another row owns it
  if (e.IsConstraintViolation() && hash.has_value()) {
    std::optional<MediaAsset> owner;
    try {
      MediaService service(_guard._conn);
      owner = service.GetByHash(*hash);
    } catch (const duckorm::DuckDBError& lookup) {
      spdlog::error("Hash lookup after failed write: {}", lookup.what());
    }
    if (owner.has_value() && owner->id_ != self) {
      throw DuplicateHashError(*hash);
    }
  }
  throw StorageIntegrityError(e.what());
}

auto LibraryController::FetchPage(media_id_t after_id, size_t limit) -> std::vector<MediaAsset> {
  std::lock_guard<std::mutex> lock(_db_lock);
  MediaService                service(_guard._conn);
  return service.GetPage(after_id, limit);
}

auto LibraryController::FindByHash(const hash_str_t& hash) -> std::optional<MediaAsset> {
  std::lock_guard<std::mutex> lock(_db_lock);
  MediaService                service(_guard._conn);
  return service.GetByHash(hash);
}

auto LibraryController::FindById(media_id_t id) -> std::optional<MediaAsset> {
  std::lock_guard<std::mutex> lock(_db_lock);
  MediaService                service(_guard._conn);
  return service.GetById(id);
}

auto LibraryController::Insert(const MediaAsset& asset) -> media_id_t {
  std::lock_guard<std::mutex> lock(_db_lock);
  try {
    TransactionGuard tx(_guard._conn);
    MediaService     service(_guard._conn);
    media_id_t       id = service.Insert(asset);
    MergeTags(id, asset.metadata_.KeywordList());
    tx.Commit();
    return id;
  } catch (const duckorm::DuckDBError& e) {
    RethrowWriteError(e, asset.content_hash_, 0);
  }
}

auto LibraryController::Update(media_id_t id, const MediaPatch& patch) -> uint32_t {
  std::lock_guard<std::mutex> lock(_db_lock);
  try {
    TransactionGuard tx(_guard._conn);
    MediaService     service(_guard._conn);
    uint32_t         new_links = 0;
    if (!patch.Empty()) {
      RequireRow(service.ApplyPatch(id, patch), id);
    }
    if (patch.metadata_.has_value()) {
      new_links = MergeTags(id, patch.metadata_->KeywordList());
    }
    tx.Commit();
    return new_links;
  } catch (const duckorm::DuckDBError& e) {
    RethrowWriteError(e, patch.content_hash_, id);
  }
}

auto LibraryController::ListAll(size_t page_size) -> std::unique_ptr<MediaCursor> {
  return std::make_unique<LibraryCursor>(*this, page_size);
}

auto LibraryController::Count() -> int64_t {
  std::lock_guard<std::mutex> lock(_db_lock);
  try {
    MediaService service(_guard._conn);
    return service.Count();
  } catch (const duckorm::DuckDBError& e) {
    throw StorageIntegrityError(e.what());
  }
}

void LibraryController::ClearDerivedData(media_id_t id) {
  std::lock_guard<std::mutex> lock(_db_lock);
  try {
    TransactionGuard tx(_guard._conn);
    MediaService     service(_guard._conn);
    RequireRow(service.ClearDerived(id), id);
    tx.Commit();
  } catch (const duckorm::DuckDBError& e) {
    throw StorageIntegrityError(e.what());
  }
}

void LibraryController::ClearAllDerivedData() {
  std::lock_guard<std::mutex> lock(_db_lock);
  try {
    TransactionGuard tx(_guard._conn);
    MediaService     service(_guard._conn);
    auto             cleared = service.ClearDerived(std::nullopt);
    tx.Commit();
    spdlog::info("Cleared derived data on {} media rows", cleared);
  } catch (const duckorm::DuckDBError& e) {
    throw StorageIntegrityError(e.what());
  }
}

void LibraryController::MoveToTrash(media_id_t id) {
  std::lock_guard<std::mutex> lock(_db_lock);
  try {
    TransactionGuard tx(_guard._conn);
    MediaService     service(_guard._conn);
    RequireRow(service.SetDeletedAt(id, TimeProvider::NowIso8601()), id);
    tx.Commit();
  } catch (const duckorm::DuckDBError& e) {
    throw StorageIntegrityError(e.what());
  }
}

void LibraryController::Restore(media_id_t id) {
  std::lock_guard<std::mutex> lock(_db_lock);
  try {
    TransactionGuard tx(_guard._conn);
    MediaService     service(_guard._conn);
    RequireRow(service.SetDeletedAt(id, std::nullopt), id);
    tx.Commit();
  } catch (const duckorm::DuckDBError& e) {
    throw StorageIntegrityError(e.what());
  }
}

void LibraryController::Purge(media_id_t id) {
  std::lock_guard<std::mutex> lock(_db_lock);
  try {
    TransactionGuard tx(_guard._conn);
    MediaTagMapper   links(_guard._conn);
    MediaService     service(_guard._conn);
    links.Remove(id);
    RequireRow(service.RemoveById(id), id);
    tx.Commit();
  } catch (const duckorm::DuckDBError& e) {
    throw StorageIntegrityError(e.what());
  }
}

void LibraryController::SaveJobStatus(const std::string& kind, const nlohmann::json& status) {
  std::lock_guard<std::mutex> lock(_db_lock);
  try {
    TransactionGuard      tx(_guard._conn);
    JobStatusMapper       mapper(_guard._conn);
    JobStatusMapperParams params{kind, status.dump(), TimeProvider::NowIso8601()};
    // Update in place; the key column is never rewritten
    if (mapper.Update(kind, params, JobStatusMapper::InsertDesc()) == 0) {
      mapper.InsertWithKey(params);
    }
    tx.Commit();
  } catch (const duckorm::DuckDBError& e) {
    throw StorageIntegrityError(e.what());
  }
}

auto LibraryController::LoadJobStatus(const std::string& kind) -> std::optional<nlohmann::json> {
  std::lock_guard<std::mutex> lock(_db_lock);
  std::vector<JobStatusMapperParams> rows;
  try {
    JobStatusMapper mapper(_guard._conn);
    rows = mapper.Get("kind = ?", {duckorm::VarTypes{kind}});
  } catch (const duckorm::DuckDBError& e) {
    throw StorageIntegrityError(e.what());
  }
  if (rows.empty()) return std::nullopt;

  auto parsed = nlohmann::json::parse(rows.front().payload, nullptr, false);
  if (parsed.is_discarded()) {
    spdlog::warn("Ignoring unreadable {} job status", kind);
    return std::nullopt;
  }
  return parsed;
}

auto LibraryController::GetTags(media_id_t id) -> std::vector<std::string> {
  std::lock_guard<std::mutex> lock(_db_lock);
  TagMapper                   tags(_guard._conn);
  auto found = tags.GetByQuery(
      "SELECT t.id, t.name FROM tags t JOIN media_tags mt ON mt.tag_id = t.id "
      "WHERE mt.media_id = ? ORDER BY t.name",
      {duckorm::VarTypes{id}});
  std::vector<std::string> names;
  names.reserve(found.size());
  for (auto& tag : found) {
    names.push_back(std::move(tag.name));
  }
  return names;
}
};  // namespace momento
