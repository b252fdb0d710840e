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

#include "storage/media_store.hpp"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include <atomic>
#include <format>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "type/supported_file_type.hpp"
#include "utils/clock/time_provider.hpp"

namespace momento {
namespace {
// fsync a file or directory by path; returns false when the OS refuses
auto SyncToDisk(const file_path_t& path, int flags) -> bool {
  int fd = ::open(path.c_str(), flags);
  if (fd < 0) return false;
  bool synced = ::fsync(fd) == 0;
  ::close(fd);
  return synced;
}

constexpr const char* kOriginalsDir  = "originals";
constexpr const char* kThumbnailsDir = "thumbnails";
constexpr const char* kPreviewsDir   = "previews";

// "2024-05-12T10:15:00" -> {"2024-05", "20240512_101500"}
auto DateParts(const std::optional<std::string>& date_taken)
    -> std::pair<std::string, std::string> {
  if (date_taken.has_value() && date_taken->size() >= 19) {
    const std::string& d = *date_taken;
    return {d.substr(0, 7), d.substr(0, 4) + d.substr(5, 2) + d.substr(8, 2) + "_" +
                                d.substr(11, 2) + d.substr(14, 2) + d.substr(17, 2)};
  }
  auto now = TimeProvider::Now();
  return {TimeProvider::FormatUtc(now, "%Y-%m"), TimeProvider::FormatUtc(now, "%Y%m%d_%H%M%S")};
}

auto DerivedRelPath(const char* root, const std::string& original_relative) -> std::string {
  std::filesystem::path original(original_relative);
  std::string           bucket = original.parent_path().filename().string();
  if (bucket.empty() || bucket == kOriginalsDir) {
    bucket = "unsorted";
  }
  return std::format("{}/{}/{}.jpg", root, bucket, original.stem().string());
}
}  // namespace

MediaStore::MediaStore(file_path_t data_root) : data_root_(std::move(data_root)) {}

void MediaStore::EnsureLayout() const {
  for (const char* dir : {kOriginalsDir, kThumbnailsDir, kPreviewsDir, "imports"}) {
    std::filesystem::create_directories(data_root_ / dir);
  }
}

auto MediaStore::Resolve(const std::string& relative) const -> file_path_t {
  return data_root_ / std::filesystem::path(relative).relative_path();
}

auto MediaStore::Exists(const std::optional<std::string>& relative) const -> bool {
  if (!relative.has_value() || relative->empty()) return false;
  std::error_code ec;
  return std::filesystem::is_regular_file(Resolve(*relative), ec);
}

auto MediaStore::AllocateOriginalPath(const hash_str_t&                 hash,
                                      const std::optional<std::string>& date_taken,
                                      const file_path_t& source) const -> std::string {
  auto [month, stamp] = DateParts(date_taken);
  std::string base    = std::format("{}/{}/{}_{}", kOriginalsDir, month, stamp, hash.substr(0, 12));
  std::string ext     = LowercaseExtension(source);

  std::string candidate = base + ext;
  for (int suffix = 1; std::filesystem::exists(Resolve(candidate)); ++suffix) {
    candidate = std::format("{}_{}{}", base, suffix, ext);
  }
  return candidate;
}

auto MediaStore::ThumbnailRelPath(const std::string& original_relative) -> std::string {
  return DerivedRelPath(kThumbnailsDir, original_relative);
}

auto MediaStore::PreviewRelPath(const std::string& original_relative) -> std::string {
  return DerivedRelPath(kPreviewsDir, original_relative);
}

void MediaStore::WriteDurably(const std::string& relative, std::span<const uint8_t> bytes) const {
  static std::atomic<uint64_t> tmp_counter{0};

  file_path_t target = Resolve(relative);
  std::filesystem::create_directories(target.parent_path());
  file_path_t tmp = target;
  tmp += std::format(".tmp{}", tmp_counter.fetch_add(1));

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("Cannot open " + tmp.string() + " for writing");
    }
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      out.close();
      RemoveQuietly(tmp);
      throw std::runtime_error("Failed to write " + tmp.string());
    }
  }

  if (!SyncToDisk(tmp, O_RDONLY)) {
    RemoveQuietly(tmp);
    throw std::runtime_error("Failed to sync " + tmp.string() + " to disk");
  }

  std::error_code ec;
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    RemoveQuietly(tmp);
    throw std::runtime_error("Failed to publish " + target.string() + ": " + ec.message());
  }
  // The rename itself is only durable once the directory entry is synced
  if (!SyncToDisk(target.parent_path(), O_RDONLY | O_DIRECTORY)) {
    spdlog::warn("Could not sync directory {}", target.parent_path().string());
  }
}

void MediaStore::MoveInto(const file_path_t& from, const file_path_t& to) {
  std::filesystem::create_directories(to.parent_path());
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (!ec) return;
  if (ec != std::errc::cross_device_link) {
    throw std::filesystem::filesystem_error("Cannot move file", from, to, ec);
  }
  std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing);
  std::filesystem::remove(from);
}

void MediaStore::RemoveQuietly(const file_path_t& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    spdlog::debug("Could not remove {}: {}", path.string(), ec.message());
  }
}
};  // namespace momento
