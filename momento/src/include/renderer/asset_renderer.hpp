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

#include <cstdint>
#include <filesystem>
#include <opencv2/core.hpp>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "config/app_config.hpp"
#include "type/type.hpp"

namespace momento {
enum class RenderErrorCode : uint8_t { NOT_FOUND = 0, DECODE_FAILED, UNSUPPORTED, ENCODE_FAILED };

class RenderError : public std::runtime_error {
 public:
  RenderError(RenderErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  auto Code() const -> RenderErrorCode { return code_; }

 private:
  RenderErrorCode code_;
};

/**
 * @brief A preview that is served from an existing file instead of a rendered one.
 */
struct PreviewReference {
  std::filesystem::path source_;
};

using PreviewOutput = std::variant<std::vector<uint8_t>, PreviewReference>;

class AssetRenderer {
 public:
  virtual ~AssetRenderer() = default;

  /**
   * @brief Render a JPEG whose longer edge is at most max_size, preserving aspect ratio.
   *
   * @throws RenderError
   */
  virtual auto RenderThumbnail(const std::filesystem::path& path, MediaKind kind, int max_size,
                               int quality) -> std::vector<uint8_t> = 0;

  /**
   * @brief Render the web preview, or reference the original for kinds that are served as-is.
   *
   * @throws RenderError
   */
  virtual auto RenderPreview(const std::filesystem::path& path, MediaKind kind)
      -> PreviewOutput = 0;
};

class OpenCVAssetRenderer final : public AssetRenderer {
 public:
  explicit OpenCVAssetRenderer(const PreviewConfig& preview_config)
      : preview_config_(preview_config) {}

  auto RenderThumbnail(const std::filesystem::path& path, MediaKind kind, int max_size,
                       int quality) -> std::vector<uint8_t> override;
  auto RenderPreview(const std::filesystem::path& path, MediaKind kind) -> PreviewOutput override;

 private:
  static auto LoadStill(const std::filesystem::path& path) -> cv::Mat;
  static auto LoadRaw(const std::filesystem::path& path) -> cv::Mat;
  static auto LoadVideoFrame(const std::filesystem::path& path) -> cv::Mat;
  static auto Load(const std::filesystem::path& path, MediaKind kind) -> cv::Mat;
  static auto EncodeBounded(const cv::Mat& source, int max_size, int quality)
      -> std::vector<uint8_t>;

  PreviewConfig preview_config_;
};
};  // namespace momento
