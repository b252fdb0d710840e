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

#include "renderer/asset_renderer.hpp"

#include <libraw/libraw.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <memory>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

#include "type/supported_file_type.hpp"

namespace momento {
namespace {
struct LibRawImageDeleter {
  void operator()(libraw_processed_image_t* image) const { LibRaw::dcraw_clear_mem(image); }
};
using LibRawImagePtr = std::unique_ptr<libraw_processed_image_t, LibRawImageDeleter>;

auto ProcessedToMat(const libraw_processed_image_t& image) -> cv::Mat {
  if (image.type == LIBRAW_IMAGE_JPEG) {
    std::vector<uint8_t> bytes(image.data, image.data + image.data_size);
    return cv::imdecode(bytes, cv::IMREAD_COLOR);
  }
  if (image.type == LIBRAW_IMAGE_BITMAP && image.colors == 3 && image.bits == 8) {
    cv::Mat rgb(image.height, image.width, CV_8UC3, const_cast<unsigned char*>(image.data));
    cv::Mat bgr;
    cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);
    return bgr;
  }
  return {};
}
}  // namespace

auto OpenCVAssetRenderer::LoadStill(const std::filesystem::path& path) -> cv::Mat {
  // IMREAD_COLOR applies the EXIF orientation
  cv::Mat image = cv::imread(path.string(), cv::IMREAD_COLOR);
  if (image.empty()) {
    throw RenderError(RenderErrorCode::DECODE_FAILED,
                      std::format("Cannot decode image {}", path.filename().string()));
  }
  return image;
}

auto OpenCVAssetRenderer::LoadRaw(const std::filesystem::path& path) -> cv::Mat {
  auto raw_processor = std::make_unique<LibRaw>();
  int  ret           = raw_processor->open_file(path.string().c_str());
  if (ret != LIBRAW_SUCCESS) {
    throw RenderError(RenderErrorCode::DECODE_FAILED,
                      std::format("LibRaw cannot open {}: {}", path.filename().string(),
                                  libraw_strerror(ret)));
  }

  // The embedded camera JPEG is far cheaper than a full demosaic
  if (raw_processor->unpack_thumb() == LIBRAW_SUCCESS) {
    int            err = LIBRAW_SUCCESS;
    LibRawImagePtr thumb(raw_processor->dcraw_make_mem_thumb(&err));
    if (thumb && err == LIBRAW_SUCCESS) {
      cv::Mat decoded = ProcessedToMat(*thumb);
      if (!decoded.empty()) {
        return decoded;
      }
    }
  }

  ret = raw_processor->unpack();
  if (ret == LIBRAW_SUCCESS) {
    raw_processor->imgdata.params.output_bps = 8;
    raw_processor->imgdata.params.use_camera_wb = 1;
    ret = raw_processor->dcraw_process();
  }
  if (ret != LIBRAW_SUCCESS) {
    throw RenderError(RenderErrorCode::DECODE_FAILED,
                      std::format("LibRaw cannot process {}: {}", path.filename().string(),
                                  libraw_strerror(ret)));
  }
  int            err = LIBRAW_SUCCESS;
  LibRawImagePtr processed(raw_processor->dcraw_make_mem_image(&err));
  if (!processed || err != LIBRAW_SUCCESS) {
    throw RenderError(RenderErrorCode::DECODE_FAILED,
                      std::format("LibRaw produced no image for {}", path.filename().string()));
  }
  cv::Mat image = ProcessedToMat(*processed);
  if (image.empty()) {
    throw RenderError(RenderErrorCode::UNSUPPORTED,
                      std::format("Unsupported RAW output layout for {}",
                                  path.filename().string()));
  }
  return image;
}

auto OpenCVAssetRenderer::LoadVideoFrame(const std::filesystem::path& path) -> cv::Mat {
  cv::VideoCapture capture(path.string());
  if (!capture.isOpened()) {
    throw RenderError(RenderErrorCode::DECODE_FAILED,
                      std::format("Cannot open video {}", path.filename().string()));
  }
  const double fps         = capture.get(cv::CAP_PROP_FPS);
  const double frame_count = capture.get(cv::CAP_PROP_FRAME_COUNT);
  const double duration    = (fps > 0.0 && frame_count > 0.0) ? frame_count / fps : 0.0;

  // Skip black lead-in frames: 10% in, capped at five seconds
  const double seek_ms     = std::min(duration * 0.1, 5.0) * 1000.0;
  cv::Mat      frame;
  if (seek_ms > 0.0 && capture.set(cv::CAP_PROP_POS_MSEC, seek_ms)) {
    capture.read(frame);
  }
  if (frame.empty()) {
    capture.set(cv::CAP_PROP_POS_FRAMES, 0);
    capture.read(frame);
  }
  if (frame.empty()) {
    throw RenderError(RenderErrorCode::DECODE_FAILED,
                      std::format("Cannot decode a frame from {}", path.filename().string()));
  }
  return frame;
}

auto OpenCVAssetRenderer::Load(const std::filesystem::path& path, MediaKind kind) -> cv::Mat {
  if (!std::filesystem::is_regular_file(path)) {
    throw RenderError(RenderErrorCode::NOT_FOUND,
                      std::format("Source file not found: {}", path.string()));
  }
  if (kind == MediaKind::VIDEO) {
    return LoadVideoFrame(path);
  }
  if (IsRawFile(path)) {
    return LoadRaw(path);
  }
  return LoadStill(path);
}

auto OpenCVAssetRenderer::EncodeBounded(const cv::Mat& source, int max_size, int quality)
    -> std::vector<uint8_t> {
  cv::Mat   resized;
  const int longest = std::max(source.cols, source.rows);
  if (longest > max_size) {
    const double scale = static_cast<double>(max_size) / static_cast<double>(longest);
    const int    w     = std::max(1, static_cast<int>(source.cols * scale + 0.5));
    const int    h     = std::max(1, static_cast<int>(source.rows * scale + 0.5));
    cv::resize(source, resized, cv::Size(w, h), 0, 0, cv::INTER_AREA);
  } else {
    resized = source;
  }

  std::vector<uint8_t> bytes;
  std::vector<int>     params = {cv::IMWRITE_JPEG_QUALITY, quality};
  if (!cv::imencode(".jpg", resized, bytes, params) || bytes.empty()) {
    throw RenderError(RenderErrorCode::ENCODE_FAILED, "JPEG encoding failed");
  }
  return bytes;
}

auto OpenCVAssetRenderer::RenderThumbnail(const std::filesystem::path& path, MediaKind kind,
                                          int max_size, int quality) -> std::vector<uint8_t> {
  try {
    return EncodeBounded(Load(path, kind), max_size, quality);
  } catch (const cv::Exception& e) {
    throw RenderError(RenderErrorCode::DECODE_FAILED,
                      std::format("OpenCV failed on {}: {}", path.filename().string(), e.what()));
  }
}

auto OpenCVAssetRenderer::RenderPreview(const std::filesystem::path& path, MediaKind kind)
    -> PreviewOutput {
  if (kind == MediaKind::VIDEO && preview_config_.video_reference_original_) {
    if (!std::filesystem::is_regular_file(path)) {
      throw RenderError(RenderErrorCode::NOT_FOUND,
                        std::format("Source file not found: {}", path.string()));
    }
    return PreviewReference{path};
  }
  try {
    return EncodeBounded(Load(path, kind), preview_config_.max_size_, preview_config_.quality_);
  } catch (const cv::Exception& e) {
    throw RenderError(RenderErrorCode::DECODE_FAILED,
                      std::format("OpenCV failed on {}: {}", path.filename().string(), e.what()));
  }
}
};  // namespace momento
