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

#include "media/metadata_extractor.hpp"

#include <libraw/libraw.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <exiv2/exiv2.hpp>
#include <memory>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "type/supported_file_type.hpp"
#include "utils/clock/time_provider.hpp"

namespace momento {
namespace {
auto RationalToDouble(const Exiv2::Rational& value) -> std::optional<double> {
  if (value.second == 0) {
    return std::nullopt;
  }
  return static_cast<double>(value.first) / static_cast<double>(value.second);
}

auto TrimAscii(const std::string& value) -> std::string {
  std::string out = value;
  while (!out.empty() &&
         (out.back() == '\0' || std::isspace(static_cast<unsigned char>(out.back())))) {
    out.pop_back();
  }
  size_t begin = 0;
  while (begin < out.size() &&
         (out[begin] == '\0' || std::isspace(static_cast<unsigned char>(out[begin])))) {
    ++begin;
  }
  return out.substr(begin);
}

auto NonEmpty(const std::string& value) -> std::optional<std::string> {
  std::string trimmed = TrimAscii(value);
  if (trimmed.empty()) return std::nullopt;
  return trimmed;
}

auto PositiveOrNone(double value) -> std::optional<double> {
  if (!std::isfinite(value) || value <= 0.0) return std::nullopt;
  return value;
}

auto FindExif(const Exiv2::ExifData& exif, const char* key) -> Exiv2::ExifData::const_iterator {
  return exif.findKey(Exiv2::ExifKey(key));
}

auto ExifString(const Exiv2::ExifData& exif, const char* key) -> std::optional<std::string> {
  auto it = FindExif(exif, key);
  if (it == exif.end()) return std::nullopt;
  return NonEmpty(it->toString());
}

auto ExifRational(const Exiv2::ExifData& exif, const char* key) -> std::optional<double> {
  auto it = FindExif(exif, key);
  if (it == exif.end() || it->count() == 0) return std::nullopt;
  return RationalToDouble(it->toRational(0));
}

auto ExifInt(const Exiv2::ExifData& exif, const char* key) -> std::optional<int64_t> {
  auto it = FindExif(exif, key);
  if (it == exif.end() || it->count() == 0) return std::nullopt;
  return it->toInt64(0);
}

// GPS coordinates are stored as three rationals (degrees, minutes, seconds) plus a hemisphere ref
auto GpsCoordinate(const Exiv2::ExifData& exif, const char* key, const char* ref_key,
                   char negative_ref) -> std::optional<double> {
  auto it = FindExif(exif, key);
  if (it == exif.end() || it->count() < 3) return std::nullopt;
  auto degrees = RationalToDouble(it->toRational(0));
  auto minutes = RationalToDouble(it->toRational(1));
  auto seconds = RationalToDouble(it->toRational(2));
  if (!degrees) return std::nullopt;
  double value = *degrees + minutes.value_or(0.0) / 60.0 + seconds.value_or(0.0) / 3600.0;

  auto ref     = ExifString(exif, ref_key);
  if (ref && !ref->empty() && std::toupper(static_cast<unsigned char>((*ref)[0])) == negative_ref) {
    value = -value;
  }
  return value;
}

void ReadExif(const Exiv2::ExifData& exif, MetadataRecord& record) {
  if (exif.empty()) {
    return;
  }
  auto date = ExifString(exif, "Exif.Photo.DateTimeOriginal");
  if (!date) date = ExifString(exif, "Exif.Photo.DateTimeDigitized");
  if (!date) date = ExifString(exif, "Exif.Image.DateTime");
  if (date) record.date_taken_ = metadata::NormalizeDateTime(*date);

  record.gps_latitude_  = GpsCoordinate(exif, "Exif.GPSInfo.GPSLatitude",
                                        "Exif.GPSInfo.GPSLatitudeRef", 'S');
  record.gps_longitude_ = GpsCoordinate(exif, "Exif.GPSInfo.GPSLongitude",
                                        "Exif.GPSInfo.GPSLongitudeRef", 'W');
  if (auto altitude = ExifRational(exif, "Exif.GPSInfo.GPSAltitude")) {
    auto below_sea = ExifInt(exif, "Exif.GPSInfo.GPSAltitudeRef");
    record.gps_altitude_ = (below_sea && *below_sea == 1) ? -*altitude : *altitude;
  }

  record.camera_make_  = ExifString(exif, "Exif.Image.Make");
  record.camera_model_ = ExifString(exif, "Exif.Image.Model");
  record.lens_make_    = ExifString(exif, "Exif.Photo.LensMake");
  record.lens_model_   = ExifString(exif, "Exif.Photo.LensModel");

  if (auto iso = ExifInt(exif, "Exif.Photo.ISOSpeedRatings"); iso && *iso > 0) {
    record.iso_ = static_cast<int32_t>(*iso);
  }
  if (auto exposure = ExifRational(exif, "Exif.Photo.ExposureTime")) {
    record.exposure_time_ = metadata::FormatExposureTime(*exposure);
  }
  if (auto f_number = ExifRational(exif, "Exif.Photo.FNumber")) {
    record.f_number_ = PositiveOrNone(*f_number);
  }
  if (auto focal = ExifRational(exif, "Exif.Photo.FocalLength")) {
    record.focal_length_ = PositiveOrNone(*focal);
  }
  if (auto focal_35 = ExifInt(exif, "Exif.Photo.FocalLengthIn35mmFilm"); focal_35 && *focal_35 > 0) {
    record.focal_length_35mm_ = static_cast<double>(*focal_35);
  }

  if (!record.HasDimensions()) {
    auto width  = ExifInt(exif, "Exif.Photo.PixelXDimension");
    auto height = ExifInt(exif, "Exif.Photo.PixelYDimension");
    if (width && height && *width > 0 && *height > 0) {
      record.width_  = static_cast<int32_t>(*width);
      record.height_ = static_cast<int32_t>(*height);
    }
  }
}

auto ReadKeywords(Exiv2::Image& image) -> std::vector<std::string> {
  std::vector<std::string> keywords;
  for (const auto& datum : image.iptcData()) {
    if (datum.key() == "Iptc.Application2.Keywords") {
      keywords.push_back(datum.toString());
    }
  }
  for (const auto& datum : image.xmpData()) {
    if (datum.key() != "Xmp.dc.subject") continue;
    for (size_t i = 0; i < datum.count(); ++i) {
      keywords.push_back(datum.toString(i));
    }
  }
  return keywords;
}

auto CodecFromFourcc(int fourcc) -> std::optional<std::string> {
  std::string code;
  for (int i = 0; i < 4; ++i) {
    char c = static_cast<char>((fourcc >> (8 * i)) & 0xFF);
    if (std::isprint(static_cast<unsigned char>(c)) && c != ' ') {
      code.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }
  if (code.empty()) return std::nullopt;

  static const std::unordered_map<std::string, std::string> known = {
      {"avc1", "h264"}, {"h264", "h264"}, {"x264", "h264"}, {"hvc1", "hevc"},
      {"hev1", "hevc"}, {"hevc", "hevc"}, {"vp08", "vp8"},  {"vp80", "vp8"},
      {"vp09", "vp9"},  {"vp90", "vp9"},  {"av01", "av1"},  {"mp4v", "mpeg4"},
      {"xvid", "mpeg4"}, {"mjpg", "mjpeg"}};
  auto it = known.find(code);
  return it != known.end() ? it->second : code;
}
}  // namespace

ExivMetadataExtractor::ExivMetadataExtractor() {
  Exiv2::LogMsg::setLevel(Exiv2::LogMsg::Level::mute);
}

auto ExivMetadataExtractor::Extract(const std::filesystem::path& path, MediaKind kind)
    -> MetadataRecord {
  MetadataRecord record;
  try {
    if (kind == MediaKind::VIDEO) {
      ExtractVideo(path, record);
    } else if (IsRawFile(path) && ExtractRaw(path, record)) {
      // LibRaw misses IPTC/XMP keywords; let Exiv2 fill the gaps
      MetadataRecord exiv_record;
      ExtractImage(path, exiv_record);
      record = record.MergedWith(exiv_record);
    } else {
      ExtractImage(path, record);
    }
  } catch (const std::exception& e) {
    spdlog::warn("Metadata extraction degraded for {}: {}", path.string(), e.what());
  }
  record.SanitizeGps();
  FillDateFromFile(path, record);
  return record;
}

void ExivMetadataExtractor::ExtractImage(const std::filesystem::path& path,
                                         MetadataRecord&              record) {
  try {
    Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(path.string());
    image->readMetadata();
    if (image->pixelWidth() > 0 && image->pixelHeight() > 0) {
      record.width_  = static_cast<int32_t>(image->pixelWidth());
      record.height_ = static_cast<int32_t>(image->pixelHeight());
    }
    ReadExif(image->exifData(), record);
    record.keywords_ = metadata::JoinKeywords(ReadKeywords(*image));
  } catch (const Exiv2::Error& e) {
    spdlog::debug("Exiv2 could not read {}: {}", path.string(), e.what());
  }

  if (!record.HasDimensions()) {
    // No container header Exiv2 understands; fall back to decoding
    cv::Mat decoded = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    if (!decoded.empty()) {
      record.width_  = decoded.cols;
      record.height_ = decoded.rows;
    }
  }
}

auto ExivMetadataExtractor::ExtractRaw(const std::filesystem::path& path, MetadataRecord& record)
    -> bool {
  auto raw_processor = std::make_unique<LibRaw>();
  int  ret           = raw_processor->open_file(path.string().c_str());
  if (ret != LIBRAW_SUCCESS) {
    spdlog::debug("LibRaw open_file failed for {} (error {})", path.string(), ret);
    return false;
  }

  const auto& imgdata = raw_processor->imgdata;
  if (imgdata.sizes.width > 0 && imgdata.sizes.height > 0) {
    record.width_  = static_cast<int32_t>(imgdata.sizes.width);
    record.height_ = static_cast<int32_t>(imgdata.sizes.height);
  }
  record.camera_make_  = NonEmpty(imgdata.idata.make);
  record.camera_model_ = NonEmpty(imgdata.idata.model);
  record.lens_make_    = NonEmpty(imgdata.lens.LensMake);
  record.lens_model_   = NonEmpty(imgdata.lens.Lens);
  if (!record.lens_model_) {
    record.lens_model_ = NonEmpty(imgdata.lens.makernotes.Lens);
  }

  if (imgdata.other.iso_speed > 0.0f) {
    record.iso_ = static_cast<int32_t>(std::lround(imgdata.other.iso_speed));
  }
  record.exposure_time_ = metadata::FormatExposureTime(imgdata.other.shutter);
  record.f_number_      = PositiveOrNone(imgdata.other.aperture);
  record.focal_length_  = PositiveOrNone(imgdata.other.focal_len);
  if (imgdata.lens.FocalLengthIn35mmFormat > 0) {
    record.focal_length_35mm_ = static_cast<double>(imgdata.lens.FocalLengthIn35mmFormat);
  }

  // LibRaw turns the camera's local wall-clock time into a time_t with mktime
  if (imgdata.other.timestamp > 0) {
    record.date_taken_ = TimeProvider::FormatLocal(
        std::chrono::system_clock::from_time_t(imgdata.other.timestamp), "%Y-%m-%dT%H:%M:%S");
  }

  const auto& gps = imgdata.other.parsed_gps;
  if (gps.gpsparsed) {
    double lat = gps.latitude[0] + gps.latitude[1] / 60.0 + gps.latitude[2] / 3600.0;
    double lon = gps.longitude[0] + gps.longitude[1] / 60.0 + gps.longitude[2] / 3600.0;
    if (gps.latref == 'S') lat = -lat;
    if (gps.longref == 'W') lon = -lon;
    record.gps_latitude_  = lat;
    record.gps_longitude_ = lon;
    if (std::isfinite(gps.altitude) && gps.altitude != 0.0f) {
      record.gps_altitude_ = gps.altref == 1 ? -gps.altitude : gps.altitude;
    }
  }

  raw_processor->recycle();
  return true;
}

void ExivMetadataExtractor::ExtractVideo(const std::filesystem::path& path,
                                         MetadataRecord&              record) {
  cv::VideoCapture capture(path.string());
  if (!capture.isOpened()) {
    spdlog::debug("OpenCV could not open video {}", path.string());
    return;
  }
  const double width       = capture.get(cv::CAP_PROP_FRAME_WIDTH);
  const double height      = capture.get(cv::CAP_PROP_FRAME_HEIGHT);
  const double fps         = capture.get(cv::CAP_PROP_FPS);
  const double frame_count = capture.get(cv::CAP_PROP_FRAME_COUNT);
  if (width > 0 && height > 0) {
    record.width_  = static_cast<int32_t>(width);
    record.height_ = static_cast<int32_t>(height);
  }
  if (fps > 0.0 && frame_count > 0.0) {
    record.duration_seconds_ = frame_count / fps;
  }
  record.video_codec_ = CodecFromFourcc(static_cast<int>(capture.get(cv::CAP_PROP_FOURCC)));
  capture.release();

  ExtractVideoXmp(path, record);
}

void ExivMetadataExtractor::ExtractVideoXmp(const std::filesystem::path& path,
                                            MetadataRecord&              record) {
  try {
    Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(path.string());
    image->readMetadata();
    for (const auto& datum : image->xmpData()) {
      const std::string key = datum.key();
      if (key == "Xmp.video.GPSCoordinates" && !record.HasGps()) {
        if (auto location = metadata::ParseIso6709(datum.toString())) {
          record.gps_latitude_  = std::get<0>(*location);
          record.gps_longitude_ = std::get<1>(*location);
          record.gps_altitude_  = std::get<2>(*location);
        }
      } else if ((key == "Xmp.video.DateUTC" || key == "Xmp.xmp.CreateDate") &&
                 !record.date_taken_) {
        record.date_taken_ = metadata::NormalizeDateTime(datum.toString());
      }
    }
    record.keywords_ = metadata::JoinKeywords(ReadKeywords(*image));
  } catch (const Exiv2::Error& e) {
    spdlog::debug("No container metadata for {}: {}", path.string(), e.what());
  }
}

void ExivMetadataExtractor::FillDateFromFile(const std::filesystem::path& path,
                                             MetadataRecord&              record) {
  if (record.date_taken_) {
    return;
  }
  std::error_code ec;
  auto            mtime = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return;
  }
  auto sys_time      = std::chrono::file_clock::to_sys(mtime);
  record.date_taken_ = TimeProvider::FormatLocal(
      std::chrono::time_point_cast<std::chrono::system_clock::duration>(sys_time),
      "%Y-%m-%dT%H:%M:%S");
}
};  // namespace momento
