#include "media/metadata_extractor.hpp"

#include <gtest/gtest.h>

#include <exiv2/exiv2.hpp>
#include <filesystem>
#include <fstream>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace momento {
class MetadataExtractorTests : public ::testing::Test {
 protected:
  std::filesystem::path dir_;

  void                  SetUp() override {
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::Level::mute);
    dir_ = std::filesystem::temp_directory_path() / "momento_metadata_extractor_test";
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  auto WriteImage(const std::string& name, int width, int height) -> std::filesystem::path {
    auto    path = dir_ / name;
    cv::Mat image(height, width, CV_8UC3, cv::Scalar(40, 120, 200));
    cv::imwrite(path.string(), image);
    return path;
  }
};

TEST_F(MetadataExtractorTests, PlainImageYieldsDimensionsAndFileDate) {
  auto                  path = WriteImage("plain.png", 64, 48);
  ExivMetadataExtractor extractor;
  auto                  record = extractor.Extract(path, MediaKind::IMAGE);
  EXPECT_EQ(record.width_, 64);
  EXPECT_EQ(record.height_, 48);
  EXPECT_TRUE(record.date_taken_.has_value());
  EXPECT_FALSE(record.HasGps());
  EXPECT_FALSE(record.camera_make_.has_value());
}

TEST_F(MetadataExtractorTests, ExifFieldsAreRead) {
  auto path = WriteImage("tagged.jpg", 80, 60);
  {
    auto image = Exiv2::ImageFactory::open(path.string());
    image->readMetadata();
    Exiv2::ExifData& exif                      = image->exifData();
    exif["Exif.Image.Make"]                    = "Canon";
    exif["Exif.Image.Model"]                   = "EOS R5";
    exif["Exif.Photo.DateTimeOriginal"]        = "2023:07:14 18:32:05";
    exif["Exif.Photo.ExposureTime"]            = "1/250";
    exif["Exif.Photo.FNumber"]                 = "28/10";
    exif["Exif.Photo.ISOSpeedRatings"]         = uint16_t(400);
    exif["Exif.GPSInfo.GPSLatitudeRef"]        = "N";
    exif["Exif.GPSInfo.GPSLatitude"]           = "40/1 42/1 46/1";
    exif["Exif.GPSInfo.GPSLongitudeRef"]       = "W";
    exif["Exif.GPSInfo.GPSLongitude"]          = "74/1 0/1 22/1";
    image->writeMetadata();
  }

  ExivMetadataExtractor extractor;
  auto                  record = extractor.Extract(path, MediaKind::IMAGE);
  EXPECT_EQ(record.width_, 80);
  EXPECT_EQ(record.height_, 60);
  EXPECT_EQ(record.camera_make_, "Canon");
  EXPECT_EQ(record.camera_model_, "EOS R5");
  EXPECT_EQ(record.date_taken_, "2023-07-14T18:32:05");
  EXPECT_EQ(record.exposure_time_, "1/250");
  ASSERT_TRUE(record.f_number_.has_value());
  EXPECT_NEAR(*record.f_number_, 2.8, 1e-9);
  EXPECT_EQ(record.iso_, 400);
  ASSERT_TRUE(record.HasGps());
  EXPECT_NEAR(*record.gps_latitude_, 40.7128, 1e-3);
  EXPECT_NEAR(*record.gps_longitude_, -74.0061, 1e-3);
}

TEST_F(MetadataExtractorTests, UnreadableFileDegradesToPartialRecord) {
  auto path = dir_ / "broken.jpg";
  {
    std::ofstream out(path, std::ios::binary);
    out << "definitely not a jpeg";
  }
  ExivMetadataExtractor extractor;
  MetadataRecord        record;
  EXPECT_NO_THROW(record = extractor.Extract(path, MediaKind::IMAGE));
  EXPECT_FALSE(record.HasDimensions());
  EXPECT_TRUE(record.date_taken_.has_value());
}

TEST_F(MetadataExtractorTests, MissingFileYieldsEmptyRecord) {
  ExivMetadataExtractor extractor;
  MetadataRecord        record;
  EXPECT_NO_THROW(record = extractor.Extract(dir_ / "gone.jpg", MediaKind::IMAGE));
  EXPECT_EQ(record, MetadataRecord{});
}
};  // namespace momento
