#include "media/media_metadata.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

namespace momento {
TEST(MediaMetadataTest, ExposureTimeFormatting) {
  EXPECT_EQ(metadata::FormatExposureTime(0.004), "1/250");
  EXPECT_EQ(metadata::FormatExposureTime(1.0 / 60.0), "1/60");
  EXPECT_EQ(metadata::FormatExposureTime(2.0), "2");
  EXPECT_FALSE(metadata::FormatExposureTime(0.0).has_value());
  EXPECT_FALSE(metadata::FormatExposureTime(-1.0).has_value());
}

TEST(MediaMetadataTest, DateNormalization) {
  EXPECT_EQ(metadata::NormalizeDateTime("2023:07:14 18:32:05"), "2023-07-14T18:32:05");
  EXPECT_EQ(metadata::NormalizeDateTime("2023-07-14T18:32:05"), "2023-07-14T18:32:05");
  EXPECT_EQ(metadata::NormalizeDateTime("  2023-07-14 18:32:05 "), "2023-07-14T18:32:05");
  EXPECT_FALSE(metadata::NormalizeDateTime("").has_value());
  EXPECT_FALSE(metadata::NormalizeDateTime("not a date").has_value());
}

TEST(MediaMetadataTest, Iso6709Location) {
  auto parsed = metadata::ParseIso6709("+40.7128-074.0060+010.000/");
  ASSERT_TRUE(parsed.has_value());
  auto [lat, lon, alt] = *parsed;
  EXPECT_NEAR(lat, 40.7128, 1e-9);
  EXPECT_NEAR(lon, -74.006, 1e-9);
  ASSERT_TRUE(alt.has_value());
  EXPECT_NEAR(*alt, 10.0, 1e-9);

  auto no_alt = metadata::ParseIso6709("-33.8688+151.2093/");
  ASSERT_TRUE(no_alt.has_value());
  EXPECT_FALSE(std::get<2>(*no_alt).has_value());

  EXPECT_FALSE(metadata::ParseIso6709("+95.0000+010.0000/").has_value());
  EXPECT_FALSE(metadata::ParseIso6709("garbage").has_value());
}

TEST(MediaMetadataTest, OutOfRangeGpsIsDiscardedWithItsDependents) {
  MetadataRecord record;
  record.gps_latitude_  = 123.0;
  record.gps_longitude_ = 10.0;
  record.gps_altitude_  = 50.0;
  record.geohash_       = "u0";
  record.camera_make_   = "Canon";
  record.SanitizeGps();
  EXPECT_FALSE(record.HasGps());
  EXPECT_FALSE(record.gps_altitude_.has_value());
  EXPECT_FALSE(record.geohash_.has_value());
  EXPECT_EQ(record.camera_make_, "Canon");
}

TEST(MediaMetadataTest, HalfPresentOrNonFiniteGpsIsDiscarded) {
  MetadataRecord half;
  half.gps_latitude_ = 10.0;
  half.SanitizeGps();
  EXPECT_FALSE(half.gps_latitude_.has_value());

  MetadataRecord nan;
  nan.gps_latitude_  = std::numeric_limits<double>::quiet_NaN();
  nan.gps_longitude_ = 10.0;
  nan.SanitizeGps();
  EXPECT_FALSE(nan.HasGps());

  MetadataRecord edge;
  edge.gps_latitude_  = -90.0;
  edge.gps_longitude_ = 180.0;
  edge.SanitizeGps();
  EXPECT_TRUE(edge.HasGps());
}

TEST(MediaMetadataTest, MergeKeepsExistingExceptGps) {
  MetadataRecord existing;
  existing.camera_make_   = "Nikon";
  existing.date_taken_    = "2020-01-01T00:00:00";
  existing.gps_latitude_  = 1.0;
  existing.gps_longitude_ = 2.0;

  MetadataRecord fresh;
  fresh.camera_make_      = "Canon";
  fresh.camera_model_     = "EOS R5";
  fresh.date_taken_       = "2021-01-01T00:00:00";
  fresh.gps_latitude_     = 48.8566;
  fresh.gps_longitude_    = 2.3522;

  auto merged             = existing.MergedWith(fresh);
  EXPECT_EQ(merged.camera_make_, "Nikon");
  EXPECT_EQ(merged.camera_model_, "EOS R5");
  EXPECT_EQ(merged.date_taken_, "2020-01-01T00:00:00");
  EXPECT_DOUBLE_EQ(*merged.gps_latitude_, 48.8566);
  EXPECT_DOUBLE_EQ(*merged.gps_longitude_, 2.3522);
}

TEST(MediaMetadataTest, MergeWithEmptyRecordIsIdentity) {
  MetadataRecord existing;
  existing.width_  = 4000;
  existing.height_ = 3000;
  existing.iso_    = 100;
  EXPECT_EQ(existing.MergedWith(MetadataRecord{}), existing);
}

TEST(MediaMetadataTest, GeocodingNeededOnlyWithGpsAndMissingPlace) {
  MetadataRecord record;
  EXPECT_FALSE(record.NeedsGeocoding());
  record.gps_latitude_  = 35.6762;
  record.gps_longitude_ = 139.6503;
  EXPECT_TRUE(record.NeedsGeocoding());
  record.location_state_   = "Tokyo";
  record.location_country_ = "Japan";
  EXPECT_FALSE(record.NeedsGeocoding());
}

TEST(MediaMetadataTest, KeywordsAreTrimmedAndDeduplicated) {
  auto joined = metadata::JoinKeywords({" beach ", "sunset", "beach", "", "a,b"});
  ASSERT_TRUE(joined.has_value());
  EXPECT_EQ(*joined, "beach,sunset,a b");
  EXPECT_FALSE(metadata::JoinKeywords({"  ", ""}).has_value());

  MetadataRecord record;
  record.keywords_ = "family, trip ,family,,";
  auto keywords    = record.KeywordList();
  ASSERT_EQ(keywords.size(), 2u);
  EXPECT_EQ(keywords[0], "family");
  EXPECT_EQ(keywords[1], "trip");
}

TEST(MediaMetadataTest, JsonUsesNullForAbsentFields) {
  MetadataRecord record;
  record.iso_ = 400;
  auto j      = record.ToJson();
  EXPECT_EQ(j["iso"], 400);
  EXPECT_TRUE(j["cameraMake"].is_null());
  EXPECT_TRUE(j.contains("focalLength35mm"));
}
};  // namespace momento
