#include "utils/geo/geohash.hpp"

#include <gtest/gtest.h>

namespace momento {
TEST(GeohashTest, KnownCities) {
  EXPECT_EQ(geohash::Encode(40.7128, -74.0060).substr(0, 4), "dr5r");
  EXPECT_EQ(geohash::Encode(51.5074, -0.1278).substr(0, 4), "gcpv");
  EXPECT_EQ(geohash::Encode(35.6762, 139.6503).substr(0, 3), "xn7");
}

TEST(GeohashTest, DefaultPrecisionAndExplicitPrecision) {
  EXPECT_EQ(geohash::Encode(48.8566, 2.3522).size(),
            static_cast<size_t>(geohash::kDefaultPrecision));
  EXPECT_EQ(geohash::Encode(48.8566, 2.3522, 12).size(), 12u);
}

TEST(GeohashTest, PrefixIsStableAcrossPrecisions) {
  auto coarse = geohash::Encode(-33.8688, 151.2093, 5);
  auto fine   = geohash::Encode(-33.8688, 151.2093, 9);
  EXPECT_EQ(fine.substr(0, 5), coarse);
}

TEST(GeohashTest, OriginCell) { EXPECT_EQ(geohash::Encode(0.0, 0.0, 1), "s"); }
};  // namespace momento
