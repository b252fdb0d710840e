#include "media/reverse_geocoder.hpp"

#include <gtest/gtest.h>

namespace momento {
TEST(ReverseGeocoderTest, CityFallsBackToTownAndVillage) {
  auto body     = nlohmann::json::parse(R"({
    "address": {"village": "Hallstatt", "state": "Upper Austria", "country": "Austria"}
  })");
  auto location = NominatimGeocoder::ParseResponse(body);
  ASSERT_TRUE(location.has_value());
  EXPECT_EQ(location->city_, "Hallstatt");
  EXPECT_EQ(location->state_, "Upper Austria");
  EXPECT_EQ(location->country_, "Austria");
}

TEST(ReverseGeocoderTest, CityPreferredOverTown) {
  auto body     = nlohmann::json::parse(R"({
    "address": {"city": "New York", "town": "Manhattan", "state": "New York",
                "country": "United States"}
  })");
  auto location = NominatimGeocoder::ParseResponse(body);
  ASSERT_TRUE(location.has_value());
  EXPECT_EQ(location->city_, "New York");
}

TEST(ReverseGeocoderTest, PartialAddressKeepsWhatIsPresent) {
  auto body     = nlohmann::json::parse(R"({"address": {"country": "Antarctica"}})");
  auto location = NominatimGeocoder::ParseResponse(body);
  ASSERT_TRUE(location.has_value());
  EXPECT_FALSE(location->city_.has_value());
  EXPECT_FALSE(location->state_.has_value());
  EXPECT_EQ(location->country_, "Antarctica");
}

TEST(ReverseGeocoderTest, ErrorBodiesYieldNothing) {
  EXPECT_FALSE(
      NominatimGeocoder::ParseResponse(nlohmann::json::parse(R"({"error": "Unable to geocode"})"))
          .has_value());
  EXPECT_FALSE(
      NominatimGeocoder::ParseResponse(nlohmann::json::parse(R"({"address": {}})")).has_value());
  EXPECT_FALSE(
      NominatimGeocoder::ParseResponse(nlohmann::json::parse(R"({"address": "nope"})"))
          .has_value());
}
};  // namespace momento
